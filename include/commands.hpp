/**
 * @page v5-commands V5 Commands Layer
 * @file commands.hpp
 * @brief Typed commands: the host's control window into a V5 Brain or Controller.
 * @details
 * PURPOSE
 * -------
 * Each command is a small value object that knows which packet to send, which
 * reply to expect and how to turn the reply into its Output. The Connection
 * runs them through execute_command():
 *
 * @code
 *   v5link::KeyValueLoad cmd;
 *   cmd.key = "teamnumber";
 *   std::string team;
 *   auto e = conn.execute_command(cmd, team);
 * @endcode
 *
 * COMMANDS
 * --------
 * | command          | packet                         | Output        |
 * |------------------|--------------------------------|---------------|
 * | GetSystemVersion | 0xA4, empty payload            | SystemVersion |
 * | KeyValueLoad     | CDC2 0x2E, key                 | std::string   |
 * | KeyValueSave     | CDC2 0x2F, key + value         | Unit          |
 * | EraseFile        | CDC2 0x1B, vendor + file name  | Unit          |
 * | LoadFileAction   | CDC2 0x18, run/stop a program  | Unit          |
 *
 * Every command retries through packet_handshake() with its own timeout and
 * attempt budget (CommandOptions, 1000 ms x 5 by default). Argument
 * validation (key longer than 31 bytes, file name longer than 23) is reported
 * as Encode before anything touches the wire.
 *
 * RELATIONSHIP TO OTHER FILES
 * ---------------------------
 * - v5link/packets.hpp, v5link/cdc2.hpp: the envelopes used here.
 * - command_dispatch.hpp: maps CLI verbs onto these commands.
 * - device_registry.hpp: probes ports with GetSystemVersion.
 */
#pragma once

#include "v5link/cdc2.hpp"
#include "v5link/connection.hpp"
#include "v5link/packets.hpp"
#include "v5link/wire.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace v5link {

// ============================================================================
// Identifiers
// ============================================================================

constexpr uint8_t CMD_GET_SYSTEM_VERSION = 0xA4;

constexpr uint8_t EXT_FILE_LOAD_ACTION = 0x18;
constexpr uint8_t EXT_FILE_ERASE       = 0x1B;
constexpr uint8_t EXT_KV_LOAD          = 0x2E;
constexpr uint8_t EXT_KV_SAVE          = 0x2F;

enum class ProductType : uint8_t { Brain = 0x10, Controller = 0x11 };

/// "brain" | "controller" | "unknown"
const char* product_name(uint8_t product_type);
bool        is_known_product(uint8_t product_type);

/// Storage area a file lives in. User programs are in User.
enum class FileVendor : uint8_t {
  User      = 1,
  Sys       = 15,
  Dev1      = 16,
  Dev2      = 24,
  Dev3      = 32,
  Dev4      = 40,
  Dev5      = 48,
  Dev6      = 56,
  VexVm     = 64,
  Vex       = 240,
  Undefined = 241,
};

enum class FileLoadAction : uint8_t { Run = 0x00, Stop = 0x80 };

// ============================================================================
// Payloads
// ============================================================================

struct SystemVersion {
  Version version{};
  uint8_t product_type{0};
  uint8_t flags{0};

  EncodeError encode(Bytes& out) const;
  static DecodeError decode(ByteReader& in, SystemVersion& out);
};

using KvKey   = VarLengthString<31>;
using KvValue = VarLengthString<255>;

struct KeyValueSavePayload {
  KvKey   key;
  KvValue value;

  EncodeError encode(Bytes& out) const;
  static DecodeError decode(ByteReader& in, KeyValueSavePayload& out);
};

struct EraseFilePayload {
  uint8_t                         vendor{static_cast<uint8_t>(FileVendor::User)};
  uint8_t                         option{0};
  TerminatedFixedLengthString<23> file_name;

  EncodeError encode(Bytes& out) const;
  static DecodeError decode(ByteReader& in, EraseFilePayload& out);
};

struct LoadFileActionPayload {
  uint8_t    vendor{static_cast<uint8_t>(FileVendor::User)};
  uint8_t    action{static_cast<uint8_t>(FileLoadAction::Run)};
  FileName23 file_name;

  EncodeError encode(Bytes& out) const;
  static DecodeError decode(ByteReader& in, LoadFileActionPayload& out);
};

// ============================================================================
// Packets
// ============================================================================

using GetSystemVersionPacket      = DeviceBoundPacket<Unit, CMD_GET_SYSTEM_VERSION>;
using GetSystemVersionReplyPacket = HostBoundPacket<SystemVersion, CMD_GET_SYSTEM_VERSION>;

using KeyValueLoadPacket      = Cdc2CommandPacket<EXT_KV_LOAD, KvKey>;
using KeyValueLoadReplyPacket = Cdc2ReplyPacket<EXT_KV_LOAD, KvValue>;

using KeyValueSavePacket      = Cdc2CommandPacket<EXT_KV_SAVE, KeyValueSavePayload>;
using KeyValueSaveReplyPacket = Cdc2ReplyPacket<EXT_KV_SAVE, Unit>;

using EraseFilePacket      = Cdc2CommandPacket<EXT_FILE_ERASE, EraseFilePayload>;
using EraseFileReplyPacket = Cdc2ReplyPacket<EXT_FILE_ERASE, Unit>;

using LoadFileActionPacket      = Cdc2CommandPacket<EXT_FILE_LOAD_ACTION, LoadFileActionPayload>;
using LoadFileActionReplyPacket = Cdc2ReplyPacket<EXT_FILE_LOAD_ACTION, Unit>;

// ============================================================================
// Commands
// ============================================================================

struct CommandOptions {
  std::chrono::milliseconds timeout{1000};
  std::size_t               retries{5};
};

struct GetSystemVersion {
  using Output = SystemVersion;
  CommandOptions opts;

  ConnectionError execute(Connection& conn, Output& out) const;
};

struct KeyValueLoad {
  using Output = std::string;
  std::string    key;
  CommandOptions opts;

  ConnectionError execute(Connection& conn, Output& out) const;
};

struct KeyValueSave {
  using Output = Unit;
  std::string    key;
  std::string    value;
  CommandOptions opts;

  ConnectionError execute(Connection& conn, Output& out) const;
};

struct EraseFile {
  using Output = Unit;
  std::string    file_name;
  FileVendor     vendor{FileVendor::User};
  CommandOptions opts;

  ConnectionError execute(Connection& conn, Output& out) const;
};

struct LoadFileAction {
  using Output = Unit;
  std::string    file_name;
  FileVendor     vendor{FileVendor::User};
  FileLoadAction action{FileLoadAction::Run};
  CommandOptions opts;

  ConnectionError execute(Connection& conn, Output& out) const;
};

} // namespace v5link
