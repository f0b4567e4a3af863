#pragma once
/**
 * @page v5-device-registry V5 Device Registry
 * @file device_registry.hpp
 * @brief Discovery and identification of V5 devices connected over USB.
 *
 * @details
 * PURPOSE
 * -------
 * Finds the serial ports V5 devices enumerate as, probes each one with
 * GetSystemVersion, and records what answered. The CLI uses this for --scan
 * and to pick a device when --dev is not given.
 *
 * WHAT THIS DOES
 * --------------
 * - Scans `/dev/serial/by-id` for VEX devices. A Brain shows up twice:
 *     ...VEX_Robotics_V5_Brain_-_<serial>-if00   system port (commands)
 *     ...VEX_Robotics_V5_Brain_-_<serial>-if02   user port (program stdio)
 *   and a Controller once (-if00 only). Ports are paired by their common
 *   prefix.
 * - Falls back to `/dev/ttyACM*` when `/dev/serial/by-id` is absent. Every
 *   port is then a system candidate with no user port.
 * - Probes each system port. A reply with an unknown product type is
 *   InvalidDevice and the port is recorded offline.
 * - Saves the result as a JSON array (nlohmann/json) for scripts to read.
 *
 * RELIABILITY AND TRADE-OFFS
 * --------------------------
 * - No libudev dependency: filesystem inspection and globbing only.
 * - A probe costs up to one handshake timeout per port, with a single attempt.
 * - The registry file is a snapshot for humans and scripts; nothing in the
 *   library reads it back.
 *
 * EXAMPLE
 * -------
 * @code
 *   v5link::LinkConfig cfg;
 *   auto devices = v5link::discover_devices(cfg);
 *   std::string err;
 *   if (!v5link::save_registry(devices, v5link::default_registry_path(), err)) {
 *       std::cerr << "status=error reason=" << err << "\n";
 *   }
 * @endcode
 */

#include "commands.hpp"
#include "v5link/config.hpp"
#include "v5link/connection.hpp"

#include <string>
#include <vector>

namespace v5link {

/// A system port and, for Brains, its paired user port.
struct PortPair {
  std::string system_path;
  std::string user_path;   // empty when the device has no user port
};

/**
 * @struct DeviceInfo
 * @brief One discovered device.
 */
struct DeviceInfo {
  std::string system_path;
  std::string user_path;
  std::string product;     ///< "brain" | "controller" | "" when offline
  std::string version;     ///< "major.minor.build.bBETA" when online
  bool        online{false};
};

/**
 * @brief Pair by-id entry names into system/user ports.
 *
 * Only names containing "VEX" are considered. Names ending in -if00 are
 * system ports, -if02 the user port of the same device. Results are sorted by
 * system path. A lone -if02 is ignored.
 *
 * @param dir   directory the names live in, prefixed to every path.
 * @param names bare entry names (no directory).
 */
std::vector<PortPair> pair_by_id_names(const std::string& dir, const std::vector<std::string>& names);

/// Candidate ports on this host: by-id pairs, or /dev/ttyACM* as a fallback.
std::vector<PortPair> list_candidate_ports();

/**
 * @brief Ask an open connection what it is.
 *
 * Fills product/version/online on success. An unknown product type is
 * InvalidDevice and leaves @p info offline.
 */
ConnectionError identify_device(Connection& conn, DeviceInfo& info, const CommandOptions& opts = {});

/// Open and probe every candidate port with @p cfg's serial settings.
std::vector<DeviceInfo> discover_devices(const LinkConfig& cfg);

/// JSON array text, pretty-printed with two-space indent.
std::string registry_json(const std::vector<DeviceInfo>& devices);

/// $XDG_CONFIG_HOME/v5link/devices.json, else $HOME/.config/v5link/devices.json.
std::string default_registry_path();

/// Write registry_json() to @p path, creating parent directories.
bool save_registry(const std::vector<DeviceInfo>& devices, const std::string& path, std::string& err);

} // namespace v5link
