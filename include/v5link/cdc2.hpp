#pragma once
/**
 * @file cdc2.hpp
 * @brief Extended command packets (CDC2): CRC-protected, acknowledged requests.
 *
 * @details
 * Extended commands share command ID 0x56 and carry a second, extended ID.
 *
 *   command:  C9 36 B8 47 | 56 | EXT | VarU16(k) | payload(k) | CRC16 (BE)
 *   reply:    AA 55 | 56 | VarU16(n) | EXT | ACK | payload | CRC16 (BE)
 *
 * The command CRC covers every byte before it. The reply CRC covers the whole
 * frame, so running CRC-16/XMODEM over a valid reply gives 0. In the reply,
 * n counts every byte after the size field.
 *
 * Reply checks run in this order:
 *   1. CRC residual not 0    -> ChecksumMismatch
 *   2. ACK != 0x76           -> Nack, detail = ACK byte
 *   3. EXT mismatch          -> UnexpectedId, detail = received EXT
 */

#include "v5link/bytes.hpp"
#include "v5link/crc.hpp"
#include "v5link/decode.hpp"
#include "v5link/encode.hpp"
#include "v5link/packets.hpp"
#include "v5link/wire.hpp"

#include <cstdint>
#include <utility>

namespace v5link {

constexpr uint8_t USER_CDC = 0x56;

/// Device status byte in every extended reply.
enum class Cdc2Ack : uint8_t {
  Ack                       = 0x76,
  Nack                      = 0xFF,
  NackPacketCrc             = 0xCE,
  NackPacketLength          = 0xD0,
  NackTransferSize          = 0xD1,
  NackProgramCrc            = 0xD2,
  NackProgramFile           = 0xD3,
  NackUninitializedTransfer = 0xD4,
  NackInitialization        = 0xD5,
  NackAlignment             = 0xD6,
  NackAddress               = 0xD7,
  NackIncomplete            = 0xD8,
  NackNoDirectory           = 0xD9,
  NackMaxUserFiles          = 0xDA,
  NackFileAlreadyExists     = 0xDB,
  NackFileStorageFull       = 0xDC,
  Timeout                   = 0x00,
  WriteError                = 0x01,
};

inline const char* to_string(Cdc2Ack a) {
  switch (a) {
    case Cdc2Ack::Ack:                       return "ack";
    case Cdc2Ack::Nack:                      return "nack";
    case Cdc2Ack::NackPacketCrc:             return "nack_packet_crc";
    case Cdc2Ack::NackPacketLength:          return "nack_packet_length";
    case Cdc2Ack::NackTransferSize:          return "nack_transfer_size";
    case Cdc2Ack::NackProgramCrc:            return "nack_program_crc";
    case Cdc2Ack::NackProgramFile:           return "nack_program_file";
    case Cdc2Ack::NackUninitializedTransfer: return "nack_uninitialized_transfer";
    case Cdc2Ack::NackInitialization:        return "nack_initialization";
    case Cdc2Ack::NackAlignment:             return "nack_alignment";
    case Cdc2Ack::NackAddress:               return "nack_address";
    case Cdc2Ack::NackIncomplete:            return "nack_incomplete";
    case Cdc2Ack::NackNoDirectory:           return "nack_no_directory";
    case Cdc2Ack::NackMaxUserFiles:          return "nack_max_user_files";
    case Cdc2Ack::NackFileAlreadyExists:     return "nack_file_already_exists";
    case Cdc2Ack::NackFileStorageFull:       return "nack_file_storage_full";
    case Cdc2Ack::Timeout:                   return "device_timeout";
    case Cdc2Ack::WriteError:                return "device_write_error";
  }
  return "unknown";
}

/// Name of a raw ack byte, "unknown" if the device sent something unlisted.
inline const char* ack_name(uint8_t code) { return to_string(static_cast<Cdc2Ack>(code)); }

/**
 * @brief Extended command sent from host to device.
 */
template <uint8_t EXT, typename P>
struct Cdc2CommandPacket {
  static constexpr uint8_t ext = EXT;

  P payload{};

  Cdc2CommandPacket() = default;
  explicit Cdc2CommandPacket(P p) : payload(std::move(p)) {}

  EncodeError encode(Bytes& out) const {
    Bytes body;
    if (auto e = encode_into(payload, body); e != EncodeError::None) return e;
    VarU16 size;
    if (auto e = detail::length_prefix(body, size); e != EncodeError::None) return e;

    const std::size_t start = out.size();
    out.insert(out.end(), DEVICE_BOUND_HEADER.begin(), DEVICE_BOUND_HEADER.end());
    out.push_back(USER_CDC);
    out.push_back(EXT);
    if (auto e = size.encode(out); e != EncodeError::None) return e;
    out.insert(out.end(), body.begin(), body.end());
    append_u16_be(out, crc16_xmodem(out.data() + start, out.size() - start));
    return EncodeError::None;
  }
};

/**
 * @brief Extended reply sent from device to host.
 *
 * ack is only meaningful for encode (mock devices). decode rejects anything
 * but Ack.
 */
template <uint8_t EXT, typename P>
struct Cdc2ReplyPacket {
  static constexpr uint8_t ext = EXT;

  Cdc2Ack ack{Cdc2Ack::Ack};
  P       payload{};

  Cdc2ReplyPacket() = default;
  explicit Cdc2ReplyPacket(P p, Cdc2Ack a = Cdc2Ack::Ack) : ack(a), payload(std::move(p)) {}

  EncodeError encode(Bytes& out) const {
    Bytes body;
    body.push_back(EXT);
    body.push_back(static_cast<uint8_t>(ack));
    if (auto e = encode_into(payload, body); e != EncodeError::None) return e;

    if (body.size() + 2 > VarU16::MAX) return EncodeError::VarShortTooLarge;
    VarU16 size = VarU16::unchecked(static_cast<uint16_t>(body.size() + 2));

    const std::size_t start = out.size();
    out.insert(out.end(), HOST_BOUND_HEADER.begin(), HOST_BOUND_HEADER.end());
    out.push_back(USER_CDC);
    if (auto e = size.encode(out); e != EncodeError::None) return e;
    out.insert(out.end(), body.begin(), body.end());
    append_u16_be(out, crc16_xmodem(out.data() + start, out.size() - start));
    return EncodeError::None;
  }

  static DecodeError decode(ByteReader& in, Cdc2ReplyPacket& out) {
    const uint8_t* start = in.cursor();
    const std::size_t before = in.remaining();

    if (auto e = detail::expect_header(in, HOST_BOUND_HEADER); !e.ok()) return e;

    uint8_t id = 0;
    if (!in.read_u8(id)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    if (id != USER_CDC) return DecodeError::make(DecodeErrorKind::UnexpectedId, id);

    VarU16 size;
    if (auto e = VarU16::decode(in, size); !e.ok()) return e;

    ByteReader body;
    if (!in.take(size.value(), body)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    if (body.remaining() < 4) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);

    const std::size_t frame_len = before - in.remaining();
    if (crc16_xmodem(start, frame_len) != 0) {
      return DecodeError::make(DecodeErrorKind::ChecksumMismatch);
    }

    uint8_t got_ext = 0, ack = 0;
    body.read_u8(got_ext);
    body.read_u8(ack);
    if (ack != static_cast<uint8_t>(Cdc2Ack::Ack)) {
      return DecodeError::make(DecodeErrorKind::Nack, ack);
    }
    if (got_ext != EXT) return DecodeError::make(DecodeErrorKind::UnexpectedId, got_ext);

    ByteReader payload;
    body.take(body.remaining() - 2, payload);
    out.ack = Cdc2Ack::Ack;
    return decode_from(payload, out.payload);
  }
};

} // namespace v5link
