#pragma once
/**
 * @file packets.hpp
 * @brief Device-bound and host-bound packet envelopes.
 *
 * @details
 * WIRE LAYOUT
 * -----------
 *   device-bound:  C9 36 B8 47 | ID | VarU16(k) | payload(k)
 *   host-bound:    AA 55       | ID | VarU16(k) | payload(k)
 *
 * Both envelopes are templates over a payload type P (anything encode_into /
 * decode_from accept) and the one-byte command ID, so a packet's identity is
 * part of its type.
 *
 * DESIGN NOTES
 * ------------
 * - DeviceBoundPacket encodes the payload once into a scratch buffer and
 *   takes the length prefix from that buffer.
 * - HostBoundPacket decodes the payload from a sub-reader limited to k bytes,
 *   so a payload decoder can never eat into the next frame.
 * - Host-bound encode and device-bound decode exist for mock devices in tests.
 */

#include "v5link/bytes.hpp"
#include "v5link/decode.hpp"
#include "v5link/encode.hpp"
#include "v5link/wire.hpp"

#include <array>
#include <cstdint>
#include <utility>

namespace v5link {

constexpr std::array<uint8_t, 4> DEVICE_BOUND_HEADER{{0xC9, 0x36, 0xB8, 0x47}};
constexpr std::array<uint8_t, 2> HOST_BOUND_HEADER{{0xAA, 0x55}};

namespace detail {

/// Payload bytes plus their VarU16 length, validated together.
inline EncodeError length_prefix(const Bytes& body, VarU16& size) {
  if (body.size() > VarU16::MAX) return EncodeError::VarShortTooLarge;
  return VarU16::make(static_cast<uint16_t>(body.size()), size);
}

template <std::size_t N>
inline DecodeError expect_header(ByteReader& in, const std::array<uint8_t, N>& magic) {
  for (std::size_t i = 0; i < N; ++i) {
    uint8_t b = 0;
    if (!in.read_u8(b)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    if (b != magic[i]) return DecodeError::make(DecodeErrorKind::InvalidHeader, b);
  }
  return DecodeError::none();
}

template <std::size_t N, typename P>
inline EncodeError encode_envelope(const std::array<uint8_t, N>& magic, uint8_t id,
                                   const P& payload, Bytes& out) {
  Bytes body;
  if (auto e = encode_into(payload, body); e != EncodeError::None) return e;
  VarU16 size;
  if (auto e = length_prefix(body, size); e != EncodeError::None) return e;

  out.insert(out.end(), magic.begin(), magic.end());
  out.push_back(id);
  if (auto e = size.encode(out); e != EncodeError::None) return e;
  out.insert(out.end(), body.begin(), body.end());
  return EncodeError::None;
}

template <std::size_t N, typename P>
inline DecodeError decode_envelope(const std::array<uint8_t, N>& magic, uint8_t id,
                                   ByteReader& in, P& payload) {
  if (auto e = expect_header(in, magic); !e.ok()) return e;

  uint8_t got = 0;
  if (!in.read_u8(got)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
  if (got != id) return DecodeError::make(DecodeErrorKind::UnexpectedId, got);

  VarU16 size;
  if (auto e = VarU16::decode(in, size); !e.ok()) return e;

  ByteReader body;
  if (!in.take(size.value(), body)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
  return decode_from(body, payload);
}

} // namespace detail

/**
 * @brief Packet sent from host to device.
 */
template <typename P, uint8_t ID>
struct DeviceBoundPacket {
  static constexpr uint8_t id = ID;

  P payload{};

  DeviceBoundPacket() = default;
  explicit DeviceBoundPacket(P p) : payload(std::move(p)) {}

  EncodeError encode(Bytes& out) const {
    return detail::encode_envelope(DEVICE_BOUND_HEADER, ID, payload, out);
  }

  static DecodeError decode(ByteReader& in, DeviceBoundPacket& out) {
    return detail::decode_envelope(DEVICE_BOUND_HEADER, ID, in, out.payload);
  }
};

/**
 * @brief Packet sent from device to host.
 *
 * Header mismatch is InvalidHeader (InvalidMagic at the connection layer),
 * wrong ID is UnexpectedId with the received ID in detail.
 */
template <typename P, uint8_t ID>
struct HostBoundPacket {
  static constexpr uint8_t id = ID;

  P payload{};

  HostBoundPacket() = default;
  explicit HostBoundPacket(P p) : payload(std::move(p)) {}

  EncodeError encode(Bytes& out) const {
    return detail::encode_envelope(HOST_BOUND_HEADER, ID, payload, out);
  }

  static DecodeError decode(ByteReader& in, HostBoundPacket& out) {
    return detail::decode_envelope(HOST_BOUND_HEADER, ID, in, out.payload);
  }
};

} // namespace v5link
