#pragma once
/**
 * @file decode.hpp
 * @brief Decode contract: how bytes from the device become typed values.
 *
 * @details
 * A type is decodable when it has a static member
 *
 *   static DecodeError decode(ByteReader& in, T& out);
 *
 * Decoding NEVER reads out of bounds. Truncated input yields UnexpectedEnd,
 * garbage yields one of the other kinds. Callers go through decode_from(),
 * which also covers Unit, Bytes (rest of the window) and integer fields.
 */

#include "v5link/bytes.hpp"
#include "v5link/encode.hpp"

#include <cstdint>

namespace v5link {

enum class DecodeErrorKind : uint8_t {
  None             = 0,
  UnexpectedEnd    = 1,
  InvalidHeader    = 2,
  UnexpectedId     = 3,
  InvalidValue     = 4,
  ChecksumMismatch = 5,
  Nack             = 6,  // device answered with a negative acknowledgement
};

inline const char* to_string(DecodeErrorKind k) {
  switch (k) {
    case DecodeErrorKind::None:             return "none";
    case DecodeErrorKind::UnexpectedEnd:    return "unexpected_end";
    case DecodeErrorKind::InvalidHeader:    return "invalid_header";
    case DecodeErrorKind::UnexpectedId:     return "unexpected_id";
    case DecodeErrorKind::InvalidValue:     return "invalid_value";
    case DecodeErrorKind::ChecksumMismatch: return "checksum_mismatch";
    case DecodeErrorKind::Nack:             return "nack";
  }
  return "unknown";
}

/**
 * @brief Decode outcome.
 *
 * detail carries the offending byte where one exists: the received ID for
 * UnexpectedId, the ack code for Nack.
 */
struct DecodeError {
  DecodeErrorKind kind{DecodeErrorKind::None};
  uint8_t         detail{0};

  bool ok() const { return kind == DecodeErrorKind::None; }

  static DecodeError none() { return {}; }
  static DecodeError make(DecodeErrorKind k, uint8_t d = 0) { return DecodeError{k, d}; }

  bool operator==(const DecodeError& o) const { return kind == o.kind && detail == o.detail; }
  bool operator!=(const DecodeError& o) const { return !(*this == o); }
};

// -------- trivial decoders --------

inline DecodeError decode_from(ByteReader&, Unit&) { return DecodeError::none(); }

/// Bytes swallow the remainder of the window.
inline DecodeError decode_from(ByteReader& in, Bytes& out) {
  out.assign(in.cursor(), in.cursor() + in.remaining());
  in.skip(in.remaining());
  return DecodeError::none();
}

inline DecodeError decode_from(ByteReader& in, uint8_t& out) {
  return in.read_u8(out) ? DecodeError::none() : DecodeError::make(DecodeErrorKind::UnexpectedEnd);
}

inline DecodeError decode_from(ByteReader& in, uint16_t& out) {
  return in.read_u16_le(out) ? DecodeError::none() : DecodeError::make(DecodeErrorKind::UnexpectedEnd);
}

inline DecodeError decode_from(ByteReader& in, uint32_t& out) {
  return in.read_u32_le(out) ? DecodeError::none() : DecodeError::make(DecodeErrorKind::UnexpectedEnd);
}

/// Any type with a static decode(ByteReader&, T&).
template <typename T>
auto decode_from(ByteReader& in, T& out) -> decltype(T::decode(in, out)) {
  return T::decode(in, out);
}

/// Decode a complete buffer.
template <typename T>
DecodeError decode_bytes(const Bytes& data, T& out) {
  ByteReader in(data);
  return decode_from(in, out);
}

} // namespace v5link
