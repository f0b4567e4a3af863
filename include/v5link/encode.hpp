#pragma once
/**
 * @file encode.hpp
 * @brief Encode contract: how a value becomes bytes on the V5 wire.
 *
 * @details
 * CONTRACT
 * --------
 * A type is encodable when it has a member
 *
 *   EncodeError encode(Bytes& out) const;
 *
 * which APPENDS its wire form to @p out and returns EncodeError::None on
 * success. Construction-time validation (string bounds, VarU16 range) should
 * make encode failures rare, but encode still reports them instead of
 * truncating.
 *
 * Call sites never invoke the member directly; they go through the free
 * function encode_into(), which also has overloads for the trivial types:
 *   - Unit  : encodes to nothing (commands with an empty payload)
 *   - Bytes : identity
 *   - uint8_t / uint16_t / uint32_t : raw little-endian fields
 *
 * into_encoded() is the "give me the final bytes" conversion. It clears the
 * destination first.
 *
 * EXAMPLE
 * -------
 * @code
 *   v5link::Bytes out;
 *   auto pkt = v5link::DeviceBoundPacket<v5link::Unit, 0xA4>{};
 *   if (v5link::into_encoded(pkt, out) != v5link::EncodeError::None) { ... }
 * @endcode
 */

#include "v5link/bytes.hpp"

#include <cstdint>
#include <utility>

namespace v5link {

enum class EncodeError : uint8_t {
  None             = 0,
  StringTooLong    = 1,
  VarShortTooLarge = 2,
  EmbeddedNul      = 3,  // text would end early at the NUL on the wire
};

inline const char* to_string(EncodeError e) {
  switch (e) {
    case EncodeError::None:             return "none";
    case EncodeError::StringTooLong:    return "string_too_long";
    case EncodeError::VarShortTooLarge: return "var_short_too_large";
    case EncodeError::EmbeddedNul:      return "embedded_nul";
  }
  return "unknown";
}

/// The empty payload.
struct Unit {
  bool operator==(const Unit&) const { return true; }
  bool operator!=(const Unit&) const { return false; }
};

// -------- trivial encoders --------

inline EncodeError encode_into(const Unit&, Bytes&) { return EncodeError::None; }

inline EncodeError encode_into(const Bytes& v, Bytes& out) {
  out.insert(out.end(), v.begin(), v.end());
  return EncodeError::None;
}

inline EncodeError encode_into(uint8_t v, Bytes& out) {
  out.push_back(v);
  return EncodeError::None;
}

inline EncodeError encode_into(uint16_t v, Bytes& out) {
  append_u16_le(out, v);
  return EncodeError::None;
}

inline EncodeError encode_into(uint32_t v, Bytes& out) {
  append_u32_le(out, v);
  return EncodeError::None;
}

/// Any type with a member encode(Bytes&) const.
template <typename T>
auto encode_into(const T& v, Bytes& out) -> decltype(v.encode(out)) {
  return v.encode(out);
}

/**
 * @brief Convert a value into its final byte sequence.
 *
 * @p out is cleared first. On failure its contents are cleared as well so a
 * half-written frame can never be sent by mistake.
 */
template <typename T>
EncodeError into_encoded(T&& v, Bytes& out) {
  out.clear();
  const EncodeError e = encode_into(std::forward<T>(v), out);
  if (e != EncodeError::None) out.clear();
  return e;
}

} // namespace v5link
