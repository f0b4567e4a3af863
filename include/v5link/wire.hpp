#pragma once
/**
 * @file wire.hpp
 * @brief V5 wire primitives: VarU16, bounded strings and Version.
 *
 * @details
 * PURPOSE
 * -------
 * These are the leaf value types every packet is built from. Each one checks
 * its own size rule at construction and reports a violation as an
 * EncodeError. Nothing in this file ever truncates user data.
 *
 * TYPES
 * -----
 * - VarU16:
 *     1 byte for 0..127, otherwise 2 bytes: (0x80 | value >> 8), (value & 0xFF).
 *     Maximum 32767. Used for every length prefix on the wire.
 * - VarLengthString<MAX_LEN>:
 *     UTF-8 bytes then one 0x00. At most MAX_LEN bytes of text.
 * - TerminatedFixedLengthString<LEN>:
 *     LEN bytes zero-padded, then one 0x00 (LEN+1 bytes on the wire).
 * - UnterminatedFixedLengthString<LEN>:
 *     LEN bytes zero-padded, no terminator. FileName23 is the one in use.
 * - Version:
 *     four raw bytes: major, minor, build, beta.
 *
 * STORAGE
 * -------
 * Strings are backed by etl::string<N>, so a primitive never allocates and
 * its capacity is the wire bound.
 *
 * EXAMPLE
 * -------
 * @code
 *   v5link::VarLengthString<31> key;
 *   if (v5link::VarLengthString<31>::make("teamnumber", key) != v5link::EncodeError::None) { ... }
 *   v5link::Bytes out;
 *   key.encode(out);   // 't','e','a','m','n','u','m','b','e','r',0x00
 * @endcode
 */

#include "v5link/bytes.hpp"
#include "v5link/decode.hpp"
#include "v5link/encode.hpp"

#include "etl/string.h"

#include <cstddef>
#include <cstdint>
#include <string>

namespace v5link {

// ---------------------------------------------------------------------------
// VarU16
// ---------------------------------------------------------------------------
class VarU16 {
public:
  static constexpr uint16_t MAX = 0x7FFF;

  VarU16() = default;

  /// Checked construction. Values above MAX yield VarShortTooLarge and leave @p out untouched.
  static EncodeError make(uint16_t value, VarU16& out) {
    if (value > MAX) return EncodeError::VarShortTooLarge;
    out.value_ = value;
    return EncodeError::None;
  }

  /// Stores any value. encode() reports out-of-range values.
  static VarU16 unchecked(uint16_t value) {
    VarU16 v;
    v.value_ = value;
    return v;
  }

  uint16_t value() const { return value_; }

  std::size_t encoded_size() const { return value_ > 0x7F ? 2 : 1; }

  EncodeError encode(Bytes& out) const {
    if (value_ > MAX) return EncodeError::VarShortTooLarge;
    if (value_ > 0x7F) {
      out.push_back(static_cast<uint8_t>(0x80 | (value_ >> 8)));
      out.push_back(static_cast<uint8_t>(value_ & 0xFF));
    } else {
      out.push_back(static_cast<uint8_t>(value_));
    }
    return EncodeError::None;
  }

  static DecodeError decode(ByteReader& in, VarU16& out) {
    uint8_t b0 = 0;
    if (!in.read_u8(b0)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    if (b0 & 0x80) {
      uint8_t b1 = 0;
      if (!in.read_u8(b1)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
      out.value_ = static_cast<uint16_t>(((b0 & 0x7F) << 8) | b1);
    } else {
      out.value_ = b0;
    }
    return DecodeError::none();
  }

  bool operator==(const VarU16& o) const { return value_ == o.value_; }
  bool operator!=(const VarU16& o) const { return value_ != o.value_; }

private:
  uint16_t value_{0};
};

// ---------------------------------------------------------------------------
// VarLengthString<MAX_LEN>
// ---------------------------------------------------------------------------
template <std::size_t MAX_LEN>
class VarLengthString {
public:
  static constexpr std::size_t max_len = MAX_LEN;

  VarLengthString() = default;

  static EncodeError make(const std::string& text, VarLengthString& out) {
    if (text.size() > MAX_LEN) return EncodeError::StringTooLong;
    if (text.find('\0') != std::string::npos) return EncodeError::EmbeddedNul;
    out.text_.assign(text.c_str(), text.size());
    return EncodeError::None;
  }

  std::size_t size()  const { return text_.size(); }
  const char* c_str() const { return text_.c_str(); }
  std::string str()   const { return std::string(text_.c_str(), text_.size()); }

  EncodeError encode(Bytes& out) const {
    if (text_.size() > MAX_LEN) return EncodeError::StringTooLong;
    out.insert(out.end(), text_.begin(), text_.end());
    out.push_back(0x00);
    return EncodeError::None;
  }

  /// Reads up to and including the NUL. More than MAX_LEN bytes before it is InvalidValue.
  static DecodeError decode(ByteReader& in, VarLengthString& out) {
    out.text_.clear();
    for (;;) {
      uint8_t b = 0;
      if (!in.read_u8(b)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
      if (b == 0x00) return DecodeError::none();
      if (out.text_.size() >= MAX_LEN) return DecodeError::make(DecodeErrorKind::InvalidValue);
      out.text_.push_back(static_cast<char>(b));
    }
  }

  bool operator==(const VarLengthString& o) const { return text_ == o.text_; }
  bool operator!=(const VarLengthString& o) const { return !(*this == o); }

private:
  etl::string<MAX_LEN> text_;
};

// ---------------------------------------------------------------------------
// Fixed-length strings
// ---------------------------------------------------------------------------
template <std::size_t LEN, bool TERMINATED>
class FixedLengthString {
public:
  static constexpr std::size_t len = LEN;
  static constexpr std::size_t wire_size = TERMINATED ? LEN + 1 : LEN;

  FixedLengthString() = default;

  static EncodeError make(const std::string& text, FixedLengthString& out) {
    if (text.size() > LEN) return EncodeError::StringTooLong;
    if (text.find('\0') != std::string::npos) return EncodeError::EmbeddedNul;
    out.text_.assign(text.c_str(), text.size());
    return EncodeError::None;
  }

  std::size_t size()  const { return text_.size(); }
  const char* c_str() const { return text_.c_str(); }
  std::string str()   const { return std::string(text_.c_str(), text_.size()); }

  EncodeError encode(Bytes& out) const {
    if (text_.size() > LEN) return EncodeError::StringTooLong;
    out.insert(out.end(), text_.begin(), text_.end());
    out.insert(out.end(), LEN - text_.size(), 0x00);
    if (TERMINATED) out.push_back(0x00);
    return EncodeError::None;
  }

  /// Text ends at the first NUL inside the LEN-byte field.
  static DecodeError decode(ByteReader& in, FixedLengthString& out) {
    uint8_t buf[LEN + 1] = {};
    if (!in.read(buf, LEN)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    if (TERMINATED) {
      uint8_t term = 0;
      if (!in.read_u8(term)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
      if (term != 0x00) return DecodeError::make(DecodeErrorKind::InvalidValue, term);
    }
    std::size_t n = 0;
    while (n < LEN && buf[n] != 0x00) ++n;
    out.text_.assign(reinterpret_cast<const char*>(buf), n);
    return DecodeError::none();
  }

  bool operator==(const FixedLengthString& o) const { return text_ == o.text_; }
  bool operator!=(const FixedLengthString& o) const { return !(*this == o); }

private:
  etl::string<LEN> text_;
};

template <std::size_t LEN>
using TerminatedFixedLengthString = FixedLengthString<LEN, true>;

template <std::size_t LEN>
using UnterminatedFixedLengthString = FixedLengthString<LEN, false>;

using FileName23 = UnterminatedFixedLengthString<23>;

// ---------------------------------------------------------------------------
// Version
// ---------------------------------------------------------------------------
struct Version {
  uint8_t major{0};
  uint8_t minor{0};
  uint8_t build{0};
  uint8_t beta{0};

  EncodeError encode(Bytes& out) const {
    out.push_back(major);
    out.push_back(minor);
    out.push_back(build);
    out.push_back(beta);
    return EncodeError::None;
  }

  static DecodeError decode(ByteReader& in, Version& out) {
    uint8_t b[4];
    if (!in.read(b, 4)) return DecodeError::make(DecodeErrorKind::UnexpectedEnd);
    out = Version{b[0], b[1], b[2], b[3]};
    return DecodeError::none();
  }

  /// "major.minor.build.bBETA", e.g. "1.1.3.b0".
  std::string to_string() const {
    return std::to_string(major) + "." + std::to_string(minor) + "." +
           std::to_string(build) + ".b" + std::to_string(beta);
  }

  bool operator==(const Version& o) const {
    return major == o.major && minor == o.minor && build == o.build && beta == o.beta;
  }
  bool operator!=(const Version& o) const { return !(*this == o); }
};

} // namespace v5link
