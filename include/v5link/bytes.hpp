#pragma once
/**
 * @file bytes.hpp
 * @brief Byte buffers and a bounds-checked reader shared by every wire type.
 *
 * @details
 * Encoders append into a caller-owned Bytes vector. Decoders pull from a
 * ByteReader, which never reads past the end of its window: every read
 * returns false instead. That gives the decode layer one simple rule, "a
 * false read is UnexpectedEnd", and keeps truncated input away from UB.
 *
 * Multi-byte integers on the V5 wire are little-endian, except the CRC16
 * trailer of extended packets, which is big-endian.
 */

#include <cstddef>
#include <cstdint>
#include <vector>

namespace v5link {

using Bytes = std::vector<uint8_t>;

/**
 * @brief Read-only cursor over a byte window.
 *
 * Does not own the data. The window must outlive the reader.
 */
class ByteReader {
public:
  ByteReader() = default;
  ByteReader(const uint8_t* data, std::size_t len) : data_(data), len_(len) {}
  explicit ByteReader(const Bytes& b) : data_(b.data()), len_(b.size()) {}

  std::size_t remaining() const { return len_ - pos_; }
  std::size_t position()  const { return pos_; }
  bool        empty()     const { return pos_ >= len_; }

  /// Pointer to the next unread byte.
  const uint8_t* cursor() const { return data_ + pos_; }

  bool peek_u8(uint8_t& v) const {
    if (remaining() < 1) return false;
    v = data_[pos_];
    return true;
  }

  bool read_u8(uint8_t& v) {
    if (!peek_u8(v)) return false;
    ++pos_;
    return true;
  }

  bool read_u16_le(uint16_t& v) {
    if (remaining() < 2) return false;
    v = static_cast<uint16_t>(data_[pos_] | (data_[pos_ + 1] << 8));
    pos_ += 2;
    return true;
  }

  bool read_u16_be(uint16_t& v) {
    if (remaining() < 2) return false;
    v = static_cast<uint16_t>((data_[pos_] << 8) | data_[pos_ + 1]);
    pos_ += 2;
    return true;
  }

  bool read_u32_le(uint32_t& v) {
    if (remaining() < 4) return false;
    v = static_cast<uint32_t>(data_[pos_])
      | (static_cast<uint32_t>(data_[pos_ + 1]) << 8)
      | (static_cast<uint32_t>(data_[pos_ + 2]) << 16)
      | (static_cast<uint32_t>(data_[pos_ + 3]) << 24);
    pos_ += 4;
    return true;
  }

  /// Copy exactly n bytes into dst.
  bool read(uint8_t* dst, std::size_t n) {
    if (remaining() < n) return false;
    for (std::size_t i = 0; i < n; ++i) dst[i] = data_[pos_ + i];
    pos_ += n;
    return true;
  }

  bool skip(std::size_t n) {
    if (remaining() < n) return false;
    pos_ += n;
    return true;
  }

  /**
   * @brief Split off the next n bytes as an independent reader.
   *
   * The parent advances past them whether or not the sub-reader is fully
   * consumed, so a payload decoder cannot overrun its envelope.
   */
  bool take(std::size_t n, ByteReader& sub) {
    if (remaining() < n) return false;
    sub = ByteReader(data_ + pos_, n);
    pos_ += n;
    return true;
  }

private:
  const uint8_t* data_{nullptr};
  std::size_t    len_{0};
  std::size_t    pos_{0};
};

// -------- append helpers --------

inline void append_u16_le(Bytes& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v & 0xFF));
  out.push_back(static_cast<uint8_t>(v >> 8));
}

inline void append_u16_be(Bytes& out, uint16_t v) {
  out.push_back(static_cast<uint8_t>(v >> 8));
  out.push_back(static_cast<uint8_t>(v & 0xFF));
}

inline void append_u32_le(Bytes& out, uint32_t v) {
  for (int i = 0; i < 4; ++i) out.push_back(static_cast<uint8_t>((v >> (8 * i)) & 0xFF));
}

} // namespace v5link
