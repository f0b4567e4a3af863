// ============================================================================
// crc.cpp: implementation for v5link/crc.hpp
// ============================================================================

#include "v5link/crc.hpp"

namespace v5link {

uint16_t crc16_xmodem(const uint8_t* data, std::size_t len, uint16_t seed) {
  uint16_t crc = seed;
  for (std::size_t i = 0; i < len; ++i) {
    crc ^= static_cast<uint16_t>(data[i] << 8);
    for (int bit = 0; bit < 8; ++bit) {
      if (crc & 0x8000) crc = static_cast<uint16_t>((crc << 1) ^ 0x1021);
      else              crc = static_cast<uint16_t>(crc << 1);
    }
  }
  return crc;
}

} // namespace v5link
