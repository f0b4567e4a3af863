#pragma once
/**
 * @file crc.hpp
 * @brief CRC-16/XMODEM used by extended (CDC2) packets.
 *
 * Polynomial 0x1021, initial value 0, no reflection, no final xor.
 * Running the CRC over a frame that ends in its own big-endian CRC yields 0.
 */

#include <cstddef>
#include <cstdint>

namespace v5link {

uint16_t crc16_xmodem(const uint8_t* data, std::size_t len, uint16_t seed = 0);

} // namespace v5link
