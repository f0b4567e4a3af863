#pragma once
/**
 * @file error.hpp
 * @brief One closed error taxonomy for every connection-level failure.
 *
 * @details
 * PURPOSE
 * -------
 * Everything the host can hit while talking to a device (transport I/O,
 * bad payloads, garbled replies, timeouts, device NACKs, wireless
 * restrictions) is reported as one ConnectionError. Lower-layer results
 * (EncodeError, DecodeError, errno) are converted by the explicit from_*
 * functions below. There are no implicit conversions.
 *
 * REPORTING
 * ---------
 * Each ErrorKind has a stable snake_case reason string. The CLI prints it as
 * `status=error reason=<string>` and scripts may match on it, so the strings
 * never change once released. describe() adds the detail fields
 * (nack code, errno, decode kind) in the same key=value style.
 */

#include "v5link/decode.hpp"
#include "v5link/encode.hpp"

#include <cstdint>
#include <string>

namespace v5link {

enum class ErrorKind : uint8_t {
  Ok = 0,
  Io,
  Encode,
  Decode,
  Timeout,
  Nack,
  Serial,
  Bluetooth,
  NoWriteOnWireless,
  InvalidDevice,
  InvalidMagic,
  NotConnected,
  NoBluetoothAdapter,
  MissingCharacteristic,
  IncorrectPin,
  AuthenticationRequired,
};

/// Stable reason string, e.g. "timeout", "no_write_on_wireless".
const char* to_string(ErrorKind k);

struct ConnectionError {
  ErrorKind   kind{ErrorKind::Ok};
  EncodeError encode{EncodeError::None};  // set for Encode
  DecodeError decode{};                   // set for Decode / InvalidMagic / Nack
  uint8_t     nack{0};                    // device ack byte for Nack
  int         os_errno{0};                // set for Io / Serial when an errno exists

  bool ok() const { return kind == ErrorKind::Ok; }

  static ConnectionError none() { return {}; }
  static ConnectionError of(ErrorKind k) {
    ConnectionError e;
    e.kind = k;
    return e;
  }
};

ConnectionError from_encode(EncodeError e);

/// InvalidHeader maps to InvalidMagic, Nack to Nack(code), everything else to Decode.
ConnectionError from_decode(const DecodeError& e);

/// errno to Io. EAGAIN/EWOULDBLOCK included; the caller decides whether that is fatal.
ConnectionError from_errno(int err);

/// key=value detail line: "reason=nack code=0xd0 ack=nack_packet_length".
std::string describe(const ConnectionError& e);

} // namespace v5link
