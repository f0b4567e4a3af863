// ============================================================================
// error.cpp: implementation for v5link/error.hpp
// ============================================================================

#include "v5link/error.hpp"
#include "v5link/cdc2.hpp"   // ack_name()

#include <cstdio>
#include <cstring>

namespace v5link {

const char* to_string(ErrorKind k) {
  switch (k) {
    case ErrorKind::Ok:                     return "ok";
    case ErrorKind::Io:                     return "io";
    case ErrorKind::Encode:                 return "encode";
    case ErrorKind::Decode:                 return "decode";
    case ErrorKind::Timeout:                return "timeout";
    case ErrorKind::Nack:                   return "nack";
    case ErrorKind::Serial:                 return "serial";
    case ErrorKind::Bluetooth:              return "bluetooth";
    case ErrorKind::NoWriteOnWireless:      return "no_write_on_wireless";
    case ErrorKind::InvalidDevice:          return "invalid_device";
    case ErrorKind::InvalidMagic:           return "invalid_magic";
    case ErrorKind::NotConnected:           return "not_connected";
    case ErrorKind::NoBluetoothAdapter:     return "no_bluetooth_adapter";
    case ErrorKind::MissingCharacteristic:  return "missing_characteristic";
    case ErrorKind::IncorrectPin:           return "incorrect_pin";
    case ErrorKind::AuthenticationRequired: return "authentication_required";
  }
  return "unknown";
}

ConnectionError from_encode(EncodeError e) {
  if (e == EncodeError::None) return ConnectionError::none();
  ConnectionError c = ConnectionError::of(ErrorKind::Encode);
  c.encode = e;
  return c;
}

ConnectionError from_decode(const DecodeError& e) {
  if (e.ok()) return ConnectionError::none();

  ConnectionError c;
  c.decode = e;
  switch (e.kind) {
    case DecodeErrorKind::InvalidHeader:
      c.kind = ErrorKind::InvalidMagic;
      break;
    case DecodeErrorKind::Nack:
      c.kind = ErrorKind::Nack;
      c.nack = e.detail;
      break;
    default:
      c.kind = ErrorKind::Decode;
      break;
  }
  return c;
}

ConnectionError from_errno(int err) {
  ConnectionError c = ConnectionError::of(ErrorKind::Io);
  c.os_errno = err;
  return c;
}

static std::string hex_byte(uint8_t b) {
  char buf[8];
  std::snprintf(buf, sizeof(buf), "0x%02x", b);
  return buf;
}

std::string describe(const ConnectionError& e) {
  std::string s = "reason=";
  s += to_string(e.kind);

  switch (e.kind) {
    case ErrorKind::Encode:
      s += " encode=";
      s += to_string(e.encode);
      break;
    case ErrorKind::Decode:
    case ErrorKind::InvalidMagic:
      s += " decode=";
      s += to_string(e.decode.kind);
      if (e.decode.kind == DecodeErrorKind::UnexpectedId || e.decode.kind == DecodeErrorKind::InvalidHeader) {
        s += " got=" + hex_byte(e.decode.detail);
      }
      break;
    case ErrorKind::Nack:
      s += " code=" + hex_byte(e.nack);
      s += " ack=";
      s += ack_name(e.nack);
      break;
    case ErrorKind::Io:
    case ErrorKind::Serial:
      if (e.os_errno != 0) {
        s += " errno=" + std::to_string(e.os_errno);
        s += " msg=\"";
        s += std::strerror(e.os_errno);
        s += "\"";
      }
      break;
    default:
      break;
  }
  return s;
}

} // namespace v5link
