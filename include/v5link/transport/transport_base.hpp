#pragma once
/**
 * @file transport_base.hpp
 * @brief Byte transport interface the Connection talks through.
 *
 * A transport moves raw bytes on two logical channels:
 *   - System: command/reply traffic (all packets in this library)
 *   - User:   program stdio passthrough
 * It knows nothing about packets or framing.
 */

#include "v5link/error.hpp"

#include <cstddef>
#include <cstdint>

namespace v5link::transport {

// Return codes kept simple; details come from last_error().
enum class TxResult : uint8_t { Ok=0, Busy=1, Error=2 };
enum class RxResult : uint8_t { None=0, Ok=1, Error=2 };

enum class Kind    : uint8_t { Serial=0, Bluetooth=1 };
enum class Channel : uint8_t { System=0, User=1 };

struct Config {
  int baud{115200};
  int boot_delay_ms{400};   // USB CDC devices reset on open
};

/**
 * @brief Transport trait every backend implements.
 *
 * Contract:
 *  - begin(cfg) opens the link; false on failure with last_error() set.
 *  - send(ch,buf,len) writes the whole buffer or fails. Busy means "try later".
 *  - recv(ch,buf,cap,n,timeout_ms) waits up to timeout_ms for data.
 *    Ok with n>0 on data, None on a quiet link, Error with last_error() set.
 *  - last_error() describes the most recent Error result or failed begin().
 *    Serial backends report Serial / Io(errno). Bluetooth backends report
 *    Bluetooth, NoBluetoothAdapter, MissingCharacteristic, IncorrectPin or
 *    AuthenticationRequired.
 *  - name() is a short identifier for logs.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool            begin(const Config& cfg) = 0;
  virtual void            end() = 0;
  virtual bool            is_open() const = 0;
  virtual Kind            kind() const = 0;
  virtual TxResult        send(Channel ch, const uint8_t* data, std::size_t len) = 0;
  virtual RxResult        recv(Channel ch, uint8_t* out, std::size_t cap, std::size_t& out_len,
                               int timeout_ms) = 0;
  virtual ConnectionError last_error() const = 0;
  virtual const char*     name() const = 0;
};

} // namespace v5link::transport
