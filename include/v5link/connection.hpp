#pragma once
/**
 * @page v5-connection V5 Connection
 * @file connection.hpp
 * @brief Request/response exchange with a V5 device over one transport.
 *
 * @details
 * PURPOSE
 * -------
 * Connection turns the raw byte pipe of an ITransport into packet exchange:
 *   - send_packet:      encode one packet and write it in full
 *   - receive_packet:   wait for one host-bound frame and decode it
 *   - packet_handshake: send + receive with a bounded number of attempts
 *   - execute_command:  run a command object (see commands.hpp)
 *   - write_user / read_user: the user (program stdio) channel
 *
 * Every call returns a ConnectionError. ok() means success and the out
 * parameter is filled.
 *
 * HANDSHAKE POLICY
 * ----------------
 *   last = Timeout
 *   repeat up to `retries` times:
 *       send    -> on failure return that error at once (never retried)
 *       receive -> on success return it
 *                  on failure remember it as `last`, log a warning
 *   log an error, return `last`
 *
 * retries == 0 sends nothing and returns Timeout.
 *
 * CONCURRENCY
 * -----------
 * One Connection per caller, no internal locking. Calls block only inside
 * the transport (poll deadlines). cancel() may be called from another thread:
 * the next receive slice sees the flag, drops the partial frame and returns
 * Timeout. clear_cancel() re-arms the connection.
 *
 * EXAMPLE
 * -------
 * @code
 *   auto serial = std::make_unique<v5link::transport::LinuxSerial>("/dev/ttyACM0");
 *   v5link::Connection conn(std::move(serial));
 *   if (auto e = conn.open({}); !e.ok()) { ... }
 *
 *   v5link::GetSystemVersion cmd;
 *   v5link::SystemVersion ver;
 *   if (auto e = conn.execute_command(cmd, ver); !e.ok()) {
 *       std::cerr << "status=error " << v5link::describe(e) << "\n";
 *   }
 * @endcode
 */

#include "v5link/bytes.hpp"
#include "v5link/decode.hpp"
#include "v5link/encode.hpp"
#include "v5link/error.hpp"
#include "v5link/frame.hpp"
#include "v5link/transport/transport_base.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

namespace v5link {

class Connection {
public:
  static constexpr int POLL_SLICE_MS = 50;   // longest single wait inside receive

  Connection() = default;
  explicit Connection(std::unique_ptr<transport::ITransport> t);
  ~Connection();

  Connection(Connection&& o) noexcept;
  Connection& operator=(Connection&& o) noexcept;
  Connection(const Connection&) = delete;
  Connection& operator=(const Connection&) = delete;

  /// begin() the transport. NotConnected without one; the transport's error otherwise.
  ConnectionError open(const transport::Config& cfg);
  void close();

  bool is_connected() const;
  transport::Kind kind() const;
  transport::ITransport* transport() { return transport_.get(); }

  void cancel() { cancel_.store(true); }
  void clear_cancel() { cancel_.store(false); }
  bool cancelled() const { return cancel_.load(); }

  // -------- raw frame I/O (system channel) --------

  ConnectionError send_bytes(const Bytes& frame);

  /// Wait up to @p timeout for one complete AA 55 frame. Noise before it is skipped.
  ConnectionError receive_frame(std::chrono::milliseconds timeout, Bytes& frame);

  // -------- packet exchange --------

  template <typename P>
  ConnectionError send_packet(const P& packet) {
    Bytes out;
    if (auto e = into_encoded(packet, out); e != EncodeError::None) return from_encode(e);
    return send_bytes(out);
  }

  template <typename T>
  ConnectionError receive_packet(std::chrono::milliseconds timeout, T& out) {
    Bytes frame;
    if (auto e = receive_frame(timeout, frame); !e.ok()) return e;
    return from_decode(decode_bytes(frame, out));
  }

  template <typename C>
  ConnectionError execute_command(C& command, typename C::Output& out) {
    return command.execute(*this, out);
  }

  template <typename T, typename P>
  ConnectionError packet_handshake(std::chrono::milliseconds timeout, std::size_t retries,
                                   const P& packet, T& out) {
    ConnectionError last = ConnectionError::of(ErrorKind::Timeout);

    for (std::size_t attempt = 1; attempt <= retries; ++attempt) {
      if (auto e = send_packet(packet); !e.ok()) return e;

      ConnectionError e = receive_packet(timeout, out);
      if (e.ok()) return e;

      last = e;
      log_attempt_failed(attempt, retries, last);
      if (cancelled()) break;
    }

    log_handshake_failed(retries, last);
    return last;
  }

  // -------- user channel --------

  /// NoWriteOnWireless over Bluetooth; nothing is transmitted in that case.
  ConnectionError write_user(const Bytes& data);

  /// Whatever arrives within @p timeout. Empty @p out with ok() means the program was quiet.
  ConnectionError read_user(std::chrono::milliseconds timeout, Bytes& out);

private:
  void log_attempt_failed(std::size_t attempt, std::size_t retries, const ConnectionError& e) const;
  void log_handshake_failed(std::size_t retries, const ConnectionError& e) const;
  ConnectionError transport_error() const;

  std::unique_ptr<transport::ITransport> transport_;
  HostFrameDecoder  decoder_;
  Bytes             pending_;      // bytes read past the end of the last frame
  std::atomic<bool> cancel_{false};
};

} // namespace v5link
