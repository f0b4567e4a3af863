// ============================================================================
// connection.cpp: implementation for v5link/connection.hpp
// For API/overview see the matching .hpp. For usage examples, check tests/.
// ============================================================================

#include "v5link/connection.hpp"
#include "v5link/log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <limits>
#include <string>
#include <utility>

namespace v5link {

using namespace std::chrono;

// Short hex dump for debug logs. Long frames are cut at 32 bytes.
static std::string hex_preview(const uint8_t* data, std::size_t len) {
  static constexpr std::size_t MAX_SHOWN = 32;
  std::string s;
  char b[4];
  const std::size_t n = std::min(len, MAX_SHOWN);
  for (std::size_t i = 0; i < n; ++i) {
    std::snprintf(b, sizeof(b), "%02x", data[i]);
    s += b;
  }
  if (len > MAX_SHOWN) s += "..";
  return s;
}

Connection::Connection(std::unique_ptr<transport::ITransport> t) : transport_(std::move(t)) {}

Connection::~Connection() { close(); }

Connection::Connection(Connection&& o) noexcept
: transport_(std::move(o.transport_)),
  decoder_(std::move(o.decoder_)),
  pending_(std::move(o.pending_)),
  cancel_(o.cancel_.load()) {}

Connection& Connection::operator=(Connection&& o) noexcept {
  if (this != &o) {
    close();
    transport_ = std::move(o.transport_);
    decoder_   = std::move(o.decoder_);
    pending_   = std::move(o.pending_);
    cancel_.store(o.cancel_.load());
  }
  return *this;
}

ConnectionError Connection::open(const transport::Config& cfg) {
  if (!transport_) return ConnectionError::of(ErrorKind::NotConnected);
  if (!transport_->begin(cfg)) {
    ConnectionError e = transport_error();
    log::error("connect_failed", std::string("transport=") + transport_->name() + " " + describe(e));
    return e;
  }
  decoder_.reset();
  pending_.clear();
  log::info("connected", std::string("transport=") + transport_->name());
  return ConnectionError::none();
}

void Connection::close() {
  if (transport_ && transport_->is_open()) transport_->end();
}

bool Connection::is_connected() const {
  return transport_ && transport_->is_open();
}

transport::Kind Connection::kind() const {
  return transport_ ? transport_->kind() : transport::Kind::Serial;
}

// A transport that reported Error without filling last_error() still fails.
ConnectionError Connection::transport_error() const {
  ConnectionError e = transport_->last_error();
  if (e.ok()) e = ConnectionError::of(ErrorKind::Io);
  return e;
}

// ---------------------------------------------------------------------------
// send_bytes()
// ------------
// Whole-frame write on the system channel. Busy means the driver would block;
// it surfaces as Io(EAGAIN) and the handshake treats it like any send failure.
// ---------------------------------------------------------------------------
ConnectionError Connection::send_bytes(const Bytes& frame) {
  if (!is_connected()) return ConnectionError::of(ErrorKind::NotConnected);

  if (log::enabled(log::Level::Debug)) {
    log::debug("tx", "len=" + std::to_string(frame.size()) + " bytes=" + hex_preview(frame.data(), frame.size()));
  }

  switch (transport_->send(transport::Channel::System, frame.data(), frame.size())) {
    case transport::TxResult::Ok:    return ConnectionError::none();
    case transport::TxResult::Busy:  return from_errno(EAGAIN);
    case transport::TxResult::Error: break;
  }
  return transport_error();
}

// ---------------------------------------------------------------------------
// receive_frame()
// ---------------
// Feed bytes into the frame decoder until it yields a frame or the deadline
// passes. Waits are sliced so cancel() is noticed within POLL_SLICE_MS.
// Bytes that arrive after a complete frame are kept for the next call; a
// partial frame is dropped on timeout.
// ---------------------------------------------------------------------------
ConnectionError Connection::receive_frame(milliseconds timeout, Bytes& frame) {
  if (!is_connected()) return ConnectionError::of(ErrorKind::NotConnected);

  auto deliver = [&](const uint8_t* data, std::size_t n) -> bool {
    for (std::size_t i = 0; i < n; ++i) {
      if (decoder_.feed(data[i], frame)) {
        Bytes rest(data + i + 1, data + n);
        pending_.swap(rest);
        return true;
      }
    }
    return false;
  };

  if (!pending_.empty()) {
    Bytes backlog;
    backlog.swap(pending_);
    if (deliver(backlog.data(), backlog.size())) {
      log::debug("rx", "len=" + std::to_string(frame.size()) + " bytes=" + hex_preview(frame.data(), frame.size()));
      return ConnectionError::none();
    }
  }

  const auto deadline = steady_clock::now() + timeout;
  uint8_t buf[256];

  for (;;) {
    if (cancelled()) {
      decoder_.reset();
      log::debug("rx_cancelled");
      return ConnectionError::of(ErrorKind::Timeout);
    }

    auto left = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
    int slice = static_cast<int>(std::max<long long>(0, std::min<long long>(left, POLL_SLICE_MS)));

    std::size_t n = 0;
    transport::RxResult r = transport_->recv(transport::Channel::System, buf, sizeof(buf), n, slice);
    if (r == transport::RxResult::Error) {
      decoder_.reset();
      return transport_error();
    }
    if (r == transport::RxResult::Ok && deliver(buf, n)) {
      log::debug("rx", "len=" + std::to_string(frame.size()) + " bytes=" + hex_preview(frame.data(), frame.size()));
      return ConnectionError::none();
    }

    if (steady_clock::now() >= deadline) {
      decoder_.reset();
      return ConnectionError::of(ErrorKind::Timeout);
    }
  }
}

// ---------------------------------------------------------------------------
// user channel
// ---------------------------------------------------------------------------
ConnectionError Connection::write_user(const Bytes& data) {
  if (!is_connected()) return ConnectionError::of(ErrorKind::NotConnected);
  if (transport_->kind() == transport::Kind::Bluetooth) {
    return ConnectionError::of(ErrorKind::NoWriteOnWireless);
  }

  switch (transport_->send(transport::Channel::User, data.data(), data.size())) {
    case transport::TxResult::Ok:    return ConnectionError::none();
    case transport::TxResult::Busy:  return from_errno(EAGAIN);
    case transport::TxResult::Error: break;
  }
  return transport_error();
}

ConnectionError Connection::read_user(milliseconds timeout, Bytes& out) {
  out.clear();
  if (!is_connected()) return ConnectionError::of(ErrorKind::NotConnected);

  uint8_t buf[256];
  std::size_t n = 0;
  const int wait_ms = static_cast<int>(
      std::max<long long>(0, std::min<long long>(timeout.count(), std::numeric_limits<int>::max())));
  transport::RxResult r = transport_->recv(transport::Channel::User, buf, sizeof(buf), n, wait_ms);
  if (r == transport::RxResult::Error) return transport_error();
  if (r == transport::RxResult::Ok) out.assign(buf, buf + n);
  return ConnectionError::none();
}

// ---------------------------------------------------------------------------
// handshake logging
// ---------------------------------------------------------------------------
void Connection::log_attempt_failed(std::size_t attempt, std::size_t retries,
                                    const ConnectionError& e) const {
  log::warn("handshake_retry",
            "attempt=" + std::to_string(attempt) + " of=" + std::to_string(retries) + " " + describe(e));
}

void Connection::log_handshake_failed(std::size_t retries, const ConnectionError& e) const {
  log::error("handshake_failed", "attempts=" + std::to_string(retries) + " " + describe(e));
}

} // namespace v5link
