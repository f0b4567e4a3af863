#pragma once
// Scripted in-memory transport for connection and command tests.
//
// Every system-channel send pops the next scripted reply (if any) into the
// receive queue. An empty scripted reply means "device stays silent".

#include "v5link/bytes.hpp"
#include "v5link/encode.hpp"
#include "v5link/transport/transport_base.hpp"

#include <algorithm>
#include <deque>
#include <vector>

namespace v5link::test {

class FakeTransport : public transport::ITransport {
public:
  explicit FakeTransport(transport::Kind k = transport::Kind::Serial) : kind_(k) {}

  // -------- script --------
  std::deque<Bytes>  replies;            // one per system send
  std::deque<Bytes>  user_rx;            // user-channel input
  std::size_t        max_chunk{0};       // 0: deliver whole buffers
  std::size_t        fail_send_on{0};    // 1-based system send that fails, 0 never
  bool               busy_send{false};
  bool               fail_recv{false};
  bool               begin_ok{true};
  ConnectionError    send_error{ConnectionError::of(ErrorKind::Io)};
  ConnectionError    recv_error{ConnectionError::of(ErrorKind::Io)};
  ConnectionError    begin_error{ConnectionError::of(ErrorKind::Serial)};

  // -------- observations --------
  std::vector<Bytes> sent;               // system channel, in order
  std::vector<Bytes> user_sent;
  std::size_t        send_attempts{0};
  int                last_user_timeout_ms{-1};

  /// Queue the encoded form of @p reply as the next scripted reply.
  template <typename T>
  EncodeError script(const T& reply) {
    Bytes b;
    const EncodeError e = into_encoded(reply, b);
    replies.push_back(b);
    return e;
  }

  void script_silence() { replies.push_back(Bytes{}); }

  // -------- ITransport --------
  bool begin(const transport::Config&) override {
    open_ = begin_ok;
    if (!begin_ok) err_ = begin_error;
    return begin_ok;
  }

  void end() override { open_ = false; }
  bool is_open() const override { return open_; }
  transport::Kind kind() const override { return kind_; }

  transport::TxResult send(transport::Channel ch, const uint8_t* data, std::size_t len) override {
    if (ch == transport::Channel::User) {
      user_sent.emplace_back(data, data + len);
      return transport::TxResult::Ok;
    }

    ++send_attempts;
    if (busy_send) return transport::TxResult::Busy;
    if (fail_send_on != 0 && send_attempts == fail_send_on) {
      err_ = send_error;
      return transport::TxResult::Error;
    }

    sent.emplace_back(data, data + len);
    if (!replies.empty()) {
      Bytes r = replies.front();
      replies.pop_front();
      rx_.insert(rx_.end(), r.begin(), r.end());
    }
    return transport::TxResult::Ok;
  }

  transport::RxResult recv(transport::Channel ch, uint8_t* out, std::size_t cap,
                           std::size_t& out_len, int timeout_ms) override {
    out_len = 0;
    if (fail_recv) {
      err_ = recv_error;
      return transport::RxResult::Error;
    }

    if (ch == transport::Channel::User) {
      last_user_timeout_ms = timeout_ms;
      if (user_rx.empty()) return transport::RxResult::None;
      Bytes b = user_rx.front();
      user_rx.pop_front();
      out_len = std::min(cap, b.size());
      std::copy(b.begin(), b.begin() + out_len, out);
      return transport::RxResult::Ok;
    }

    if (rx_.empty()) return transport::RxResult::None;
    std::size_t n = std::min(cap, rx_.size());
    if (max_chunk != 0) n = std::min(n, max_chunk);
    std::copy(rx_.begin(), rx_.begin() + n, out);
    rx_.erase(rx_.begin(), rx_.begin() + n);
    out_len = n;
    return transport::RxResult::Ok;
  }

  ConnectionError last_error() const override { return err_; }
  const char* name() const override { return "fake"; }

  /// Bytes pushed straight into the receive queue, outside the send script.
  void inject(const Bytes& b) { rx_.insert(rx_.end(), b.begin(), b.end()); }

private:
  transport::Kind kind_;
  bool            open_{true};
  std::deque<uint8_t> rx_;
  ConnectionError err_{};
};

} // namespace v5link::test
