#pragma once
/**
 * @file transport_linux_serial.hpp
 * @brief Linux USB/tty transport (header-only, termios; poll deadlines).
 *
 * One descriptor per channel: the system port carries commands, the optional
 * user port carries program stdio. Depends on serial_io.hpp for the syscalls.
 */

#if !defined(__linux__)
#  error "transport_linux_serial.hpp is Linux-only."
#endif

#include "v5link/transport/transport_base.hpp"
#include "serial_io.hpp"

#include <cerrno>
#include <string>

namespace v5link::transport {

class LinuxSerial : public ITransport {
public:
  explicit LinuxSerial(const std::string& system_path, const std::string& user_path = {})
  : system_path_(system_path), user_path_(user_path) {}

  ~LinuxSerial() override { end(); }

  LinuxSerial(const LinuxSerial&) = delete;
  LinuxSerial& operator=(const LinuxSerial&) = delete;

  bool begin(const Config& cfg) override {
    end();

    if (system_path_.empty()) {
      err_ = ConnectionError::of(ErrorKind::Serial);
      return false;
    }

    system_fd_ = open_serial(system_path_, cfg.baud, cfg.boot_delay_ms);
    if (system_fd_ < 0) {
      err_ = serial_error(errno);
      return false;
    }

    if (!user_path_.empty()) {
      user_fd_ = open_serial(user_path_, cfg.baud, 0);
      if (user_fd_ < 0) {
        err_ = serial_error(errno);
        end();
        return false;
      }
    }
    err_ = ConnectionError::none();
    return true;
  }

  void end() override {
    close_serial(system_fd_);
    close_serial(user_fd_);
    system_fd_ = -1;
    user_fd_   = -1;
  }

  bool is_open() const override { return system_fd_ >= 0; }
  Kind kind() const override { return Kind::Serial; }

  TxResult send(Channel ch, const uint8_t* data, std::size_t len) override {
    const int fd = fd_for(ch);
    if (fd < 0) { err_ = ConnectionError::of(ErrorKind::NotConnected); return TxResult::Error; }
    if (!data || !len) return TxResult::Ok;

    if (!write_all(fd, data, len, write_timeout_ms_)) {
      if (errno == EAGAIN || errno == EWOULDBLOCK) return TxResult::Busy;
      err_ = from_errno(errno);
      return TxResult::Error;
    }
    return TxResult::Ok;
  }

  RxResult recv(Channel ch, uint8_t* out, std::size_t cap, std::size_t& out_len,
                int timeout_ms) override {
    out_len = 0;
    const int fd = fd_for(ch);
    if (fd < 0) { err_ = ConnectionError::of(ErrorKind::NotConnected); return RxResult::Error; }
    if (cap == 0) return RxResult::None;

    long n = read_available(fd, out, cap, timeout_ms);
    if (n > 0) { out_len = static_cast<std::size_t>(n); return RxResult::Ok; }
    if (n == 0) return RxResult::None;
    err_ = from_errno(errno);
    return RxResult::Error;
  }

  ConnectionError last_error() const override { return err_; }
  const char* name() const override { return "linux-serial"; }

private:
  int fd_for(Channel ch) const { return ch == Channel::User ? user_fd_ : system_fd_; }

  static ConnectionError serial_error(int e) {
    ConnectionError c = ConnectionError::of(ErrorKind::Serial);
    c.os_errno = e;
    return c;
  }

  std::string     system_path_;
  std::string     user_path_;
  int             system_fd_{-1};
  int             user_fd_{-1};
  int             write_timeout_ms_{1000};   // driver drain budget per send
  ConnectionError err_{};
};

} // namespace v5link::transport
