// ============================================================================
// serial_io.cpp: implementation for serial_io.hpp
// For API/overview see the matching .hpp.
// ============================================================================

/**
 * @file serial_io.cpp
 */

#include "serial_io.hpp"

// POSIX / termios headers for low-level serial port handling
#include <fcntl.h>         // ::open flags (O_RDWR, O_NOCTTY, etc.)
#include <unistd.h>        // ::read, ::write, ::close, usleep
#include <termios.h>       // termios struct + raw mode helpers
#include <poll.h>          // poll(2) for deadlines
#include <cerrno>

namespace v5link {

// ---------------------------------------------------------------------------
// baud_to_speed()
// ---------------
// Map common integer baud rates to termios constants. Unknown values fall back
// to 115200, which is what the V5 USB ports run at.
// ---------------------------------------------------------------------------
static speed_t baud_to_speed(int baud) {
    switch (baud) {
        case 9600:   return B9600;
        case 19200:  return B19200;
        case 38400:  return B38400;
        case 57600:  return B57600;
        case 115200: return B115200;
#ifdef B230400
        case 230400: return B230400;
#endif
#ifdef B460800
        case 460800: return B460800;
#endif
        default:     return B115200;
    }
}

// ---------------------------------------------------------------------------
// set_raw()
// ----------
// Configure a file descriptor for raw serial I/O at the given baud.
// - Disables echo, line buffering and flow control (8N1 raw mode).
// - Sets VMIN=0, VTIME=0 (non-blocking reads; poll() handles timing).
//
// Returns: true on success, false if tcgetattr/tcsetattr fails (errno set).
// ---------------------------------------------------------------------------
static bool set_raw(int fd, speed_t baud) {
    termios tio{};
    if (tcgetattr(fd, &tio) != 0) return false;

    cfmakeraw(&tio);
    cfsetispeed(&tio, baud);
    cfsetospeed(&tio, baud);

    tio.c_cflag |= (CLOCAL | CREAD);              // ignore modem ctrl, enable read
    tio.c_cflag &= ~CRTSCTS;                      // no hardware flow control
    tio.c_cc[VMIN]  = 0;
    tio.c_cc[VTIME] = 0;

    if (tcsetattr(fd, TCSANOW, &tio) != 0) return false;
    tcflush(fd, TCIOFLUSH);
    return true;
}


// ---------------------------------------------------------------------------
// open_serial()
// -------------
// Open, configure raw mode, wait out the CDC reset, flush the boot chatter.
// Returns: fd (>=0) or -1 with errno preserved from the failing call.
// ---------------------------------------------------------------------------
int open_serial(const std::string& dev, int baud, int boot_delay_ms) {
    int fd = ::open(dev.c_str(), O_RDWR | O_NOCTTY | O_NONBLOCK);
    if (fd < 0) return -1;

    if (!set_raw(fd, baud_to_speed(baud))) {
        const int saved = errno;
        ::close(fd);
        errno = saved;
        return -1;
    }

    if (boot_delay_ms > 0) usleep(static_cast<useconds_t>(boot_delay_ms) * 1000);
    tcflush(fd, TCIOFLUSH);
    return fd;
}


// ---------------------------------------------------------------------------
// write_all()
// -----------
// Loop until every byte is accepted by the driver. EAGAIN waits on POLLOUT
// for the remaining budget; EINTR simply retries.
// ---------------------------------------------------------------------------
bool write_all(int fd, const uint8_t* data, std::size_t len, int timeout_ms) {
    std::size_t done = 0;
    pollfd pfd{fd, POLLOUT, 0};

    while (done < len) {
        ssize_t w = ::write(fd, data + done, len - done);
        if (w > 0) { done += static_cast<std::size_t>(w); continue; }
        if (w < 0 && errno == EINTR) continue;
        if (w < 0 && errno != EAGAIN && errno != EWOULDBLOCK) return false;

        int pr = ::poll(&pfd, 1, timeout_ms);
        if (pr == 0) { errno = ETIMEDOUT; return false; }
        if (pr < 0 && errno != EINTR) return false;
    }
    return true;
}


// ---------------------------------------------------------------------------
// read_available()
// ----------------
// One poll() then one read(). The caller loops against its own deadline.
// ---------------------------------------------------------------------------
long read_available(int fd, uint8_t* out, std::size_t cap, int timeout_ms) {
    pollfd pfd{fd, POLLIN, 0};

    int pr = ::poll(&pfd, 1, timeout_ms);
    if (pr == 0) return 0;                        // quiet
    if (pr < 0)  return (errno == EINTR) ? 0 : -1;

    if (pfd.revents & POLLIN) {
        ssize_t n = ::read(fd, out, cap);
        if (n > 0) return static_cast<long>(n);
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR)) return 0;
        if (n == 0) { errno = EIO; return -1; }   // EOF on a tty: device gone
        return -1;
    }
    if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) { errno = EIO; return -1; }
    return 0;
}


// ---------------------------------------------------------------------------
// close_serial()
// --------------
void close_serial(int fd) {
    if (fd >= 0) ::close(fd);
}

} // namespace v5link
