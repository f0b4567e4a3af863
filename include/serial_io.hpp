/**
 * @page v5-serial-io-hdr V5 Serial I/O API (Header)
 * @file serial_io.hpp
 * @brief Open a Linux TTY in raw mode and move bytes with poll() deadlines.
 *
 * @details
 * PURPOSE
 * -------
 * This header declares the POSIX surface under the LinuxSerial transport.
 * A V5 Brain or Controller enumerates as USB CDC ACM, usually two ports:
 * the system port (commands) and the user port (program stdio). Both are
 * opened with the same functions.
 *
 * ROLE IN V5LINK
 * --------------
 * - open_serial: acquire a raw, non-blocking descriptor and absorb the boot
 *   noise after the device resets on open.
 * - write_all: write a whole frame, waiting on POLLOUT when the driver buffer
 *   is full.
 * - read_available: wait up to a deadline, then read whatever is ready.
 * - close_serial: close the descriptor.
 *
 * Framing is not done here. The Connection runs a HostFrameDecoder over the
 * bytes read_available() hands back.
 *
 * ERRORS
 * ------
 * Every function leaves errno set on failure so the transport can report
 * Io(errno) or Serial(errno).
 *
 * EXAMPLE
 * -------
 * @code
 *   int fd = v5link::open_serial("/dev/ttyACM0", 115200, 400);
 *   if (fd < 0) { // errno says why }
 *
 *   if (!v5link::write_all(fd, frame.data(), frame.size(), 1000)) { ... }
 *
 *   uint8_t buf[256];
 *   long n = v5link::read_available(fd, buf, sizeof(buf), 100);
 *   // n > 0: bytes, n == 0: quiet, n < 0: error
 *
 *   v5link::close_serial(fd);
 * @endcode
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Prefer /dev/serial/by-id/... paths, they survive replugging.
 * - The runtime user needs the dialout group (or a udev rule).
 * - Do not share one fd between threads without external locking.
 */
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

namespace v5link {

/**
 * @brief Open a TTY for raw 8N1 I/O and return its descriptor.
 *
 * Opens with O_RDWR | O_NOCTTY | O_NONBLOCK, applies raw mode at the mapped
 * baud (9600..460800, otherwise 115200), sleeps boot_delay_ms and flushes.
 *
 * @return fd >= 0, or -1 with errno set.
 */
int open_serial(const std::string& dev, int baud = 115200, int boot_delay_ms = 400);

/**
 * @brief Write all @p len bytes, waiting up to @p timeout_ms for buffer space.
 *
 * @return true when every byte was written; false with errno set (ETIMEDOUT
 *         when the driver never drained).
 */
bool write_all(int fd, const uint8_t* data, std::size_t len, int timeout_ms);

/**
 * @brief Wait up to @p timeout_ms for input, then read up to @p cap bytes.
 *
 * @return bytes read (> 0), 0 when nothing arrived in time, -1 with errno set.
 *         A hangup (device unplugged) is -1 with errno = EIO.
 */
long read_available(int fd, uint8_t* out, std::size_t cap, int timeout_ms);

/// Close a descriptor if valid.
void close_serial(int fd);

} // namespace v5link
