#include <doctest/doctest.h>
#include "fake_transport.hpp"
#include "commands.hpp"
#include "v5link/connection.hpp"
#include "v5link/log.hpp"

#include <cerrno>
#include <chrono>
#include <limits>
#include <memory>
#include <sstream>

using namespace v5link;
using v5link::test::FakeTransport;
using std::chrono::milliseconds;

namespace {

// Keeps handshake warnings out of the test output and restores the defaults.
struct QuietLog {
  std::ostringstream captured;
  QuietLog()  { log::set_sink(&captured); log::set_level(log::Level::Warn); }
  ~QuietLog() { log::set_sink(nullptr);   log::set_level(log::Level::Warn); }
};

struct Rig {
  FakeTransport* fake;
  Connection     conn;

  explicit Rig(transport::Kind k = transport::Kind::Serial)
  : fake(new FakeTransport(k)), conn(std::unique_ptr<transport::ITransport>(fake)) {}
};

const SystemVersion kBrain{Version{1, 1, 3, 0}, 0x10, 0x00};

} // namespace

TEST_CASE("handshake retries past wrong-id replies") {
  QuietLog quiet;
  Rig r;
  REQUIRE(r.fake->script(HostBoundPacket<Unit, 0x01>{}) == EncodeError::None);
  REQUIRE(r.fake->script(HostBoundPacket<Unit, 0x02>{}) == EncodeError::None);
  REQUIRE(r.fake->script(GetSystemVersionReplyPacket(kBrain)) == EncodeError::None);

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 3, GetSystemVersionPacket{}, reply);
  REQUIRE(e.ok());
  CHECK(reply.payload.version == kBrain.version);
  CHECK(r.fake->sent.size() == 3);
  CHECK(r.fake->sent[0] == Bytes{0xC9, 0x36, 0xB8, 0x47, 0xA4, 0x00});
}

TEST_CASE("handshake returns the last receive error once attempts run out") {
  QuietLog quiet;
  Rig r;
  REQUIRE(r.fake->script(HostBoundPacket<Unit, 0x01>{}) == EncodeError::None);
  REQUIRE(r.fake->script(HostBoundPacket<Unit, 0x02>{}) == EncodeError::None);
  REQUIRE(r.fake->script(GetSystemVersionReplyPacket(kBrain)) == EncodeError::None);

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 2, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Decode);
  CHECK(e.decode.kind == DecodeErrorKind::UnexpectedId);
  CHECK(e.decode.detail == 0x02);
  CHECK(r.fake->sent.size() == 2);

  const std::string text = quiet.captured.str();
  CHECK(text.find("level=warn event=handshake_retry attempt=1 of=2") != std::string::npos);
  CHECK(text.find("level=error event=handshake_failed attempts=2") != std::string::npos);
}

TEST_CASE("zero retries sends nothing and times out") {
  QuietLog quiet;
  Rig r;
  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 0, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Timeout);
  CHECK(r.fake->send_attempts == 0);
}

TEST_CASE("a send failure is returned without retrying") {
  QuietLog quiet;
  Rig r;
  r.fake->fail_send_on = 1;
  r.fake->send_error   = from_errno(EIO);

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 5, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Io);
  CHECK(e.os_errno == EIO);
  CHECK(r.fake->send_attempts == 1);
  CHECK(r.fake->sent.empty());
}

TEST_CASE("a busy transport surfaces as Io EAGAIN") {
  QuietLog quiet;
  Rig r;
  r.fake->busy_send = true;

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 3, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Io);
  CHECK(e.os_errno == EAGAIN);
  CHECK(r.fake->send_attempts == 1);
}

TEST_CASE("a NACK on every attempt is reported with its code") {
  QuietLog quiet;
  Rig r;
  for (int i = 0; i < 3; ++i) {
    REQUIRE(r.fake->script(KeyValueLoadReplyPacket(KvValue{}, Cdc2Ack::NackProgramFile)) == EncodeError::None);
  }

  KeyValueLoadPacket req;
  REQUIRE(KvKey::make("teamnumber", req.payload) == EncodeError::None);
  KeyValueLoadReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(20), 3, req, reply);
  CHECK(e.kind == ErrorKind::Nack);
  CHECK(e.nack == 0xD3);
  CHECK(r.fake->sent.size() == 3);
}

TEST_CASE("a silent device times out after every attempt") {
  QuietLog quiet;
  Rig r;
  r.fake->script_silence();
  r.fake->script_silence();

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(10), 2, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Timeout);
  CHECK(r.fake->sent.size() == 2);
}

TEST_CASE("frames split into single bytes still decode") {
  QuietLog quiet;
  Rig r;
  r.fake->max_chunk = 1;
  REQUIRE(r.fake->script(GetSystemVersionReplyPacket(kBrain)) == EncodeError::None);

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(200), 1, GetSystemVersionPacket{}, reply);
  REQUIRE(e.ok());
  CHECK(reply.payload.product_type == 0x10);
}

TEST_CASE("bytes after a frame are kept for the next receive") {
  Rig r;
  r.fake->inject(Bytes{0x00, 0xAA, 0x55, 0x01, 0x01, 0x10, 0xAA, 0x55, 0x02, 0x00});

  Bytes frame;
  REQUIRE(r.conn.receive_frame(milliseconds(20), frame).ok());
  CHECK(frame == Bytes{0xAA, 0x55, 0x01, 0x01, 0x10});
  REQUIRE(r.conn.receive_frame(milliseconds(20), frame).ok());
  CHECK(frame == Bytes{0xAA, 0x55, 0x02, 0x00});
  CHECK(r.conn.receive_frame(milliseconds(10), frame).kind == ErrorKind::Timeout);
}

TEST_CASE("cancel stops a receive and the handshake loop") {
  QuietLog quiet;
  Rig r;
  r.conn.cancel();

  Bytes frame;
  const auto start = std::chrono::steady_clock::now();
  CHECK(r.conn.receive_frame(milliseconds(5000), frame).kind == ErrorKind::Timeout);
  CHECK(std::chrono::steady_clock::now() - start < milliseconds(1000));

  GetSystemVersionReplyPacket reply;
  auto e = r.conn.packet_handshake(milliseconds(5000), 5, GetSystemVersionPacket{}, reply);
  CHECK(e.kind == ErrorKind::Timeout);
  CHECK(r.fake->sent.size() == 1);

  r.conn.clear_cancel();
  REQUIRE(r.fake->script(GetSystemVersionReplyPacket(kBrain)) == EncodeError::None);
  CHECK(r.conn.packet_handshake(milliseconds(100), 1, GetSystemVersionPacket{}, reply).ok());
}

TEST_CASE("no transport or a closed one means NotConnected") {
  Connection empty;
  CHECK_FALSE(empty.is_connected());
  CHECK(empty.open({}).kind == ErrorKind::NotConnected);
  CHECK(empty.send_packet(GetSystemVersionPacket{}).kind == ErrorKind::NotConnected);

  Rig r;
  r.conn.close();
  Bytes frame;
  CHECK(r.conn.receive_frame(milliseconds(10), frame).kind == ErrorKind::NotConnected);
  CHECK(r.conn.write_user(Bytes{1}).kind == ErrorKind::NotConnected);
}

TEST_CASE("user channel writes are refused over Bluetooth") {
  Rig ble(transport::Kind::Bluetooth);
  CHECK(ble.conn.kind() == transport::Kind::Bluetooth);
  CHECK(ble.conn.write_user(Bytes{'h', 'i'}).kind == ErrorKind::NoWriteOnWireless);
  CHECK(ble.fake->user_sent.empty());

  Rig usb;
  REQUIRE(usb.conn.write_user(Bytes{'h', 'i'}).ok());
  REQUIRE(usb.fake->user_sent.size() == 1);
  CHECK(usb.fake->user_sent[0] == Bytes{'h', 'i'});
}

TEST_CASE("user channel reads return what arrived, or nothing") {
  Rig r;
  Bytes out{0x99};
  REQUIRE(r.conn.read_user(milliseconds(10), out).ok());
  CHECK(out.empty());

  r.fake->user_rx.push_back(Bytes{'o', 'k', '\n'});
  REQUIRE(r.conn.read_user(milliseconds(10), out).ok());
  CHECK(out == Bytes{'o', 'k', '\n'});
}

TEST_CASE("transport error kinds pass through unchanged") {
  QuietLog quiet;
  Rig r(transport::Kind::Bluetooth);
  r.fake->begin_ok    = false;
  r.fake->begin_error = ConnectionError::of(ErrorKind::IncorrectPin);
  CHECK(r.conn.open({}).kind == ErrorKind::IncorrectPin);

  Rig rx(transport::Kind::Bluetooth);
  rx.fake->fail_recv  = true;
  rx.fake->recv_error = ConnectionError::of(ErrorKind::AuthenticationRequired);
  Bytes frame;
  CHECK(rx.conn.receive_frame(milliseconds(10), frame).kind == ErrorKind::AuthenticationRequired);

  Rig none;
  none.fake->begin_ok    = false;
  none.fake->begin_error = ConnectionError::of(ErrorKind::NoBluetoothAdapter);
  CHECK(none.conn.open({}).kind == ErrorKind::NoBluetoothAdapter);
}

TEST_CASE("debug logging shows frames in hex") {
  QuietLog quiet;
  log::set_level(log::Level::Debug);
  Rig r;
  REQUIRE(r.conn.send_packet(GetSystemVersionPacket{}).ok());
  CHECK(quiet.captured.str().find("level=debug event=tx len=6 bytes=c936b847a400") != std::string::npos);
}

TEST_CASE("user read timeouts are clamped to what poll accepts") {
  Rig r;
  Bytes out;
  REQUIRE(r.conn.read_user(milliseconds(10000000000LL), out).ok());
  CHECK(r.fake->last_user_timeout_ms == std::numeric_limits<int>::max());

  REQUIRE(r.conn.read_user(milliseconds(-5), out).ok());
  CHECK(r.fake->last_user_timeout_ms == 0);

  REQUIRE(r.conn.read_user(milliseconds(250), out).ok());
  CHECK(r.fake->last_user_timeout_ms == 250);
}
