#include <doctest/doctest.h>
#include "v5link/cdc2.hpp"

#include <string>

using namespace v5link;

using Key   = VarLengthString<31>;
using Value = VarLengthString<255>;

TEST_CASE("crc16 matches the XMODEM check value") {
    const std::string check = "123456789";
    CHECK(crc16_xmodem(reinterpret_cast<const uint8_t*>(check.data()), check.size()) == 0x31C3);
    CHECK(crc16_xmodem(nullptr, 0) == 0);
}

TEST_CASE("extended command layout") {
    Cdc2CommandPacket<0x2E, Key> pkt;
    REQUIRE(Key::make("ab", pkt.payload) == EncodeError::None);
    Bytes out;
    REQUIRE(into_encoded(pkt, out) == EncodeError::None);

    REQUIRE(out.size() == 4 + 1 + 1 + 1 + 3 + 2);
    CHECK(Bytes(out.begin(), out.begin() + 10) ==
          Bytes{0xC9, 0x36, 0xB8, 0x47, 0x56, 0x2E, 0x03, 'a', 'b', 0x00});

    const uint16_t crc = crc16_xmodem(out.data(), 10);
    CHECK(out[10] == static_cast<uint8_t>(crc >> 8));
    CHECK(out[11] == static_cast<uint8_t>(crc & 0xFF));
    CHECK(crc16_xmodem(out.data(), out.size()) == 0);
}

TEST_CASE("extended reply decodes its own encoding") {
    Value v;
    REQUIRE(Value::make("1234A", v) == EncodeError::None);
    Cdc2ReplyPacket<0x2E, Value> reply(v);
    Bytes out;
    REQUIRE(into_encoded(reply, out) == EncodeError::None);

    // AA 55 56 n EXT ACK payload(6) crc(2); n counts ext+ack+payload+crc
    CHECK(out[0] == 0xAA);
    CHECK(out[1] == 0x55);
    CHECK(out[2] == USER_CDC);
    CHECK(out[3] == 2 + 6 + 2);
    CHECK(out[4] == 0x2E);
    CHECK(out[5] == 0x76);
    CHECK(crc16_xmodem(out.data(), out.size()) == 0);

    Cdc2ReplyPacket<0x2E, Value> back;
    REQUIRE(decode_bytes(out, back).ok());
    CHECK(back.payload.str() == "1234A");
}

TEST_CASE("a NACK reply surfaces the device code") {
    Cdc2ReplyPacket<0x1B, Unit> reply(Unit{}, Cdc2Ack::NackFileAlreadyExists);
    Bytes out;
    REQUIRE(into_encoded(reply, out) == EncodeError::None);

    Cdc2ReplyPacket<0x1B, Unit> back;
    DecodeError e = decode_bytes(out, back);
    CHECK(e.kind == DecodeErrorKind::Nack);
    CHECK(e.detail == 0xDB);
    CHECK(std::string(ack_name(e.detail)) == "nack_file_already_exists");
}

TEST_CASE("a corrupted reply fails the CRC check first") {
    Cdc2ReplyPacket<0x2E, Unit> reply(Unit{}, Cdc2Ack::NackPacketCrc);
    Bytes out;
    REQUIRE(into_encoded(reply, out) == EncodeError::None);
    out[4] ^= 0x01;

    Cdc2ReplyPacket<0x2E, Unit> back;
    CHECK(decode_bytes(out, back).kind == DecodeErrorKind::ChecksumMismatch);
}

TEST_CASE("a reply for another extended command is rejected") {
    Cdc2ReplyPacket<0x2F, Unit> reply;
    Bytes out;
    REQUIRE(into_encoded(reply, out) == EncodeError::None);

    Cdc2ReplyPacket<0x2E, Unit> back;
    DecodeError e = decode_bytes(out, back);
    CHECK(e.kind == DecodeErrorKind::UnexpectedId);
    CHECK(e.detail == 0x2F);
}

TEST_CASE("a reply on a plain command id is rejected") {
    Bytes b{0xAA, 0x55, 0xA4, 0x04, 0x2E, 0x76, 0x00, 0x00};
    Cdc2ReplyPacket<0x2E, Unit> back;
    DecodeError e = decode_bytes(b, back);
    CHECK(e.kind == DecodeErrorKind::UnexpectedId);
    CHECK(e.detail == 0xA4);
}

TEST_CASE("a reply too short to hold ext, ack and crc is truncated") {
    Bytes b{0xAA, 0x55, 0x56, 0x02, 0x2E, 0x76};
    Cdc2ReplyPacket<0x2E, Unit> back;
    CHECK(decode_bytes(b, back).kind == DecodeErrorKind::UnexpectedEnd);
}

TEST_CASE("every truncation of an extended reply is a decode error") {
    Value v;
    REQUIRE(Value::make("1234A", v) == EncodeError::None);
    Bytes frame;
    REQUIRE(into_encoded(Cdc2ReplyPacket<0x2E, Value>(v), frame) == EncodeError::None);

    for (std::size_t n = 0; n < frame.size(); ++n) {
        CAPTURE(n);
        Bytes prefix(frame.begin(), frame.begin() + static_cast<std::ptrdiff_t>(n));
        Cdc2ReplyPacket<0x2E, Value> back;
        CHECK(decode_bytes(prefix, back).kind == DecodeErrorKind::UnexpectedEnd);
    }
}

TEST_CASE("any single flipped bit in an extended reply is rejected") {
    Value v;
    REQUIRE(Value::make("1234A", v) == EncodeError::None);
    Bytes frame;
    REQUIRE(into_encoded(Cdc2ReplyPacket<0x2E, Value>(v), frame) == EncodeError::None);
    REQUIRE(frame[3] == 10);   // even size: flipping bit 0 asks for more bytes than exist

    for (std::size_t i = 0; i < frame.size(); ++i) {
        CAPTURE(i);
        Bytes bad = frame;
        bad[i] ^= 0x01;
        Cdc2ReplyPacket<0x2E, Value> back;
        CHECK_FALSE(decode_bytes(bad, back).ok());
    }
}
