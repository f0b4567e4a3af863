#include <doctest/doctest.h>
#include "v5link/frame.hpp"

#include <vector>

using namespace v5link;

static std::vector<Bytes> feed_all(HostFrameDecoder& dec, const Bytes& stream) {
    std::vector<Bytes> frames;
    Bytes frame;
    for (uint8_t b : stream) {
        if (dec.feed(b, frame)) frames.push_back(frame);
    }
    return frames;
}

TEST_CASE("frame decoder skips noise before the magic") {
    HostFrameDecoder dec;
    auto frames = feed_all(dec, Bytes{0x00, 0x13, 0xAA, 0x00, 0xAA, 0x55, 0xA4, 0x02, 0x01, 0x02});
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == Bytes{0xAA, 0x55, 0xA4, 0x02, 0x01, 0x02});
    CHECK_FALSE(dec.in_frame());
}

TEST_CASE("a repeated AA re-arms the magic match") {
    HostFrameDecoder dec;
    auto frames = feed_all(dec, Bytes{0xAA, 0xAA, 0x55, 0x01, 0x00});
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == Bytes{0xAA, 0x55, 0x01, 0x00});
}

TEST_CASE("two-byte size fields are honoured") {
    Bytes stream{0xAA, 0x55, 0x56, 0x80, 0xC8};
    stream.insert(stream.end(), 200, 0x7E);
    HostFrameDecoder dec;
    auto frames = feed_all(dec, stream);
    REQUIRE(frames.size() == 1);
    CHECK(frames[0].size() == 205);
}

TEST_CASE("back-to-back frames come out separately") {
    HostFrameDecoder dec;
    auto frames = feed_all(dec, Bytes{0xAA, 0x55, 0x01, 0x01, 0x10, 0xAA, 0x55, 0x02, 0x01, 0x20});
    REQUIRE(frames.size() == 2);
    CHECK(frames[0] == Bytes{0xAA, 0x55, 0x01, 0x01, 0x10});
    CHECK(frames[1] == Bytes{0xAA, 0x55, 0x02, 0x01, 0x20});
}

TEST_CASE("payload bytes equal to the magic do not restart the frame") {
    HostFrameDecoder dec;
    auto frames = feed_all(dec, Bytes{0xAA, 0x55, 0x01, 0x02, 0xAA, 0x55});
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == Bytes{0xAA, 0x55, 0x01, 0x02, 0xAA, 0x55});
}

TEST_CASE("reset drops a partial frame") {
    HostFrameDecoder dec;
    Bytes frame;
    for (uint8_t b : Bytes{0xAA, 0x55, 0x01, 0x05, 0x01}) CHECK_FALSE(dec.feed(b, frame));
    CHECK(dec.in_frame());
    dec.reset();
    CHECK_FALSE(dec.in_frame());

    auto frames = feed_all(dec, Bytes{0x02, 0x03, 0xAA, 0x55, 0x01, 0x00});
    REQUIRE(frames.size() == 1);
    CHECK(frames[0] == Bytes{0xAA, 0x55, 0x01, 0x00});
}
