#pragma once

/**
 * @page v5-frame V5 Host Frame Recovery
 * @file frame.hpp
 * @brief Byte-at-a-time recovery of host-bound frames from a noisy stream.
 *
 * @details
 * OVERVIEW
 * --------
 * The V5 serial link has no out-of-band framing. Reply frames are delimited by
 * their own header and length field:
 *
 *   AA 55 | ID | VarU16(k) | k bytes
 *
 * A freshly opened port often carries boot chatter or the tail of an earlier
 * reply, so the decoder hunts for the AA 55 magic, then counts bytes using
 * the length field.
 *
 * DECODING RULES
 * --------------
 *   - Outside a frame every byte is ignored until AA is seen.
 *   - AA followed by anything other than 55 drops back to hunting. A second
 *     AA re-arms the magic match.
 *   - After the magic come the ID byte and a 1- or 2-byte VarU16 size.
 *   - Exactly size payload bytes follow. The frame completes on the last one.
 *   - The emitted frame contains the header too, so envelope decoders
 *     re-validate magic, ID and size on the same bytes.
 *
 * DESIGN NOTES
 * ------------
 * - State lives in the decoder instance so transports can feed whatever chunk
 *   sizes they receive.
 * - A frame is only delivered once complete. Partial frames are discarded by
 *   reset() when a receive deadline expires.
 *
 * EXAMPLE
 * -------
 * @code
 *   v5link::HostFrameDecoder dec;
 *   v5link::Bytes frame;
 *   for (uint8_t b : incoming_bytes) {
 *       if (dec.feed(b, frame)) {
 *           handle(frame);   // AA 55 ID size payload
 *       }
 *   }
 * @endcode
 */

#include "v5link/bytes.hpp"

#include <cstdint>
#include <utility>

namespace v5link {

class HostFrameDecoder {
public:
  /**
   * @brief Feed one byte; returns true when @p frame holds a complete frame.
   */
  bool feed(uint8_t b, Bytes& frame) {
    switch (state_) {
      case State::Hunt:
        if (b == 0xAA) { buf_.assign(1, b); state_ = State::Magic; }
        return false;

      case State::Magic:
        if (b == 0x55) { buf_.push_back(b); state_ = State::Id; }
        else if (b == 0xAA) { buf_.assign(1, b); }
        else reset();
        return false;

      case State::Id:
        buf_.push_back(b);
        state_ = State::Size1;
        return false;

      case State::Size1:
        buf_.push_back(b);
        if (b & 0x80) {
          remaining_ = static_cast<uint16_t>((b & 0x7F) << 8);
          state_ = State::Size2;
          return false;
        }
        remaining_ = b;
        return begin_payload(frame);

      case State::Size2:
        buf_.push_back(b);
        remaining_ = static_cast<uint16_t>(remaining_ | b);
        return begin_payload(frame);

      case State::Payload:
        buf_.push_back(b);
        if (--remaining_ == 0) return complete(frame);
        return false;
    }
    return false;
  }

  /// Drop any partial frame and go back to hunting for the magic.
  void reset() {
    buf_.clear();
    remaining_ = 0;
    state_ = State::Hunt;
  }

  bool in_frame() const { return state_ != State::Hunt; }

private:
  enum class State : uint8_t { Hunt, Magic, Id, Size1, Size2, Payload };

  bool begin_payload(Bytes& frame) {
    if (remaining_ == 0) return complete(frame);
    buf_.reserve(buf_.size() + remaining_);
    state_ = State::Payload;
    return false;
  }

  bool complete(Bytes& frame) {
    frame = std::move(buf_);
    reset();
    return true;
  }

  Bytes    buf_;
  uint16_t remaining_{0};
  State    state_{State::Hunt};
};

} // namespace v5link
