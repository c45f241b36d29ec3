#pragma once

/**
 * @file ws_frame.hpp
 * @brief Tiny RFC 6455 frame encoder/decoder for the USB2SNES WebSocket link.
 *
 * @details
 * OVERVIEW
 * --------
 * The USB2SNES control server speaks WebSocket. Each WebSocket frame carries a
 * small header (FIN bit, opcode, payload length, optional mask key) followed by
 * the payload. This header implements exactly what a client needs:
 *   - encode(): build one masked, unfragmented frame (clients must mask).
 *   - decoder:  stateful, byte-at-a-time parser for frames sent by the server.
 *
 * FRAME LAYOUT
 * ------------
 *   byte 0   FIN(1) RSV(3) OPCODE(4)
 *   byte 1   MASK(1) LEN7(7)
 *   LEN7 == 126  -> 2-byte big-endian length follows
 *   LEN7 == 127  -> 8-byte big-endian length follows
 *   MASK == 1    -> 4-byte mask key follows; payload[i] ^= key[i % 4]
 *
 * DESIGN NOTES
 * ------------
 * - State lives inside a decoder instance so the transport can feed bytes
 *   from a poll() loop without blocking and keep leftovers for the next frame.
 * - Message reassembly (continuation frames) is the transport's job; the
 *   decoder reports frames exactly as they appear on the wire.
 * - A frame larger than the decoder's limit, a non-minimal length encoding, a
 *   reserved bit, or an oversized/fragmented control frame is a protocol
 *   error: feed() returns false and error() becomes true until reset().
 */

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace usb2snes {
namespace ws {

/**
 * @name Frame opcodes
 * @{
 */
static constexpr uint8_t OP_CONTINUATION = 0x0;
static constexpr uint8_t OP_TEXT         = 0x1;
static constexpr uint8_t OP_BINARY       = 0x2;
static constexpr uint8_t OP_CLOSE        = 0x8;
static constexpr uint8_t OP_PING         = 0x9;
static constexpr uint8_t OP_PONG         = 0xA;
/** @} */

static constexpr uint8_t FLAG_FIN  = 0x80;
static constexpr uint8_t FLAG_RSV  = 0x70;
static constexpr uint8_t FLAG_MASK = 0x80;

/// Default ceiling for a single frame's payload (16 MiB).
static constexpr uint64_t DEFAULT_MAX_PAYLOAD = 16u * 1024u * 1024u;

inline bool is_control(uint8_t opcode) { return (opcode & 0x8) != 0; }

/// One decoded frame, payload already unmasked.
struct Frame {
  bool                 fin = true;
  uint8_t              opcode = OP_TEXT;
  std::vector<uint8_t> payload;
};

/**
 * @brief Encode one unfragmented, masked client frame.
 *
 * @param opcode  Frame opcode (OP_TEXT, OP_BINARY, OP_CLOSE, ...).
 * @param in      Payload bytes (may be null when @p n is 0).
 * @param n       Payload length.
 * @param mask    Mask key chosen by the caller (random per frame).
 * @param out     Receives the encoded frame. Cleared first.
 */
inline void encode(uint8_t opcode, const uint8_t* in, std::size_t n,
                   const std::array<uint8_t, 4>& mask, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n + 14);  // worst case header: 2 + 8 + 4

  out.push_back(static_cast<uint8_t>(FLAG_FIN | (opcode & 0x0F)));

  const uint64_t len = n;
  if (len < 126) {
    out.push_back(static_cast<uint8_t>(FLAG_MASK | len));
  } else if (len <= 0xFFFF) {
    out.push_back(static_cast<uint8_t>(FLAG_MASK | 126));
    out.push_back(static_cast<uint8_t>((len >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(len & 0xFF));
  } else {
    out.push_back(static_cast<uint8_t>(FLAG_MASK | 127));
    for (int i = 7; i >= 0; --i) {
      out.push_back(static_cast<uint8_t>((len >> (i * 8)) & 0xFF));
    }
  }

  out.insert(out.end(), mask.begin(), mask.end());
  for (std::size_t i = 0; i < n; ++i) {
    out.push_back(static_cast<uint8_t>(in[i] ^ mask[i % 4]));
  }
}

/**
 * @brief Stateful frame decoder for byte-at-a-time feeds.
 *
 * Usage:
 * @code
 *   usb2snes::ws::decoder dec;
 *   usb2snes::ws::Frame frame;
 *   for (uint8_t b : incoming_bytes) {
 *     if (dec.feed(b, frame)) handle(frame);
 *     else if (dec.error()) break;  // link is unusable
 *   }
 * @endcode
 */
class decoder {
public:
  explicit decoder(uint64_t max_payload = DEFAULT_MAX_PAYLOAD)
  : max_payload_(max_payload) {}

  /**
   * @brief Feed one byte; return true when it completes a frame.
   *
   * On true, @p frame holds the complete frame and the decoder is ready for
   * the next header. On protocol error, returns false and error() is set;
   * further bytes are ignored until reset().
   */
  bool feed(uint8_t b, Frame& frame) {
    if (error_) return false;

    switch (state_) {
      case State::Header0:
        if (b & FLAG_RSV) return set_error();           // no extensions negotiated
        cur_.fin = (b & FLAG_FIN) != 0;
        cur_.opcode = static_cast<uint8_t>(b & 0x0F);
        cur_.payload.clear();
        state_ = State::Header1;
        return false;

      case State::Header1: {
        masked_ = (b & FLAG_MASK) != 0;
        uint8_t len7 = static_cast<uint8_t>(b & 0x7F);
        if (is_control(cur_.opcode) && (!cur_.fin || len7 > 125)) return set_error();
        if (len7 == 126)      { ext_needed_ = 2; ext_got_ = 0; len_ = 0; state_ = State::ExtLen; }
        else if (len7 == 127) { ext_needed_ = 8; ext_got_ = 0; len_ = 0; state_ = State::ExtLen; }
        else                  { len_ = len7; return after_length(frame); }
        return false;
      }

      case State::ExtLen:
        len_ = (len_ << 8) | b;
        if (++ext_got_ < ext_needed_) return false;
        // Lengths must use the minimal encoding; 64-bit MSB must be clear.
        if (ext_needed_ == 2 && len_ < 126)                      return set_error();
        if (ext_needed_ == 8 && (len_ < 0x10000 || (len_ >> 63))) return set_error();
        return after_length(frame);

      case State::Mask:
        mask_[mask_got_++] = b;
        if (mask_got_ < 4) return false;
        return begin_payload(frame);

      case State::Payload: {
        std::size_t i = cur_.payload.size();
        cur_.payload.push_back(masked_ ? static_cast<uint8_t>(b ^ mask_[i % 4]) : b);
        if (cur_.payload.size() < len_) return false;
        return complete(frame);
      }
    }
    return false;
  }

  bool error() const { return error_; }

  /// True while a frame is partially decoded.
  bool in_frame() const { return state_ != State::Header0; }

  void reset() {
    state_ = State::Header0;
    error_ = false;
    cur_ = Frame{};
    len_ = 0;
    ext_needed_ = ext_got_ = mask_got_ = 0;
    masked_ = false;
  }

private:
  enum class State : uint8_t { Header0, Header1, ExtLen, Mask, Payload };

  bool set_error() {
    error_ = true;
    return false;
  }

  bool after_length(Frame& frame) {
    if (len_ > max_payload_) return set_error();
    if (masked_) {
      mask_got_ = 0;
      state_ = State::Mask;
      return false;
    }
    return begin_payload(frame);
  }

  bool begin_payload(Frame& frame) {
    if (len_ == 0) return complete(frame);
    cur_.payload.reserve(static_cast<std::size_t>(len_));
    state_ = State::Payload;
    return false;
  }

  bool complete(Frame& frame) {
    frame = std::move(cur_);
    cur_ = Frame{};
    state_ = State::Header0;
    return true;
  }

  State    state_ = State::Header0;
  bool     error_ = false;
  Frame    cur_;
  uint64_t len_ = 0;
  uint64_t max_payload_;
  uint8_t  ext_needed_ = 0;
  uint8_t  ext_got_ = 0;
  bool     masked_ = false;
  std::array<uint8_t, 4> mask_{};
  uint8_t  mask_got_ = 0;
};

} // namespace ws
} // namespace usb2snes
