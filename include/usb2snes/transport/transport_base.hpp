#pragma once
/**
 * @file transport_base.hpp
 * @brief Minimal, Session-agnostic frame transport interface for usb2snes.
 *
 * Header-only. The Session needs nothing more than: open, send a tagged frame,
 * flush, receive the next data frame, close.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace usb2snes::transport {

// Return codes kept simple; detail goes to last_error().
enum class TxResult : uint8_t { Ok=0, Error=1 };
enum class RxResult : uint8_t { Ok=0, Closed=1, Timeout=2, Error=3 };

enum class FrameKind : uint8_t { Text=0, Binary=1 };

/// One data frame as seen by the Session (control frames never surface here).
struct DataFrame {
  FrameKind            kind{FrameKind::Text};
  std::vector<uint8_t> data;

  std::string text() const { return std::string(data.begin(), data.end()); }
};

struct Config {
  std::string uri;                   // e.g. ws://localhost:8080
  int connect_timeout_ms{3000};
  int io_timeout_ms{5000};           // per blocking step; <0 waits forever
  std::size_t max_message_bytes{16u * 1024u * 1024u};  // one frame or one reassembled message
};

/**
 * @brief Transport trait every Session backend relies on.
 *
 * Contract:
 *  - open(cfg) connects; false on failure (see last_error()).
 *  - send(kind, buf, len) writes one complete frame; returns only once the
 *    frame has been handed to the OS in full.
 *  - flush() pushes anything buffered; a no-op for unbuffered transports.
 *  - recv(out) blocks up to io_timeout_ms for the next text/binary frame.
 *    Closed means the peer ended the stream (no more frames, ever).
 *  - close() sends a protocol-level close if possible and releases resources.
 *  - name() is a short identifier for logs/diagnostics.
 */
class ITransport {
public:
  virtual ~ITransport() = default;
  virtual bool        open(const Config& cfg) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual TxResult    send(FrameKind kind, const uint8_t* data, std::size_t len) = 0;
  virtual TxResult    flush() = 0;
  virtual RxResult    recv(DataFrame& out) = 0;
  virtual const char* name() const = 0;
  virtual const std::string& last_error() const = 0;
};

} // namespace usb2snes::transport
