#pragma once
/**
 * @file transport_websocket.hpp
 * @brief POSIX WebSocket client transport (RFC 6455, ws:// only).
 *
 * @details
 * PURPOSE
 * -------
 * The USB2SNES control server (QUsb2Snes, usb2snes, emulator bridges) listens
 * on a local WebSocket endpoint, usually ws://localhost:8080 or :23074. This
 * transport opens a TCP socket, performs the HTTP/1.1 Upgrade handshake, and
 * then moves whole text/binary messages in and out.
 *
 * HOW IT FITS TOGETHER
 * --------------------
 *   Session -> WebSocketTransport::send()/recv() -> ws_frame.hpp (framing)
 *                                                \-> transport_websocket.cpp (syscalls)
 *
 * OPERATIONAL NOTES
 * -----------------
 * - Timeouts: every blocking step (connect, handshake, one send, one recv) is
 *   bounded by poll(). Expiry is reported as RxResult::Timeout / TxResult::Error
 *   with last_error() == "timeout".
 * - Control frames are handled internally: pings are answered with pongs,
 *   pongs are dropped, a close frame from the server ends the stream
 *   (recv() returns Closed from then on).
 * - Fragmented messages are reassembled before they are handed to the caller.
 *   A single frame or a reassembled message larger than
 *   Config::max_message_bytes fails with "bad_frame" / "message_too_large".
 * - No TLS: wss:// is refused at open().
 * - Concurrency: one thread per transport. No internal locking.
 *
 * DEPENDENCIES
 * ------------
 * - ws_frame.hpp: frame encoder and bytewise decoder.
 * - OpenSSL libcrypto: SHA-1 and base64 for Sec-WebSocket-Accept.
 */

#if !defined(__linux__) && !defined(__APPLE__)
#  error "transport_websocket.hpp needs POSIX sockets."
#endif

#include "usb2snes/transport/transport_base.hpp"
#include "usb2snes/ws_frame.hpp"

#include <array>
#include <chrono>
#include <cstdint>
#include <random>
#include <string>
#include <vector>

namespace usb2snes::transport {

/// Pieces of a ws:// URI.
struct WsUri {
  std::string host;
  uint16_t    port{80};
  std::string path{"/"};
};

/**
 * @brief Split "ws://host[:port][/path]" into its parts.
 *
 * Accepts bracketed IPv6 literals ("ws://[::1]:8080"). Rejects other schemes,
 * including wss://, an empty host, and a port outside 1..65535.
 *
 * @return true on success; false with a reason tag in @p err.
 */
bool parse_ws_uri(const std::string& uri, WsUri& out, std::string& err);

/// Expected Sec-WebSocket-Accept value for a given Sec-WebSocket-Key.
std::string websocket_accept_for(const std::string& key);

class WebSocketTransport : public ITransport {
public:
  WebSocketTransport();
  ~WebSocketTransport() override;

  WebSocketTransport(const WebSocketTransport&) = delete;
  WebSocketTransport& operator=(const WebSocketTransport&) = delete;

  bool        open(const Config& cfg) override;
  void        close() override;
  bool        is_open() const override { return fd_ >= 0; }
  TxResult    send(FrameKind kind, const uint8_t* data, std::size_t len) override;
  TxResult    flush() override;
  RxResult    recv(DataFrame& out) override;
  const char* name() const override { return "websocket"; }
  const std::string& last_error() const override { return last_error_; }

private:
  using Clock = std::chrono::steady_clock;

  bool connect_socket(const WsUri& u, int timeout_ms);
  bool handshake(const WsUri& u, int timeout_ms);
  TxResult send_raw_frame(uint8_t opcode, const uint8_t* data, std::size_t len);
  bool write_all(const uint8_t* data, std::size_t len, int timeout_ms);
  RxResult fill(Clock::time_point deadline, bool has_deadline);
  RxResult next_frame(ws::Frame& frame, Clock::time_point deadline, bool has_deadline);
  void release();
  bool set_error(const std::string& why);

  int fd_{-1};
  Config cfg_;
  std::string last_error_;

  ws::decoder dec_;
  std::vector<uint8_t> rx_;       // bytes read but not yet fed to dec_
  std::size_t rx_pos_{0};

  bool close_sent_{false};
  bool close_received_{false};

  std::mt19937 rng_;
};

} // namespace usb2snes::transport
