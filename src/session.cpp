// ============================================================================
// session.cpp - usb2snes::Session implementation
// ----------------------------------------------------------------------------
// NOTE: The public contract and the state machine are documented in
// session.hpp. Comments here focus on the wire-level ordering rules.
// ============================================================================

#include "usb2snes/session.hpp"

#include <algorithm>
#include <cstring>
#include <utility>

#include "usb2snes/codec.hpp"
#include "usb2snes/log.hpp"
#include "usb2snes/transport/transport_websocket.hpp"

namespace usb2snes {

using transport::DataFrame;
using transport::FrameKind;
using transport::RxResult;
using transport::TxResult;

static const char* TAG = "session";

const char* state_name(SessionState s) {
  switch (s) {
    case SessionState::Disconnected: return "disconnected";
    case SessionState::Connected:    return "connected";
    case SessionState::Attached:     return "attached";
  }
  return "?";
}

// ---------------------------------------------------------------------------
// Lifetime
// ---------------------------------------------------------------------------

Session::Session(std::unique_ptr<transport::ITransport> transport)
: transport_(std::move(transport)) {
  if (transport_ && transport_->is_open()) state_ = SessionState::Connected;
}

Session::~Session() {
  if (transport_ && transport_->is_open()) transport_->close();
}

bool Session::close(Error& err) {
  if (state_ == SessionState::Disconnected || !transport_) {
    return fail(err, ErrorKind::Transport, std::nullopt, "not_connected");
  }
  transport_->close();
  state_ = SessionState::Disconnected;
  device_.clear();
  U2S_LOGD(TAG, "closed");
  return true;
}

// ---------------------------------------------------------------------------
// Control channel plumbing
// ---------------------------------------------------------------------------

bool Session::require_connected(Opcode op, Error& err) const {
  if (state_ == SessionState::Disconnected || !transport_) {
    return fail(err, ErrorKind::Transport, op, "not_connected");
  }
  return true;
}

// Map the transport's last_error() onto an Error. "timeout" keeps its own
// reason tag so callers can tell a stalled device from a dead socket.
bool Session::transport_failure(Opcode op, const char* what, Error& err) const {
  const std::string& why = transport_->last_error();
  U2S_LOGW(TAG, "%s %s over %s: %s", opcode_name(op), what, transport_->name(), why.c_str());
  return fail(err, ErrorKind::Transport, op, why == "timeout" ? "timeout" : what, why);
}

bool Session::send_request(const Request& req, Error& err) {
  std::string text, why;
  if (!codec::encode_request(req, text, why)) {
    return fail(err, ErrorKind::Encoding, req.opcode, "encode_failed", why);
  }

  U2S_LOGD(TAG, "-> %s", text.c_str());
  if (transport_->send(FrameKind::Text, reinterpret_cast<const uint8_t*>(text.data()),
                       text.size()) != TxResult::Ok) {
    return transport_failure(req.opcode, "send_failed", err);
  }
  return true;
}

bool Session::send_binary(Opcode op, const uint8_t* data, std::size_t len, Error& err) {
  if (transport_->send(FrameKind::Binary, data, len) != TxResult::Ok) {
    return transport_failure(op, "send_failed", err);
  }
  if (transport_->flush() != TxResult::Ok) {
    return transport_failure(op, "flush_failed", err);
  }
  return true;
}

// ---------------------------------------------------------------------------
// recv_results()
// --------------
// Pull frames until one decodes as {"Results":[...]}. Text and binary frames
// are both tried (some servers send JSON in binary frames); anything that
// does not decode is skipped. End of stream first is a protocol error.
// ---------------------------------------------------------------------------
bool Session::recv_results(Opcode op, std::vector<std::string>& out, Error& err) {
  while (true) {
    DataFrame frame;
    RxResult r = transport_->recv(frame);
    switch (r) {
      case RxResult::Ok: {
        auto results = codec::decode_results(frame.text());
        if (results) {
          U2S_LOGD(TAG, "<- %s: %zu result(s)", opcode_name(op), results->size());
          out = std::move(*results);
          return true;
        }
        U2S_LOGD(TAG, "skipping undecodable %s frame (%zu bytes)",
                 frame.kind == FrameKind::Text ? "text" : "binary", frame.data.size());
        continue;
      }
      case RxResult::Closed:
        U2S_LOGW(TAG, "%s: stream ended before a response", opcode_name(op));
        return fail(err, ErrorKind::Protocol, op, "no_message", "no message");
      case RxResult::Timeout:
      case RxResult::Error:
        return transport_failure(op, "recv_failed", err);
    }
  }
}

// ---------------------------------------------------------------------------
// round_trip()
// ------------
// Send one request and consume exactly what the opcode's response table
// entry says the server will send back. Binary responses are handled by the
// caller (read_mem) because only it knows the byte count.
// ---------------------------------------------------------------------------
bool Session::round_trip(const Request& req, std::vector<std::string>* results, Error& err) {
  if (!send_request(req, err)) return false;

  switch (expected_response(req.opcode)) {
    case ResponseKind::Results: {
      std::vector<std::string> discard;
      return recv_results(req.opcode, results ? *results : discard, err);
    }
    case ResponseKind::None:
      if (transport_->flush() != TxResult::Ok) return transport_failure(req.opcode, "flush_failed", err);
      return true;
    case ResponseKind::Binary:
      return true;
  }
  return true;
}

// ---------------------------------------------------------------------------
// Device operations
// ---------------------------------------------------------------------------

bool Session::attach(const std::string& device, Error& err) {
  if (!require_connected(Opcode::Attach, err)) return false;
  if (!round_trip(make_request(Opcode::Attach, {device}), nullptr, err)) return false;

  state_  = SessionState::Attached;
  device_ = device;
  U2S_LOGI(TAG, "attached to %s", device.c_str());
  return true;
}

bool Session::get_device_list(std::vector<std::string>& out, Error& err) {
  if (!require_connected(Opcode::DeviceList, err)) return false;
  return round_trip(make_request(Opcode::DeviceList), &out, err);
}

bool Session::get_info(std::vector<std::string>& out, Error& err) {
  if (!require_connected(Opcode::Info, err)) return false;
  if (state_ != SessionState::Attached) {
    return fail(err, ErrorKind::NotAttached, Opcode::Info, "not_attached",
                "attach to a device first");
  }
  return round_trip(make_request(Opcode::Info), &out, err);
}

// ---------------------------------------------------------------------------
// File operations
// ---------------------------------------------------------------------------

bool Session::list_files(const std::string& path, std::vector<FileInfo>& out, Error& err) {
  out.clear();
  if (!require_connected(Opcode::List, err)) return false;

  std::vector<std::string> results;
  if (!round_trip(make_request(Opcode::List, {codec::normalize_path(path)}), &results, err)) {
    return false;
  }
  if (!codec::decode_file_list(results, out)) {
    return fail(err, ErrorKind::Protocol, Opcode::List, "odd_listing",
                std::to_string(results.size()) + " strings");
  }
  return true;
}

bool Session::remove(const std::string& path, Error& err) {
  if (!require_connected(Opcode::Remove, err)) return false;
  return round_trip(make_request(Opcode::Remove, {path}), nullptr, err);
}

// ---------------------------------------------------------------------------
// put_file()
// ----------
// PutFile [path, HEX(len)], then the data in order as binary frames of at
// most PUT_CHUNK_SIZE bytes. Each frame is flushed before the next is queued:
// the device consumes frames as they arrive and has no way to push back.
// ---------------------------------------------------------------------------
bool Session::put_file(const std::string& remote_path, const uint8_t* data, std::size_t len, Error& err) {
  if (!require_connected(Opcode::PutFile, err)) return false;
  if (!round_trip(make_request(Opcode::PutFile, {remote_path, to_hex(len)}), nullptr, err)) {
    return false;
  }

  std::size_t frames = 0;
  for (std::size_t off = 0; off < len; off += PUT_CHUNK_SIZE) {
    std::size_t n = std::min(PUT_CHUNK_SIZE, len - off);
    if (!send_binary(Opcode::PutFile, data + off, n, err)) return false;
    ++frames;
  }

  U2S_LOGD(TAG, "put %s: %zu bytes in %zu frame(s)", remote_path.c_str(), len, frames);
  return true;
}

bool Session::put_file(const std::string& remote_path, const std::vector<uint8_t>& data, Error& err) {
  return put_file(remote_path, data.data(), data.size(), err);
}

bool Session::await_completion(Error& err) {
  std::vector<FileInfo> ignored;
  return list_files("", ignored, err);
}

// ---------------------------------------------------------------------------
// read_mem()
// ----------
// GetAddress [HEX(address), HEX(length)], then accumulate binary payloads at
// the running offset until exactly `length` bytes are in. The server splits
// the data however it likes; text frames in between are ignored.
// ---------------------------------------------------------------------------
bool Session::read_mem(uint32_t address, std::size_t length, std::vector<uint8_t>& out, Error& err) {
  out.clear();
  if (!require_connected(Opcode::GetAddress, err)) return false;
  if (length == 0) return true;

  if (!round_trip(make_request(Opcode::GetAddress, {to_hex(address), to_hex(length)}), nullptr, err)) {
    return false;
  }

  std::vector<uint8_t> buf(length);
  std::size_t got = 0;
  std::size_t frames = 0;

  while (got < length) {
    DataFrame frame;
    RxResult r = transport_->recv(frame);

    if (r == RxResult::Closed) {
      return fail(err, ErrorKind::Protocol, Opcode::GetAddress, "short_read",
                  "got " + std::to_string(got) + " of " + std::to_string(length));
    }
    if (r != RxResult::Ok) return transport_failure(Opcode::GetAddress, "recv_failed", err);

    if (frame.kind != FrameKind::Binary) {
      U2S_LOGD(TAG, "ignoring text frame during GetAddress");
      continue;
    }
    if (frame.data.size() > length - got) {
      return fail(err, ErrorKind::Protocol, Opcode::GetAddress, "overrun",
                  std::to_string(got + frame.data.size()) + " bytes for " + std::to_string(length));
    }

    std::memcpy(buf.data() + got, frame.data.data(), frame.data.size());
    got += frame.data.size();
    ++frames;
  }

  U2S_LOGD(TAG, "read %s: %zu bytes in %zu frame(s)", to_hex(address).c_str(), length, frames);
  out = std::move(buf);
  return true;
}

// ---------------------------------------------------------------------------
// connect()
// ---------------------------------------------------------------------------

std::unique_ptr<Session> connect(std::unique_ptr<transport::ITransport> transport,
                                 const transport::Config& cfg, Error& err) {
  if (!transport) {
    fail(err, ErrorKind::Transport, std::nullopt, "no_transport");
    return nullptr;
  }
  if (!transport->is_open() && !transport->open(cfg)) {
    const std::string& why = transport->last_error();
    fail(err, ErrorKind::Transport, std::nullopt,
         why == "timeout" ? "timeout" : "connect_failed", why);
    return nullptr;
  }
  return std::make_unique<Session>(std::move(transport));
}

std::unique_ptr<Session> connect(const std::string& uri, Error& err, const Options& opts) {
  transport::Config cfg;
  cfg.uri = uri;
  cfg.connect_timeout_ms = opts.connect_timeout_ms;
  cfg.io_timeout_ms = opts.io_timeout_ms;
  return connect(std::make_unique<transport::WebSocketTransport>(), cfg, err);
}

} // namespace usb2snes
