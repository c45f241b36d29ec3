/**
 * @file session.hpp
 * @brief usb2snes Session - one connection to a USB2SNES control server.
 *
 * @details
 * ## Field Brief
 * A Session owns exactly one transport and the attachment state that goes
 * with it. Every public call is one blocking round-trip: build a Request,
 * send one text frame, then (depending on the opcode) read one Results frame,
 * read binary frames until a byte count is met, or read nothing at all.
 *
 * ---
 *
 * @par Operational Model
 * ```
 *  caller            Session                         transport
 *    │  get_info()      │                                 │
 *    │ ───────────────► │ encode {"Opcode":"Info",...} ──► send(Text)
 *    │                  │                                 │
 *    │                  │ ◄── recv() until one frame decodes as Results
 *    │ ◄─────────────── │ results
 *
 *    │  read_mem(a, n)  │ {"Opcode":"GetAddress",...} ──► send(Text)
 *    │                  │ ◄── recv() Binary, Binary, ... until n bytes
 *
 *    │  put_file(p, d)  │ {"Opcode":"PutFile",...}   ──► send(Text)
 *    │                  │ d[0..1024) ──► send(Binary), flush
 *    │                  │ d[1024..)  ──► send(Binary), flush ...
 * ```
 *
 * @par State Machine
 * ```
 *   Disconnected ──connect──► Connected ──attach(dev)──► Attached
 *        ▲                        │                         │
 *        └────────── close ───────┴─────────── close ───────┘
 * ```
 * - `get_info()` requires Attached; it fails with NotAttached before any I/O.
 * - Everything else requires Connected or Attached.
 * - There is no detach. Attaching again while Attached simply re-sends Attach
 *   and records the new device; the server decides what that means.
 *
 * ---
 *
 * @par Correlation Discipline
 * Responses carry no id. They are matched to requests purely by arrival
 * order, so a Session never has more than one request outstanding: each call
 * consumes its whole response before it returns. Opcodes that the server
 * never answers (Attach, Remove, PutFile) return as soon as the frame is
 * flushed; see expected_response() in protocol.hpp.
 *
 * @par Failure Model
 * - Transport:   connect/send/recv failure or timeout. Propagated, not retried.
 * - Encoding:    request could not be serialized. Programming error.
 * - Protocol:    stream ended before a decodable Results frame, a download
 *                ended short or overran, or a listing had odd length. The
 *                session should be closed.
 * - NotAttached: get_info() before attach(). Safe to retry after attaching.
 * There is no partial success: a failed read_mem() leaves its output empty.
 *
 * @par Upload Completion
 * PutFile is never acknowledged. await_completion() issues a harmless List
 * round-trip so that, by the time it returns, the server has at least
 * processed everything sent before it. It is a best-effort barrier, not a
 * guarantee that the file has been committed to the cart's storage.
 */
#ifndef USB2SNES_SESSION_HPP
#define USB2SNES_SESSION_HPP

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "usb2snes/error.hpp"
#include "usb2snes/protocol.hpp"
#include "usb2snes/transport/transport_base.hpp"

namespace usb2snes {

enum class SessionState : uint8_t {
  Disconnected,
  Connected,
  Attached,
};

const char* state_name(SessionState s);

/// Timeouts applied by connect(uri, ...).
struct Options {
  int connect_timeout_ms{3000};
  int io_timeout_ms{5000};
};

class Session {
public:
  /**
   * @brief Wrap an already-open transport. State is Connected when
   *        @p transport is non-null and open, Disconnected otherwise.
   */
  explicit Session(std::unique_ptr<transport::ITransport> transport);
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Send a protocol-level close and release the transport. Single-use.
  bool close(Error& err);

  /// Bind to @p device. Fire-and-forget: no response is read.
  bool attach(const std::string& device, Error& err);

  /// Device identifiers known to the server, in the order it reports them.
  bool get_device_list(std::vector<std::string>& out, Error& err);

  /// Free-form info strings from the attached device (firmware, ROM, flags).
  bool get_info(std::vector<std::string>& out, Error& err);

  /// Directory listing. Trailing '/' is stripped from @p path before sending.
  bool list_files(const std::string& path, std::vector<FileInfo>& out, Error& err);

  /// Delete a file or empty directory on the device. No response is read.
  bool remove(const std::string& path, Error& err);

  /// Upload @p len bytes to @p remote_path in frames of at most PUT_CHUNK_SIZE.
  bool put_file(const std::string& remote_path, const uint8_t* data, std::size_t len, Error& err);
  bool put_file(const std::string& remote_path, const std::vector<uint8_t>& data, Error& err);

  /// Read exactly @p length bytes of device memory starting at @p address.
  bool read_mem(uint32_t address, std::size_t length, std::vector<uint8_t>& out, Error& err);

  /// Best-effort barrier after put_file(); see the class notes.
  bool await_completion(Error& err);

  SessionState state() const { return state_; }
  bool attached() const { return state_ == SessionState::Attached; }

  /// Device passed to the last attach(); empty unless Attached.
  const std::string& device() const { return device_; }

private:
  bool require_connected(Opcode op, Error& err) const;
  bool send_request(const Request& req, Error& err);
  bool send_binary(Opcode op, const uint8_t* data, std::size_t len, Error& err);
  bool recv_results(Opcode op, std::vector<std::string>& out, Error& err);
  bool round_trip(const Request& req, std::vector<std::string>* results, Error& err);
  bool transport_failure(Opcode op, const char* what, Error& err) const;

  std::unique_ptr<transport::ITransport> transport_;
  SessionState state_{SessionState::Disconnected};
  std::string  device_;
};

/**
 * @brief Open a WebSocket session to @p uri (e.g. "ws://localhost:8080").
 * @return The session in state Connected, or nullptr with @p err filled.
 */
std::unique_ptr<Session> connect(const std::string& uri, Error& err, const Options& opts = {});

/**
 * @brief Open a session over a caller-supplied transport.
 *
 * @p transport is opened with @p cfg unless it is already open.
 */
std::unique_ptr<Session> connect(std::unique_ptr<transport::ITransport> transport,
                                 const transport::Config& cfg, Error& err);

} // namespace usb2snes

#endif // USB2SNES_SESSION_HPP
