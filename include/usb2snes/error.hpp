#pragma once
/**
 * @file error.hpp
 * @brief Error value filled by every fallible usb2snes operation.
 *
 * @details
 * No exceptions are thrown by the library. Every operation returns bool and,
 * on false, fills an Error out-parameter with:
 *   - kind:   which class of failure (drives the caller's retry decision),
 *   - op:     the opcode being attempted, when there was one,
 *   - reason: a short machine-friendly tag ("timeout", "short_read", ...),
 *   - detail: free text for humans (errno string, byte counts, ...).
 *
 * Kinds:
 *   Transport   connect/send/receive/close failure or timeout. Not retried.
 *   Encoding    request serialization failed. A programming error.
 *   Protocol    no decodable response before end of stream, a download that
 *               ended early, or a malformed listing. Close the session.
 *   NotAttached Info was requested before attach(). Detected before any I/O;
 *               safe to retry after attaching.
 *   Io          local file access in the CLI. Never raised by the library.
 *
 * describe() renders the key=value status line used by the CLI:
 *   status=error kind=protocol op=GetAddress reason=short_read detail=got 12 of 64
 */

#include <optional>
#include <string>

#include "usb2snes/protocol.hpp"

namespace usb2snes {

enum class ErrorKind : uint8_t {
  None = 0,
  Transport,
  Encoding,
  Protocol,
  NotAttached,
  Io,
};

struct Error {
  ErrorKind             kind{ErrorKind::None};
  std::optional<Opcode> op;
  std::string           reason;
  std::string           detail;

  explicit operator bool() const { return kind != ErrorKind::None; }

  void clear() { *this = Error{}; }
};

/// Short name of an error kind ("transport", "protocol", ...).
const char* kind_name(ErrorKind kind);

/// Fill @p err and return false, so failure paths read `return fail(err, ...);`.
bool fail(Error& err, ErrorKind kind, std::optional<Opcode> op,
          std::string reason, std::string detail = {});

/// One-line "status=error kind=... op=... reason=... detail=..." rendering.
std::string describe(const Error& err);

} // namespace usb2snes
