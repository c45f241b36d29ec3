// ============================================================================
// error.cpp - implementation for error.hpp
// ============================================================================

#include "usb2snes/error.hpp"

#include <utility>

namespace usb2snes {

const char* kind_name(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::None:        return "none";
    case ErrorKind::Transport:   return "transport";
    case ErrorKind::Encoding:    return "encoding";
    case ErrorKind::Protocol:    return "protocol";
    case ErrorKind::NotAttached: return "not_attached";
    case ErrorKind::Io:          return "io";
  }
  return "?";
}

bool fail(Error& err, ErrorKind kind, std::optional<Opcode> op,
          std::string reason, std::string detail) {
  err.kind   = kind;
  err.op     = op;
  err.reason = std::move(reason);
  err.detail = std::move(detail);
  return false;
}

std::string describe(const Error& err) {
  std::string s = "status=error kind=";
  s += kind_name(err.kind);
  if (err.op) {
    s += " op=";
    s += opcode_name(*err.op);
  }
  if (!err.reason.empty()) {
    s += " reason=";
    s += err.reason;
  }
  if (!err.detail.empty()) {
    s += " detail=";
    s += err.detail;
  }
  return s;
}

} // namespace usb2snes
