// ============================================================================
// protocol.cpp - implementation for protocol.hpp
// Wire-string tables and the per-opcode response expectation table.
// ============================================================================

#include "usb2snes/protocol.hpp"

#include <utility>

namespace usb2snes {

// ---------------------------------------------------------------------------
// Opcode table
// ------------
// One row per opcode. The response column says what, if anything, the server
// sends back.
// ---------------------------------------------------------------------------
struct OpcodeRow {
  Opcode       op;
  const char*  name;
  ResponseKind response;
};

static constexpr OpcodeRow OPCODES[] = {
  { Opcode::Attach,     "Attach",     ResponseKind::None    },
  { Opcode::DeviceList, "DeviceList", ResponseKind::Results },
  { Opcode::GetAddress, "GetAddress", ResponseKind::Binary  },
  { Opcode::Info,       "Info",       ResponseKind::Results },
  { Opcode::List,       "List",       ResponseKind::Results },
  { Opcode::PutFile,    "PutFile",    ResponseKind::None    },
  { Opcode::Remove,     "Remove",     ResponseKind::None    },
};

static const OpcodeRow* find_row(Opcode op) {
  for (const auto& r : OPCODES) {
    if (r.op == op) return &r;
  }
  return nullptr;
}

const char* opcode_name(Opcode op) {
  const OpcodeRow* r = find_row(op);
  return r ? r->name : "?";
}

const char* space_name(Space sp) {
  switch (sp) {
    case Space::Snes: return "SNES";
  }
  return "?";
}

ResponseKind expected_response(Opcode op) {
  const OpcodeRow* r = find_row(op);
  return r ? r->response : ResponseKind::None;
}

FileType file_type_from_marker(const std::string& marker) {
  return marker == "0" ? FileType::Dir : FileType::File;
}

std::string to_hex(uint64_t value) {
  static const char* DIGITS = "0123456789ABCDEF";
  if (value == 0) return "0";

  char buf[16];
  int n = 0;
  while (value != 0) {                 // least significant nibble first
    buf[n++] = DIGITS[value & 0xF];
    value >>= 4;
  }

  std::string out;
  out.reserve(static_cast<std::size_t>(n));
  while (n > 0) out.push_back(buf[--n]);
  return out;
}

Request make_request(Opcode op) {
  Request r;
  r.opcode = op;
  r.space  = Space::Snes;
  return r;
}

Request make_request(Opcode op, std::vector<std::string> operands) {
  Request r = make_request(op);
  r.operands = std::move(operands);
  return r;
}

} // namespace usb2snes
