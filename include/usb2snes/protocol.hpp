#pragma once
/**
 * @file protocol.hpp
 * @brief USB2SNES control-channel vocabulary: opcodes, spaces, requests, listings.
 *
 * @details
 * PURPOSE
 * -------
 * Everything the host says to the device on the control channel is one
 * Request, serialized as a single JSON object per text frame:
 *
 *   {"Opcode":"List","Space":"SNES","Operands":["/roms"]}
 *
 * Everything the device says back (for opcodes that answer at all) is one
 * Results object:
 *
 *   {"Results":["0","roms","1","boot.sfc"]}
 *
 * This header holds the closed enumerations, their wire strings, and the
 * per-opcode response expectation table. JSON handling lives in codec.hpp.
 *
 * WIRE RULES
 * ----------
 * - Field order is fixed: Opcode, Space, Flags, Operands.
 * - Flags/Operands are omitted entirely when unset (never null, never []).
 * - Numeric operands are uppercase hex, no "0x", no zero padding.
 * - Responses carry no request id. Correlation is arrival order only, so a
 *   new request must never be sent while a response is outstanding.
 */

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace usb2snes {

/// Operation performed by a control request.
enum class Opcode : uint8_t {
  Attach,
  DeviceList,
  GetAddress,
  Info,
  List,
  PutFile,
  Remove,
};

/// Addressable resource domain targeted by an opcode.
enum class Space : uint8_t {
  Snes,
};

/**
 * @brief What the device sends back after a request with a given opcode.
 *
 * - Results: exactly one {"Results":[...]} text frame.
 * - Binary:  raw binary frames until the requested byte count is reached.
 * - None:    nothing. The device does not acknowledge the command.
 */
enum class ResponseKind : uint8_t {
  None,
  Results,
  Binary,
};

enum class FileType : uint8_t {
  File,
  Dir,
};

/// One entry of a directory listing, in device-reported order.
struct FileInfo {
  FileType    type{FileType::File};
  std::string name;

  bool operator==(const FileInfo& o) const { return type == o.type && name == o.name; }
};

/// A control-channel request. Unset flags/operands are not serialized.
struct Request {
  Opcode opcode{Opcode::DeviceList};
  Space  space{Space::Snes};
  std::optional<std::vector<std::string>> flags;
  std::optional<std::vector<std::string>> operands;
};

/// Exact wire identifier of an opcode ("DeviceList", "GetAddress", ...).
const char* opcode_name(Opcode op);

/// Exact wire identifier of a space ("SNES").
const char* space_name(Space sp);

/// Static response expectation for @p op.
ResponseKind expected_response(Opcode op);

/// Directory-entry marker used in listings: "0" means Dir.
FileType file_type_from_marker(const std::string& marker);

/**
 * @brief Uppercase hexadecimal, no prefix, no leading zero padding.
 *
 * Examples: 0 -> "0", 4096 -> "1000", 0xE07080 -> "E07080".
 */
std::string to_hex(uint64_t value);

/// Build a request in the SNES space with no flags. The first overload leaves
/// operands unset; the second sets them (even when empty).
Request make_request(Opcode op);
Request make_request(Opcode op, std::vector<std::string> operands);

/// Maximum payload of one upload frame.
static constexpr std::size_t PUT_CHUNK_SIZE = 1024;

} // namespace usb2snes
