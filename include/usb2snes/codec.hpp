#pragma once
/**
 * @file codec.hpp
 * @brief JSON encode/decode for the USB2SNES control channel.
 *
 * @details
 *   The codec centralizes all conversion between control-channel text and the
 *   request/response types of protocol.hpp:
 *     - Serializing a Request into one JSON text frame (@c encode_request).
 *     - Parsing a {"Results":[...]} frame into a string sequence (@c decode_results).
 *     - Turning a flat listing sequence into FileInfo entries (@c decode_file_list).
 *     - Stripping trailing separators from listing paths (@c normalize_path).
 *
 *   ## Backend
 *   Uses [nlohmann::json](https://github.com/nlohmann/json). Requests are built
 *   with @c nlohmann::ordered_json so the wire field order is insertion order
 *   (Opcode, Space, Flags, Operands) rather than sorted key order.
 *
 *   ## Error Suppression
 *   Like the rest of the library, nothing here throws. Decoders return
 *   @c std::nullopt / @c false; the encoder returns @c false with a reason.
 */

#include <optional>
#include <string>
#include <vector>

#include "usb2snes/protocol.hpp"

namespace usb2snes {
namespace codec {

/**
 * @brief Serialize a Request to JSON.
 * @param req     Request to encode.
 * @param out     Receives the JSON text on success.
 * @param err     Receives a short description on failure (e.g. invalid UTF-8 in an operand).
 * @param indent  -1 for the single-line wire form; >=0 pretty-prints with that indent.
 * @return true on success.
 */
bool encode_request(const Request& req, std::string& out, std::string& err, int indent = -1);

/**
 * @brief Parse a Results document.
 * @param text  Frame contents.
 * @return The "Results" array on success; std::nullopt when the text is not JSON,
 *         not an object, lacks "Results", or holds a non-string element.
 */
std::optional<std::vector<std::string>> decode_results(const std::string& text);

/**
 * @brief Decode a listing into FileInfo entries by non-overlapping pairs.
 * @param results  Flat sequence (type_marker, name, type_marker, name, ...).
 * @param out      Cleared, then filled in device-reported order.
 * @return false (with @p out empty) when @p results has odd length.
 */
bool decode_file_list(const std::vector<std::string>& results, std::vector<FileInfo>& out);

/**
 * @brief Strip every trailing '/' from a listing path.
 *
 * The device-side listener stalls on paths ending in a separator, so List
 * requests always go out normalized. "/" and "" both normalize to "" (root).
 * Idempotent.
 */
std::string normalize_path(const std::string& path);

} // namespace codec
} // namespace usb2snes
