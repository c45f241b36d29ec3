/**
 * @file codec.cpp
 * @brief nlohmann::json backed implementation of codec.hpp.
 *
 * @details
 *   Requests use @c ordered_json so that dump() emits keys in the order they
 *   were inserted: Opcode, Space, Flags, Operands. The default (sorted)
 *   @c json type would put "Flags" first.
 *
 *   All exceptions raised by the library are caught here and turned into
 *   false / std::nullopt.
 */

#include "usb2snes/codec.hpp"

#include <nlohmann/json.hpp>

#include <utility>

using nlohmann::json;
using nlohmann::ordered_json;

namespace usb2snes {
namespace codec {

/**
 * @brief Serialize a Request to JSON text.
 *
 * @details
 *   - Opcode and Space are always written, in that order.
 *   - Flags and Operands are written only when engaged. An engaged but empty
 *     vector is written as [] (the caller asked for it explicitly).
 *   - dump() throws type_error when a string is not valid UTF-8; that is the
 *     one realistic encoding failure and it is reported through @p err.
 */
bool encode_request(const Request& req, std::string& out, std::string& err, int indent) {
  try {
    ordered_json j;
    j["Opcode"] = opcode_name(req.opcode);
    j["Space"]  = space_name(req.space);
    if (req.flags)    j["Flags"]    = *req.flags;
    if (req.operands) j["Operands"] = *req.operands;

    out = j.dump(indent);
    return true;
  } catch (const json::exception& e) {
    err = e.what();
    return false;
  }
}

/**
 * @brief Parse {"Results":[...]} into a string vector.
 *
 * @details
 *   Extra keys are tolerated. Every element of "Results" must be a string;
 *   anything else makes the frame undecodable (std::nullopt) rather than
 *   silently coercing numbers to text.
 */
std::optional<std::vector<std::string>> decode_results(const std::string& text) {
  try {
    auto j = json::parse(text);
    if (!j.is_object()) return std::nullopt;

    auto it = j.find("Results");
    if (it == j.end() || !it->is_array()) return std::nullopt;

    std::vector<std::string> results;
    results.reserve(it->size());
    for (const auto& v : *it) {
      if (!v.is_string()) return std::nullopt;
      results.push_back(v.get<std::string>());
    }
    return results;
  } catch (const json::exception&) {
    return std::nullopt;
  }
}

bool decode_file_list(const std::vector<std::string>& results, std::vector<FileInfo>& out) {
  out.clear();
  if (results.size() % 2 != 0) return false;

  out.reserve(results.size() / 2);
  for (std::size_t i = 0; i < results.size(); i += 2) {
    FileInfo fi;
    fi.type = file_type_from_marker(results[i]);
    fi.name = results[i + 1];
    out.push_back(std::move(fi));
  }
  return true;
}

std::string normalize_path(const std::string& path) {
  std::size_t end = path.size();
  while (end > 0 && path[end - 1] == '/') --end;
  return path.substr(0, end);
}

} // namespace codec
} // namespace usb2snes
