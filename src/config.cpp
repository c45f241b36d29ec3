// ============================================================================
// config.cpp - implementation for config.hpp
// ============================================================================

#include "usb2snes/config.hpp"

#include <cstdlib>            // getenv for XDG/HOME lookups
#include <cstdint>
#include <fstream>
#include <limits>
#include <system_error>       // std::error_code for non-throwing filesystem ops

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace usb2snes {

/*
 * default_config_path()
 * ---------------------
 * Prefer $XDG_CONFIG_HOME; fall back to $HOME/.config. If neither is set the
 * result is relative, and load_config() will simply not find it.
 */
fs::path default_config_path() {
  if (const char* x = std::getenv("XDG_CONFIG_HOME"); x && *x)
    return fs::path(x) / "usb2snes" / "config.json";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : "") / ".config" / "usb2snes" / "config.json";
}

// Integer in 0..INT_MAX. Negative or oversized values are rejected, never narrowed.
static bool read_non_negative_int(const json& v, int& out) {
  constexpr int64_t max = std::numeric_limits<int>::max();
  if (v.is_number_unsigned()) {
    uint64_t u = v.get<uint64_t>();
    if (u > static_cast<uint64_t>(max)) return false;
    out = static_cast<int>(u);
    return true;
  }
  if (!v.is_number_integer()) return false;
  int64_t i = v.get<int64_t>();
  if (i < 0 || i > max) return false;
  out = static_cast<int>(i);
  return true;
}

/*
 * load_config()
 * -------------
 * Parse into a scratch copy and only commit on success, so a half-valid file
 * never leaves the caller with mixed settings.
 */
bool load_config(const fs::path& path, CliConfig& cfg, std::string& err) {
  std::error_code ec;
  if (!fs::exists(path, ec)) { err = "not_found"; return false; }

  std::ifstream in(path);
  if (!in) { err = "unreadable"; return false; }

  json j;
  try {
    in >> j;
  } catch (const json::exception&) {
    err = "bad_json";
    return false;
  }
  if (!j.is_object()) { err = "bad_json"; return false; }

  CliConfig next = cfg;

  if (j.contains("uri")) {
    if (!j["uri"].is_string()) { err = "bad_value:uri"; return false; }
    next.uri = j["uri"].get<std::string>();
  }
  if (j.contains("device")) {
    if (!j["device"].is_string()) { err = "bad_value:device"; return false; }
    next.device = j["device"].get<std::string>();
  }
  if (j.contains("timeout_ms") && !read_non_negative_int(j["timeout_ms"], next.timeout_ms)) {
    err = "bad_value:timeout_ms";
    return false;
  }
  if (j.contains("verbose") && !read_non_negative_int(j["verbose"], next.verbose)) {
    err = "bad_value:verbose";
    return false;
  }

  cfg = next;
  return true;
}

} // namespace usb2snes
