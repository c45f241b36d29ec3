#pragma once
/**
 * @file config.hpp
 * @brief Optional JSON settings file for usb2snes-cli.
 *
 * @details
 * Location (first match wins):
 *   $XDG_CONFIG_HOME/usb2snes/config.json
 *   $HOME/.config/usb2snes/config.json
 *
 * Shape (all keys optional, unknown keys ignored):
 * @code
 *   { "uri": "ws://localhost:23074", "device": "SD2SNES COM3",
 *     "timeout_ms": 8000, "verbose": 1 }
 * @endcode
 *
 * Precedence is command line > file > built-in defaults. The file is only
 * ever read; nothing is written back.
 */

#include <filesystem>
#include <string>

namespace usb2snes {

struct CliConfig {
  std::string uri{"ws://localhost:8080"};
  std::string device;          // empty: use the first entry of DeviceList
  int timeout_ms{5000};
  int verbose{0};              // 0 warn, 1 info, 2+ debug
};

/// $XDG_CONFIG_HOME/usb2snes/config.json or ~/.config/usb2snes/config.json.
std::filesystem::path default_config_path();

/**
 * @brief Overlay settings from a JSON file onto @p cfg.
 *
 * @return true on success. On failure @p cfg is untouched and @p err holds
 *         "not_found", "unreadable", "bad_json" or "bad_value:<key>".
 *         timeout_ms and verbose must be integers in 0..INT_MAX.
 */
bool load_config(const std::filesystem::path& path, CliConfig& cfg, std::string& err);

} // namespace usb2snes
