#pragma once
/**
 * @file cli_util.hpp
 * @brief Helpers behind usb2snes-cli: argument parsing, device choice,
 *        remote naming, hex dump, exit codes.
 *
 * Kept out of cli/main.cpp so the command-line behaviour can be tested
 * without a process boundary.
 */

#include <cstdint>
#include <filesystem>
#include <ostream>
#include <string>
#include <vector>

#include "usb2snes/error.hpp"
#include "usb2snes/session.hpp"

namespace usb2snes::cli {

/// Process exit status of usb2snes-cli.
enum class ExitCode : int {
  Ok      = 0,
  Failure = 1,   // transport, protocol or local io
  Usage   = 2,   // bad arguments or config file
};

/// Ok when @p err is clear, Failure otherwise.
ExitCode exit_code_for(const Error& err);

/**
 * @brief Parse a 32-bit unsigned number.
 *
 * Accepts decimal, 0x-prefixed hex and leading-0 octal (strtoul base 0).
 * Rejects signs, trailing junk, and anything above 0xFFFFFFFF.
 */
bool parse_number(const std::string& s, uint32_t& out);

/// "D/<basename>" with every trailing '/' of D removed, or "<basename>" when D is empty.
std::string remote_name(const std::string& dest_dir, const std::string& basename);

/**
 * @brief Device to attach to.
 *
 * @p wanted wins when non-empty. Otherwise the first entry of DeviceList; an
 * empty list is a Protocol error with reason "no_devices".
 */
bool select_device(Session& s, const std::string& wanted, std::string& dev, Error& err);

/// Whole local file into @p out; failures are ErrorKind::Io.
bool read_local_file(const std::filesystem::path& p, std::vector<uint8_t>& out, Error& err);

/// 16 bytes per row: 6-digit address, hex bytes, printable ASCII column.
void write_hexdump(std::ostream& os, uint32_t base, const std::vector<uint8_t>& data);

} // namespace usb2snes::cli
