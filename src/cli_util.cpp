// ============================================================================
// cli_util.cpp - implementation for cli_util.hpp
// ============================================================================

#include "usb2snes/cli_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <iterator>
#include <limits>

namespace usb2snes::cli {

ExitCode exit_code_for(const Error& err) {
  return err ? ExitCode::Failure : ExitCode::Ok;
}

bool parse_number(const std::string& s, uint32_t& out) {
  if (s.empty() || s[0] == '-' || s[0] == '+') return false;
  errno = 0;
  char* end = nullptr;
  unsigned long long v = std::strtoull(s.c_str(), &end, 0);
  if (errno != 0 || end == s.c_str() || *end != '\0') return false;
  if (v > std::numeric_limits<uint32_t>::max()) return false;
  out = static_cast<uint32_t>(v);
  return true;
}

std::string remote_name(const std::string& dest_dir, const std::string& basename) {
  if (dest_dir.empty()) return basename;
  std::string dir = dest_dir;
  while (!dir.empty() && dir.back() == '/') dir.pop_back();
  return dir + "/" + basename;
}

bool select_device(Session& s, const std::string& wanted, std::string& dev, Error& err) {
  if (!wanted.empty()) { dev = wanted; return true; }

  std::vector<std::string> devs;
  if (!s.get_device_list(devs, err)) return false;
  if (devs.empty()) {
    return fail(err, ErrorKind::Protocol, Opcode::DeviceList, "no_devices",
                "server reports no attached devices");
  }
  dev = devs.front();
  return true;
}

bool read_local_file(const std::filesystem::path& p, std::vector<uint8_t>& out, Error& err) {
  std::ifstream in(p, std::ios::binary);
  if (!in) return fail(err, ErrorKind::Io, std::nullopt, "open_failed", p.string());
  out.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
  if (in.bad()) return fail(err, ErrorKind::Io, std::nullopt, "read_failed", p.string());
  return true;
}

void write_hexdump(std::ostream& os, uint32_t base, const std::vector<uint8_t>& data) {
  const auto saved = os.flags();
  const char fill = os.fill();

  for (std::size_t row = 0; row < data.size(); row += 16) {
    os << std::uppercase << std::hex << std::setfill('0')
       << std::setw(6) << (base + row) << " ";
    std::string ascii;
    for (std::size_t i = row; i < row + 16; ++i) {
      if (i < data.size()) {
        os << " " << std::setw(2) << static_cast<unsigned>(data[i]);
        ascii.push_back((data[i] >= 0x20 && data[i] < 0x7F) ? static_cast<char>(data[i]) : '.');
      } else {
        os << "   ";
      }
    }
    os << "  " << ascii << "\n";
  }

  os.flags(saved);
  os.fill(fill);
}

} // namespace usb2snes::cli
