/**
 * @file main.cpp
 * @brief usb2snes-cli - one-shot command runner around usb2snes::Session.
 *
 * Responsibilities:
 *  - Parse CLI options (CLI11): global connection options + one subcommand.
 *  - Merge settings: command line > config file (config.hpp) > defaults.
 *  - Connect, pick a device (--device, config, or first in DeviceList), attach.
 *  - Run the subcommand and print results on stdout.
 *  - Report failures as one "status=error ..." line on stderr.
 *
 * Subcommands:
 *   devices                      list devices, no attach
 *   info                         " * <line>" per info string
 *   ls [path]                    names, directories with a trailing '/'
 *   put [--dest-dir D] files...  upload, then wait for the server to catch up
 *   rm paths...                  remove files
 *   read <addr> <len>            hex dump of device memory
 *
 * Exit codes: 0 ok, 1 transport/protocol/io failure, 2 usage or config error.
 */

#include <cstdint>
#include <filesystem>
#include <iostream>
#include <limits>
#include <string>
#include <vector>

#include <CLI/CLI.hpp>

#include "usb2snes/cli_util.hpp"
#include "usb2snes/config.hpp"
#include "usb2snes/error.hpp"
#include "usb2snes/log.hpp"
#include "usb2snes/session.hpp"

namespace fs = std::filesystem;
using namespace usb2snes;
using namespace usb2snes::cli;

static int to_int(ExitCode c) { return static_cast<int>(c); }

// ---------- subcommand handlers ----------

static bool handle_devices(Session& s, Error& err) {
  std::vector<std::string> devs;
  if (!s.get_device_list(devs, err)) return false;
  for (const auto& d : devs) std::cout << d << "\n";
  return true;
}

static bool handle_info(Session& s, Error& err) {
  std::vector<std::string> info;
  if (!s.get_info(info, err)) return false;
  for (const auto& line : info) std::cout << " * " << line << "\n";
  return true;
}

static bool handle_ls(Session& s, const std::string& path, Error& err) {
  std::vector<FileInfo> files;
  if (!s.list_files(path, files, err)) return false;
  for (const auto& fi : files) {
    std::cout << fi.name << (fi.type == FileType::Dir ? "/" : "") << "\n";
  }
  return true;
}

static bool handle_put(Session& s, const std::string& dest_dir,
                       const std::vector<std::string>& files, Error& err) {
  for (const auto& local : files) {
    fs::path p(local);
    std::string name = p.filename().string();
    if (name.empty()) return fail(err, ErrorKind::Io, std::nullopt, "no_file_name", local);

    std::vector<uint8_t> data;
    if (!read_local_file(p, data, err)) return false;

    std::string remote = remote_name(dest_dir, name);
    std::cout << local << " -> " << remote << std::endl;

    if (!s.put_file(remote, data, err)) return false;
    if (!s.await_completion(err)) return false;
  }
  return true;
}

static bool handle_rm(Session& s, const std::vector<std::string>& paths, Error& err) {
  for (const auto& p : paths) {
    std::cout << "removing " << p << std::endl;
    if (!s.remove(p, err)) return false;
  }
  return true;
}

static bool handle_read(Session& s, uint32_t addr, uint32_t len, Error& err) {
  std::vector<uint8_t> data;
  if (!s.read_mem(addr, len, data, err)) return false;
  write_hexdump(std::cout, addr, data);
  return true;
}

// ---------- main ----------

int main(int argc, char** argv) {
  // Global options
  std::string opt_uri;
  std::string opt_device;
  std::string opt_config;
  int opt_timeout_ms = -1;     // -1 => not given
  int opt_verbose = 0;

  // Subcommand arguments
  std::string ls_path;
  std::string put_dest_dir;
  std::vector<std::string> put_files;
  std::vector<std::string> rm_paths;
  std::string read_addr, read_len;

  CLI::App app{"USB2SNES command-line client"};
  app.require_subcommand(1);

  app.add_option("--uri", opt_uri, "Control server endpoint (default ws://localhost:8080)");
  app.add_option("--device", opt_device, "Device to attach to (default: first in device list)");
  app.add_option("--timeout", opt_timeout_ms, "Per-step network timeout in ms")
      ->check(CLI::Range(0, std::numeric_limits<int>::max()));
  app.add_option("--config", opt_config, "Settings file (default $XDG_CONFIG_HOME/usb2snes/config.json)");
  app.add_flag("-v,--verbose", opt_verbose, "More logging on stderr (repeat for debug)");

  auto* cmd_devices = app.add_subcommand("devices", "List devices known to the server");
  auto* cmd_info    = app.add_subcommand("info", "Show device info");

  auto* cmd_ls = app.add_subcommand("ls", "List files on the device");
  cmd_ls->add_option("path", ls_path, "Directory (default: root)");

  auto* cmd_put = app.add_subcommand("put", "Upload files to the device");
  cmd_put->add_option("--dest-dir", put_dest_dir, "Remote directory");
  cmd_put->add_option("files", put_files, "Local files")->required();

  auto* cmd_rm = app.add_subcommand("rm", "Remove files on the device");
  cmd_rm->add_option("paths", rm_paths, "Remote paths")->required();

  auto* cmd_read = app.add_subcommand("read", "Hex dump of device memory");
  cmd_read->add_option("addr", read_addr, "Start address (decimal, 0x hex)")->required();
  cmd_read->add_option("len", read_len, "Byte count (decimal, 0x hex)")->required();

  CLI11_PARSE(app, argc, argv);

  // -------- settings: file, then command line on top --------
  CliConfig cfg;
  {
    std::string cerr_reason;
    if (!opt_config.empty()) {
      if (!load_config(opt_config, cfg, cerr_reason)) {
        std::cerr << "status=error kind=config reason=" << cerr_reason
                  << " path=" << opt_config << "\n";
        return to_int(ExitCode::Usage);
      }
    } else {
      fs::path def = default_config_path();
      if (!load_config(def, cfg, cerr_reason) && cerr_reason != "not_found") {
        U2S_LOGW("cli", "ignoring %s: %s", def.string().c_str(), cerr_reason.c_str());
      }
    }
  }
  if (!opt_uri.empty())    cfg.uri = opt_uri;
  if (!opt_device.empty()) cfg.device = opt_device;
  if (opt_timeout_ms >= 0) cfg.timeout_ms = opt_timeout_ms;
  if (opt_verbose > 0)     cfg.verbose = opt_verbose;

  log::set_level(cfg.verbose >= 2 ? log::Level::Debug
               : cfg.verbose == 1 ? log::Level::Info
                                  : log::Level::Warn);

  uint32_t addr = 0, len = 0;
  if (cmd_read->parsed()) {
    if (!parse_number(read_addr, addr)) {
      std::cerr << "status=error reason=bad_number:addr value=" << read_addr << "\n";
      return to_int(ExitCode::Usage);
    }
    if (!parse_number(read_len, len)) {
      std::cerr << "status=error reason=bad_number:len value=" << read_len << "\n";
      return to_int(ExitCode::Usage);
    }
  }

  // -------- connect --------
  Options opts;
  opts.connect_timeout_ms = cfg.timeout_ms;
  opts.io_timeout_ms = cfg.timeout_ms;

  Error err;
  auto session = usb2snes::connect(cfg.uri, err, opts);
  if (!session) {
    std::cerr << describe(err) << " uri=" << cfg.uri << "\n";
    return to_int(exit_code_for(err));
  }

  bool ok = true;
  if (cmd_devices->parsed()) {
    ok = handle_devices(*session, err);
  } else {
    std::string dev;
    ok = select_device(*session, cfg.device, dev, err);
    if (ok) {
      std::cout << "Attaching to " << dev << "." << std::endl;
      ok = session->attach(dev, err);
    }
    if (ok) {
      if      (cmd_info->parsed()) ok = handle_info(*session, err);
      else if (cmd_ls->parsed())   ok = handle_ls(*session, ls_path, err);
      else if (cmd_put->parsed())  ok = handle_put(*session, put_dest_dir, put_files, err);
      else if (cmd_rm->parsed())   ok = handle_rm(*session, rm_paths, err);
      else if (cmd_read->parsed()) ok = handle_read(*session, addr, len, err);
    }
  }

  if (!ok) {
    std::cerr << describe(err) << "\n";
    return to_int(exit_code_for(err));
  }

  Error close_err;
  if (!session->close(close_err)) std::cerr << describe(close_err) << "\n";
  return to_int(exit_code_for(close_err));
}
