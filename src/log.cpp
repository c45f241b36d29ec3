// ============================================================================
// log.cpp - implementation for log.hpp
// ============================================================================

#include "usb2snes/log.hpp"

#include <atomic>
#include <cstdio>

namespace usb2snes::log {

static std::atomic<int> g_level{static_cast<int>(Level::Warn)};

static const char* level_to_str(Level lvl) {
  switch (lvl) {
    case Level::Error: return "E";
    case Level::Warn:  return "W";
    case Level::Info:  return "I";
    case Level::Debug: return "D";
  }
  return "?";
}

void set_level(Level level) { g_level.store(static_cast<int>(level)); }

Level level() { return static_cast<Level>(g_level.load()); }

bool enabled(Level level) { return static_cast<int>(level) <= g_level.load(); }

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args) {
  if (!enabled(level) || !fmt) return;

  // stdout belongs to command output; all diagnostics go to stderr.
  std::fprintf(stderr, "[%s] %s: ", level_to_str(level), tag ? tag : "log");
  std::vfprintf(stderr, fmt, args);
  std::fprintf(stderr, "\n");
}

void logf(Level level, const char* tag, const char* fmt, ...) {
  std::va_list args;
  va_start(args, fmt);
  vlogf(level, tag, fmt, args);
  va_end(args);
}

} // namespace usb2snes::log
