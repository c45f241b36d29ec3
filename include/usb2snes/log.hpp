#pragma once
/**
 * @file log.hpp
 * @brief Tag-based, level-filtered diagnostics on stderr.
 *
 * One line per event, "[W] session: Info recv_failed over websocket: timeout".
 * The threshold is process-wide; usb2snes-cli maps -v / -vv onto it.
 *
 * @code
 *   U2S_LOGD("ws", "handshake ok (%zu early bytes)", n);
 * @endcode
 */

#include <cstdarg>

namespace usb2snes::log {

enum class Level {
    Error = 0,
    Warn,
    Info,
    Debug,
};

// Process-wide threshold; messages above it are dropped. Default: Warn.
void set_level(Level level);
Level level();

bool enabled(Level level);

void vlogf(Level level, const char* tag, const char* fmt, std::va_list args);
void logf(Level level, const char* tag, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 3, 4)))
#endif
    ;

} // namespace usb2snes::log

// ------------------------------------------------------------------
// Convenience macros
// ------------------------------------------------------------------

#define U2S_LOGE(tag, fmt, ...) \
    ::usb2snes::log::logf(::usb2snes::log::Level::Error, tag, fmt, ##__VA_ARGS__)

#define U2S_LOGW(tag, fmt, ...) \
    ::usb2snes::log::logf(::usb2snes::log::Level::Warn,  tag, fmt, ##__VA_ARGS__)

#define U2S_LOGI(tag, fmt, ...) \
    ::usb2snes::log::logf(::usb2snes::log::Level::Info,  tag, fmt, ##__VA_ARGS__)

#define U2S_LOGD(tag, fmt, ...) \
    ::usb2snes::log::logf(::usb2snes::log::Level::Debug, tag, fmt, ##__VA_ARGS__)
