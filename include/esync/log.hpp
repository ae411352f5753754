// Minimal printf-style logging. Debug output is gated by ESYNC_DEBUG.
#pragma once
#include <filesystem>

namespace esync::log {

enum class Level { Debug, Info, Warn, Error };

// True when the ESYNC_DEBUG environment variable is set.
bool debug_enabled();

// Append every message to 'path' in addition to stderr. An empty path disables the tee.
void set_file(const std::filesystem::path& path);

// Suppress Info messages on stderr (warnings and errors are always printed).
void set_quiet(bool quiet);

void write(Level level, const char* fmt, ...)
#if defined(__GNUC__)
    __attribute__((format(printf, 2, 3)))
#endif
    ;

} // namespace esync::log

#define ESYNC_DEBUGF(fmt, ...) \
    do { if (::esync::log::debug_enabled()) ::esync::log::write(::esync::log::Level::Debug, fmt, ##__VA_ARGS__); } while (0)
#define ESYNC_INFOF(fmt, ...)  ::esync::log::write(::esync::log::Level::Info, fmt, ##__VA_ARGS__)
#define ESYNC_WARNF(fmt, ...)  ::esync::log::write(::esync::log::Level::Warn, fmt, ##__VA_ARGS__)
#define ESYNC_ERRORF(fmt, ...) ::esync::log::write(::esync::log::Level::Error, fmt, ##__VA_ARGS__)
