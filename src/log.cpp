#include "esync/log.hpp"
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <string>

namespace esync::log {

namespace {
std::FILE* g_file = nullptr;
bool g_quiet = false;

const char* tag(Level level) {
    switch (level) {
        case Level::Debug: return "[DEBUG] ";
        case Level::Info:  return "";
        case Level::Warn:  return "[WARN] ";
        case Level::Error: return "[ERROR] ";
    }
    return "";
}

struct FileCloser {
    ~FileCloser() { if (g_file) std::fclose(g_file); }
} g_closer;
} // namespace

bool debug_enabled() {
    static const bool enabled = std::getenv("ESYNC_DEBUG") != nullptr;
    return enabled;
}

void set_file(const std::filesystem::path& path) {
    if (g_file) {
        std::fclose(g_file);
        g_file = nullptr;
    }
    if (path.empty()) return;
    g_file = std::fopen(path.string().c_str(), "a");
    if (!g_file) {
        std::fprintf(stderr, "[WARN] cannot open log file %s\n", path.string().c_str());
        return;
    }
    std::time_t now = std::time(nullptr);
    char stamp[32];
    std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M:%S", std::localtime(&now));
    std::fprintf(g_file, "%s\n", stamp);
}

void set_quiet(bool quiet) { g_quiet = quiet; }

void write(Level level, const char* fmt, ...) {
    char small[512];
    std::string big;
    const char* msg = small;
    va_list ap, again;
    va_start(ap, fmt);
    va_copy(again, ap);
    const int n = std::vsnprintf(small, sizeof(small), fmt, ap);
    va_end(ap);
    if (n >= static_cast<int>(sizeof(small))) {
        big.resize(static_cast<size_t>(n) + 1);
        std::vsnprintf(big.data(), big.size(), fmt, again);
        big.pop_back();
        msg = big.c_str();
    } else if (n < 0) {
        msg = fmt;
    }
    va_end(again);
    if (!(g_quiet && level == Level::Info))
        std::fprintf(stderr, "%s%s\n", tag(level), msg);
    if (g_file) {
        std::fprintf(g_file, "%s%s\n", tag(level), msg);
        std::fflush(g_file);
    }
}

} // namespace esync::log
