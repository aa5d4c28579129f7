#include <semrex/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace semrex::log {

static std::atomic<Level> s_level{Info};
static std::once_flag s_color_probe;
static std::atomic<bool> s_color_enabled{false};
static std::mutex s_write_mutex;

static void init_color() {
    std::call_once(s_color_probe, [] {
        s_color_enabled = isatty(fileno(stderr)) != 0;
    });
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    // Suppress the later TTY probe so an explicit choice sticks
    std::call_once(s_color_probe, [] {});
    s_color_enabled = enabled;
}

bool is_color_enabled() {
    init_color();
    return s_color_enabled;
}

const char* level_name(Level lvl) {
    switch (lvl) {
        case Trace: return "trace";
        case Debug: return "debug";
        case Info:  return "info";
        case Warn:  return "warn";
        case Error: return "error";
    }
    return "unknown";
}

Result<Level> parse_level(const std::string& name) {
    if (name == "trace") return Result<Level>::ok(Trace);
    if (name == "debug") return Result<Level>::ok(Debug);
    if (name == "info") return Result<Level>::ok(Info);
    if (name == "warn" || name == "warning") return Result<Level>::ok(Warn);
    if (name == "error") return Result<Level>::ok(Error);
    return SemrexError{SemrexError::InvalidArg,
        "unknown log level '" + name + "'",
        "expected one of: trace, debug, info, warn, error"};
}

static const char* level_color(Level lvl) {
    switch (lvl) {
        case Trace: return "\033[90m";   // gray
        case Debug: return "\033[36m";   // cyan
        case Info:  return "\033[32m";   // green
        case Warn:  return "\033[33m";   // yellow
        case Error: return "\033[31m";   // red
    }
    return "";
}

// Format the whole line first so concurrent writers never interleave.
static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    va_list measure;
    va_copy(measure, args);
    int size = std::vsnprintf(nullptr, 0, fmt, measure);
    va_end(measure);
    if (size < 0) return;

    std::string body(static_cast<size_t>(size) + 1, '\0');
    std::vsnprintf(&body[0], body.size(), fmt, args);
    body.resize(static_cast<size_t>(size));

    std::string line;
    if (s_color_enabled) {
        line = std::string(level_color(lvl)) + level_name(lvl) + "\033[0m: ";
    } else {
        line = std::string(level_name(lvl)) + ": ";
    }
    line += body;
    line += '\n';

    std::lock_guard<std::mutex> lock(s_write_mutex);
    std::fputs(line.c_str(), stderr);
}

void trace(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Trace, fmt, args);
    va_end(args);
}

void debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Debug, fmt, args);
    va_end(args);
}

void info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Info, fmt, args);
    va_end(args);
}

void warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Warn, fmt, args);
    va_end(args);
}

void error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    log_message(Error, fmt, args);
    va_end(args);
}

} // namespace semrex::log
