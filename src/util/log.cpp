#include <fencelint/log.hpp>
#include <atomic>
#include <cstdarg>
#include <cstdio>
#include <mutex>

#include <unistd.h>

namespace fencelint::log {

static std::atomic<Level> s_level{Info};
static std::once_flag s_color_once;
static std::atomic<bool> s_color_enabled{false};

static void init_color() {
    std::call_once(s_color_once, [] {
        s_color_enabled = isatty(fileno(stderr)) != 0;
    });
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level level_for_verbosity(int verbosity) {
    if (verbosity < 0) return Error;
    if (verbosity == 0) return Info;
    if (verbosity == 1) return Debug;
    return Trace;
}

void set_color_enabled(bool enabled) {
    // Consume the once flag so a later auto-detect cannot override this
    init_color();
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

static const char* reset_color() {
    return "\033[0m";
}

// Workers log concurrently, so the whole line goes out in one fprintf.
static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;

    char body[2048];
    std::vsnprintf(body, sizeof(body), fmt, args);

    if (is_color_enabled()) {
        std::fprintf(stderr, "%s%s%s: %s\n",
                     level_color(lvl), level_name(lvl), reset_color(), body);
    } else {
        std::fprintf(stderr, "%s: %s\n", level_name(lvl), body);
    }
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

} // namespace fencelint::log
