#include <semver/log.hpp>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

namespace semver::log {

static Level s_level = Info;
static bool s_color_initialized = false;
static bool s_color_enabled = false;

static void init_color() {
    if (!s_color_initialized) {
        s_color_enabled = isatty(fileno(stderr));
        s_color_initialized = true;
    }
}

void set_level(Level lvl) {
    s_level = lvl;
}

Level get_level() {
    return s_level;
}

void set_color_enabled(bool enabled) {
    s_color_enabled = enabled;
    s_color_initialized = true;
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

std::optional<Level> level_from_name(const std::string& name) {
    std::string lower;
    lower.reserve(name.size());
    for (char c : name) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }

    for (Level lvl : {Trace, Debug, Info, Warn, Error}) {
        if (lower == level_name(lvl)) return lvl;
    }
    if (lower == "warning") return Warn;
    return std::nullopt;
}

void init_from_env() {
    const char* env = std::getenv("SEMVER_LOG");
    if (!env || !*env) return;

    if (auto lvl = level_from_name(env)) {
        s_level = *lvl;
    } else {
        warn("ignoring unknown SEMVER_LOG level '%s'", env);
    }
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

static void log_message(Level lvl, const char* fmt, va_list args) {
    if (lvl < s_level) return;
    init_color();

    if (s_color_enabled) {
        std::fprintf(stderr, "%s%s\033[0m: ", level_color(lvl), level_name(lvl));
    } else {
        std::fprintf(stderr, "%s: ", level_name(lvl));
    }

    std::vfprintf(stderr, fmt, args);
    std::fputc('\n', stderr);
}

#define SEMVER_LOG_FN(name, lvl)            \
    void name(const char* fmt, ...) {       \
        va_list args;                       \
        va_start(args, fmt);                \
        log_message(lvl, fmt, args);        \
        va_end(args);                       \
    }

SEMVER_LOG_FN(trace, Trace)
SEMVER_LOG_FN(debug, Debug)
SEMVER_LOG_FN(info, Info)
SEMVER_LOG_FN(warn, Warn)
SEMVER_LOG_FN(error, Error)

#undef SEMVER_LOG_FN

} // namespace semver::log
