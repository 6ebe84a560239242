#pragma once

#include <optional>
#include <string>

namespace semver::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Reads SEMVER_LOG (e.g. "debug") and applies it as the level threshold.
// Unknown values are reported once at warn and otherwise ignored.
void init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);
std::optional<Level> level_from_name(const std::string& name);

} // namespace semver::log
