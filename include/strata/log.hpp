#pragma once

#include <strata/result.hpp>
#include <string>
#include <cstdio>

namespace strata::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace" / "debug" / "info" / "warn" / "error" (case-insensitive)
Result<Level> parse_level(const std::string& name);

// Apply STRATA_LOG (level name) and NO_COLOR from the environment.
// An unrecognized STRATA_LOG value is reported as a warning and ignored.
void init_from_env();

} // namespace strata::log
