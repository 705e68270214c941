#pragma once

#include <resub/result.hpp>
#include <string>
#include <cstdio>

namespace resub::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);
bool is_color_enabled();

// "trace" | "debug" | "info" | "warn" | "error"
Result<Level> parse_level(const std::string& name);

// Apply RESUB_LOG if it is set to a valid level name.
// Returns false when the variable is set but not recognized.
bool init_from_env();

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace resub::log
