#pragma once

#include <string>
#include <cstdio>

namespace grg::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();
bool enabled(Level lvl);

void set_color_enabled(bool enabled);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Returns the name string for a level
const char* level_name(Level lvl);

// Parse "trace".."error"; returns false on an unknown name
bool parse_level(const std::string& name, Level& out);

} // namespace grg::log
