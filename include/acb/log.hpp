#pragma once

#include <functional>
#include <string>

namespace acb::log {

enum Level { Trace, Debug, Info, Warn, Error };

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Receives every message that passes the level filter, already formatted
// and without the level prefix. An empty sink restores stderr output.
using Sink = std::function<void(Level, const std::string&)>;
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

const char* level_name(Level lvl);

// Parses "trace", "debug", ... ; returns false on an unknown name
bool parse_level(const std::string& name, Level& out);

} // namespace acb::log
