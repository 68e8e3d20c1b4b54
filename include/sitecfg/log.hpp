#pragma once

#include <functional>
#include <string>

namespace sitecfg::log {

enum Level { Trace, Debug, Info, Warn, Error };

// Receives every message at or above the current level, already formatted
// and without the level prefix.
using Sink = std::function<void(Level, const std::string&)>;

void set_level(Level lvl);
Level get_level();

void set_color_enabled(bool enabled);
bool is_color_enabled();

// Route output to `sink` instead of stderr. An empty sink restores stderr.
void set_sink(Sink sink);

void trace(const char* fmt, ...);
void debug(const char* fmt, ...);
void info(const char* fmt, ...);
void warn(const char* fmt, ...);
void error(const char* fmt, ...);

// Wraps text in bold escape codes when color output is enabled
std::string bold(const std::string& text);

// Returns the name string for a level
const char* level_name(Level lvl);

} // namespace sitecfg::log
