#pragma once
#include <cstdio>
#include <optional>
#include <string_view>

namespace SimShell::log {
enum class Level { Trace, Debug, Info, Warn, Error, Fatal };

void set_level(Level lvl);
Level level();
std::optional<Level> parse_level(std::string_view name);
const char* level_name(Level lvl);

void trace(std::string_view s);
void debug(std::string_view s);
void info(std::string_view s);
void warn(std::string_view s);
void error(std::string_view s);
void fatal(std::string_view s);
void write(Level lvl, std::string_view s);
}
