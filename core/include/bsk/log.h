#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace bsk::log {

enum class Level { Info = 0, Warn = 1, Error = 2 };

// Opens <root>/build/logs/<app_name>_<timestamp>.log. The minimum level comes
// from BSK_LOG_LEVEL (info, warn, error) when set.
void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();
void install_crash_handlers();

// Console echo goes to stderr when stdout carries command output.
enum class Console { Stdout, Stderr, Off };
void set_console(Console console);
void set_level(Level level);
Level level();

void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

// Most recent lines, oldest first. Kept regardless of console and file state.
std::vector<std::string> recent(size_t max_entries = 200);

} // namespace bsk::log
