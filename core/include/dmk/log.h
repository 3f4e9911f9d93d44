#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace dmk::log {

void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();
void install_crash_handlers();

// Echo to stdout is on by default; dmkctl turns it off for machine-readable output.
void set_console(bool enabled);

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

} // namespace dmk::log
