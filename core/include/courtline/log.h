#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace courtline::log {

void init(const std::string& app_name, const std::filesystem::path& root);
void shutdown();
void install_crash_handlers();

// Debug lines are dropped unless verbose output is on.
void set_verbose(bool verbose);
bool verbose();

void debug(std::string_view msg);
void info(std::string_view msg);
void warn(std::string_view msg);
void error(std::string_view msg);

} // namespace courtline::log
