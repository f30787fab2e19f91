#pragma once
#include <string>

namespace tsim {

// Configure the default spdlog logger for a command-line tool.
// Levels can be overridden with SPDLOG_LEVEL (e.g. SPDLOG_LEVEL=debug).
void init_logging(const std::string& app_name, bool verbose = false);

} // namespace tsim
