#pragma once
#include <string>
#include <spdlog/spdlog.h>

namespace pocket::core {

// Initialize logging with console output
void init_logger();

// Also write to path. Failure to open is logged and console logging continues.
void add_log_file(const std::string& path);

// Set log level
void set_log_level(spdlog::level::level_enum level);

// Parse "debug", "info", ... falling back to info for unknown names
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace pocket::core
