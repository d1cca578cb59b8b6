#include "core/logger.hpp"
#include <memory>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace pocket::core {

namespace {
const char* LOG_PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
}

void init_logger() {
    if (auto existing = spdlog::get("pocket")) {
        spdlog::set_default_logger(existing);
        return;
    }

    auto console = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("pocket", console);
    spdlog::register_logger(logger);
    spdlog::set_default_logger(logger);
    spdlog::set_pattern(LOG_PATTERN);
}

void add_log_file(const std::string& path) {
    auto logger = spdlog::get("pocket");
    if (!logger) {
        init_logger();
        logger = spdlog::get("pocket");
    }

    try {
        auto file = std::make_shared<spdlog::sinks::basic_file_sink_mt>(path, false);
        file->set_pattern(LOG_PATTERN);
        logger->sinks().push_back(file);
        spdlog::info("Logging to {}", path);
    } catch (const spdlog::spdlog_ex& e) {
        spdlog::error("Failed to open log file {}: {}", path, e.what());
    }
}

void set_log_level(spdlog::level::level_enum level) {
    spdlog::set_level(level);
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    if (name.empty()) {
        return spdlog::level::info;
    }
    auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        return spdlog::level::info;
    }
    return level;
}

} // namespace pocket::core
