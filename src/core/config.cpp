#include "core/config.hpp"
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <spdlog/spdlog.h>

namespace pocket::core::config {

std::string get_env(const std::string& key) {
    const char* value = std::getenv(key.c_str());
    return value ? std::string(value) : std::string();
}

std::string get_env_or(const std::string& key, const std::string& fallback) {
    auto value = get_env(key);
    return value.empty() ? fallback : value;
}

std::string strip_json_comments(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    bool in_string = false;
    size_t i = 0;
    while (i < text.size()) {
        char c = text[i];

        if (in_string) {
            out.push_back(c);
            if (c == '\\' && i + 1 < text.size()) {
                out.push_back(text[i + 1]);
                i += 2;
                continue;
            }
            if (c == '"') {
                in_string = false;
            }
            ++i;
            continue;
        }

        if (c == '"') {
            in_string = true;
            out.push_back(c);
            ++i;
            continue;
        }

        if (c == '/' && i + 1 < text.size() && text[i + 1] == '/') {
            // Skip to end of line, keep the newline
            while (i < text.size() && text[i] != '\n') ++i;
            continue;
        }

        if (c == '/' && i + 1 < text.size() && text[i + 1] == '*') {
            size_t end = text.find("*/", i + 2);
            i = (end == std::string::npos) ? text.size() : end + 2;
            continue;
        }

        out.push_back(c);
        ++i;
    }
    return out;
}

std::optional<nlohmann::json> load_json_file(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        spdlog::debug("Config file {} not readable", path.string());
        return std::nullopt;
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    try {
        return nlohmann::json::parse(strip_json_comments(buffer.str()));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::warn("Failed to parse config {}: {}", path.string(), e.what());
        return std::nullopt;
    }
}

} // namespace pocket::core::config
