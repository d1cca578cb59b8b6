#pragma once
#include <filesystem>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pocket::core::config {

// Get environment variable, empty string if missing.
std::string get_env(const std::string& key);

// Get environment variable with default fallback.
std::string get_env_or(const std::string& key, const std::string& fallback);

// Remove // line comments and /* block */ comments outside of string literals.
std::string strip_json_comments(const std::string& text);

// Read a JSON or JSONC document. Empty if the file is missing or malformed.
std::optional<nlohmann::json> load_json_file(const std::filesystem::path& path);

} // namespace pocket::core::config
