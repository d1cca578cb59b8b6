#pragma once
#include <filesystem>
#include <optional>
#include <vector>

namespace pocket::core::paths {

// $HOME, or empty if unset.
std::filesystem::path home_dir();

// Config file candidates in lookup order: project-local first, then per-user.
std::vector<std::filesystem::path> config_search_paths();

// First existing config candidate.
std::optional<std::filesystem::path> find_config();

} // namespace pocket::core::paths
