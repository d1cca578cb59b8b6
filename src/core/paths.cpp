#include "core/paths.hpp"
#include <cstdlib>
#include <system_error>

namespace pocket::core::paths {

namespace {
constexpr const char* kLocalConfigName = ".pocket.jsonc";
constexpr const char* kUserConfigDir = ".config/pocket";
constexpr const char* kUserConfigName = "pocket.jsonc";
} // namespace

std::filesystem::path home_dir() {
    const char* home = std::getenv("HOME");
    if (home == nullptr || *home == '\0') {
        return {};
    }
    return std::filesystem::path(home);
}

std::vector<std::filesystem::path> config_search_paths() {
    std::vector<std::filesystem::path> candidates;

    std::error_code ec;
    auto cwd = std::filesystem::current_path(ec);
    if (!ec) {
        candidates.push_back(cwd / kLocalConfigName);
    }

    auto home = home_dir();
    if (!home.empty()) {
        candidates.push_back(home / kUserConfigDir / kUserConfigName);
    }
    return candidates;
}

std::optional<std::filesystem::path> find_config() {
    for (const auto& candidate : config_search_paths()) {
        std::error_code ec;
        if (std::filesystem::is_regular_file(candidate, ec)) {
            return candidate;
        }
    }
    return std::nullopt;
}

} // namespace pocket::core::paths
