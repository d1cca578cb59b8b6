#pragma once
#include <optional>
#include <string>

namespace pocket::kernel {

class SessionHost;
class ParentCache;

// Session tree queries against the host, through the parent cache.
// Host failures are logged and read as "no parent".
class SessionLookup {
public:
    SessionLookup(SessionHost& host, ParentCache& cache);

    std::optional<std::string> parent_of(const std::string& session_id);
    bool is_child(const std::string& session_id);

    // Child whose parent is a top-level (main) session
    bool is_first_level(const std::string& session_id);

    // Top-level ancestor. A top-level session is its own root.
    std::string root_of(const std::string& session_id);

    // Text of the last assistant message, or a completion line when there is none
    std::string final_output(const std::string& session_id, const std::string& alias);

    static constexpr int MAX_HOPS = 32;

private:
    SessionHost& host_;
    ParentCache& cache_;
};

} // namespace pocket::kernel
