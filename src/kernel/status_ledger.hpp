#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>
#include "kernel/config.hpp"
#include "kernel/types.hpp"

namespace pocket::kernel {

// Status history per alias plus an archive of finished agents.
// The archive outlives universe resets; live histories do not.
class StatusLedger {
public:
    explicit StatusLedger(LedgerConfig config = {});

    // Returns the stored (possibly truncated) status
    std::string append_status(const std::string& alias, const std::string& text);
    std::vector<std::string> history(const std::string& alias) const;
    std::optional<std::string> latest(const std::string& alias) const;

    // Latest output of a live agent, shown by recall before it is archived
    void record_output(const std::string& alias, const std::string& output);

    // Insert or update the completed record for alias
    void archive(const std::string& alias, const std::string& final_output);
    bool is_archived(const std::string& alias) const;
    std::optional<CompletedAgentRecord> archived(const std::string& alias) const;
    size_t archived_count() const;

    // {"agents": [{name, status_history, state, output?}]}
    // Output is only included when a name is given and show_output is set.
    nlohmann::json query(const std::optional<std::string>& agent_name,
                         bool show_output,
                         const std::vector<LiveAgent>& live,
                         bool cross_pocket = true) const;

    // Drop live histories and outputs and start a new universe generation
    void clear_live();
    uint64_t universe() const;

private:
    LedgerConfig config_;
    std::unordered_map<std::string, std::vector<std::string>> histories_;
    std::unordered_map<std::string, std::string> live_outputs_;
    std::vector<CompletedAgentRecord> archive_;     // Completion order
    uint64_t universe_ = 0;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
