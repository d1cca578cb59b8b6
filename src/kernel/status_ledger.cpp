#include "kernel/status_ledger.hpp"
#include "core/text.hpp"
#include "kernel/prompts.hpp"
#include <algorithm>
#include <chrono>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pocket::kernel {

namespace {

int64_t now_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

} // namespace

StatusLedger::StatusLedger(LedgerConfig config)
    : config_(config) {
    if (config_.max_status_history == 0) {
        config_.max_status_history = 1;
    }
}

std::string StatusLedger::append_status(const std::string& alias, const std::string& text) {
    std::string status = core::text::truncate_utf8(text, config_.max_status_length);

    std::lock_guard<std::mutex> lock(mutex_);
    auto& history = histories_[alias];
    history.push_back(status);
    if (history.size() > config_.max_status_history) {
        history.erase(history.begin(), history.end() - static_cast<std::ptrdiff_t>(config_.max_status_history));
    }

    spdlog::info("Agent {} status: {} (history={})", alias, status.substr(0, 80), history.size());
    return status;
}

std::vector<std::string> StatusLedger::history(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(alias);
    return it != histories_.end() ? it->second : std::vector<std::string>{};
}

std::optional<std::string> StatusLedger::latest(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = histories_.find(alias);
    if (it == histories_.end() || it->second.empty()) {
        return std::nullopt;
    }
    return it->second.back();
}

void StatusLedger::record_output(const std::string& alias, const std::string& output) {
    std::lock_guard<std::mutex> lock(mutex_);
    live_outputs_[alias] = output;
}

void StatusLedger::archive(const std::string& alias, const std::string& final_output) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> statuses;
    auto hist = histories_.find(alias);
    if (hist != histories_.end()) {
        statuses = hist->second;
    }
    live_outputs_[alias] = final_output;

    auto existing = std::find_if(archive_.begin(), archive_.end(),
                                 [&](const CompletedAgentRecord& r) { return r.alias == alias; });
    if (existing != archive_.end()) {
        existing->status_history = std::move(statuses);
        existing->final_output = final_output;
        existing->completed_at_ms = now_ms();
        existing->universe = universe_;
        spdlog::debug("Agent {} already archived, updated", alias);
        return;
    }

    CompletedAgentRecord record;
    record.alias = alias;
    record.status_history = std::move(statuses);
    record.final_output = final_output;
    record.completed_at_ms = now_ms();
    record.universe = universe_;
    archive_.push_back(std::move(record));

    spdlog::info("Archived agent {} ({} chars of output, {} archived)",
                 alias, final_output.size(), archive_.size());
}

bool StatusLedger::is_archived(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(archive_.begin(), archive_.end(),
                       [&](const CompletedAgentRecord& r) { return r.alias == alias; });
}

std::optional<CompletedAgentRecord> StatusLedger::archived(const std::string& alias) const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& record : archive_) {
        if (record.alias == alias) {
            return record;
        }
    }
    return std::nullopt;
}

size_t StatusLedger::archived_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return archive_.size();
}

json StatusLedger::query(const std::optional<std::string>& agent_name,
                         bool show_output,
                         const std::vector<LiveAgent>& live,
                         bool cross_pocket) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const bool include_output = agent_name.has_value() && show_output;
    json agents = json::array();

    for (const auto& record : archive_) {
        if (agent_name && record.alias != *agent_name) continue;
        if (!cross_pocket && record.universe != universe_) continue;

        json entry;
        entry["name"] = record.alias;
        entry["status_history"] = record.status_history;
        entry["state"] = "completed";
        if (include_output) {
            entry["output"] = record.final_output;
        }
        agents.push_back(entry);
    }

    for (const auto& agent : live) {
        bool archived = std::any_of(archive_.begin(), archive_.end(),
                                    [&](const CompletedAgentRecord& r) { return r.alias == agent.alias; });
        if (archived) continue;
        if (agent_name && agent.alias != *agent_name) continue;

        json entry;
        entry["name"] = agent.alias;
        auto hist = histories_.find(agent.alias);
        entry["status_history"] = hist != histories_.end() ? hist->second : std::vector<std::string>{};
        entry["state"] = session_status_to_string(agent.status);

        if (include_output) {
            auto output = live_outputs_.find(agent.alias);
            if (output != live_outputs_.end() && !output->second.empty()) {
                entry["output"] = output->second;
            } else if (agent.status == SessionStatus::ACTIVE) {
                entry["output"] = prompts::RECALL_AGENT_ACTIVE;
            } else {
                entry["output"] = prompts::RECALL_AGENT_IDLE_NO_OUTPUT;
            }
        }
        agents.push_back(entry);
    }

    json result;
    result["agents"] = agents;
    return result;
}

void StatusLedger::clear_live() {
    std::lock_guard<std::mutex> lock(mutex_);
    histories_.clear();
    live_outputs_.clear();
    ++universe_;
}

uint64_t StatusLedger::universe() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return universe_;
}

} // namespace pocket::kernel
