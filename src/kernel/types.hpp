#pragma once
#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace pocket::kernel {

using Clock = std::chrono::steady_clock;

// Inter-agent message held in a recipient's mailbox
struct Message {
    std::string id;                 // Random token, not used for ordering
    uint64_t seq = 0;               // Strictly increasing per recipient
    std::string from;               // Sender alias
    std::string to;                 // Recipient session id
    std::string body;
    Clock::time_point created_at;
    bool handled = false;           // Recipient replied to it
};

// Summary returned when messages are marked handled
struct HandledMessage {
    uint64_t seq = 0;
    std::string from;
    std::string body;
};

enum class SessionStatus {
    ACTIVE,
    IDLE
};

inline std::string session_status_to_string(SessionStatus status) {
    switch (status) {
        case SessionStatus::ACTIVE: return "active";
        case SessionStatus::IDLE:   return "idle";
        default: return "unknown";
    }
}

struct SessionState {
    std::string session_id;
    std::string alias;
    SessionStatus status = SessionStatus::ACTIVE;
    Clock::time_point last_activity_at;
};

struct AgentIdentity {
    std::string session_id;
    std::string alias;
    std::string root_id;
};

// Snapshot of a finished agent, kept across universe resets
struct CompletedAgentRecord {
    std::string alias;
    std::vector<std::string> status_history;
    std::string final_output;
    int64_t completed_at_ms = 0;    // Wall clock, epoch millis
    uint64_t universe = 0;          // Universe generation it finished in
};

// Subagent spawned through the subagent tool
struct SubagentInfo {
    std::string session_id;
    std::string alias;
    std::string description;
    std::string parent_session_id;  // Caller that waits on it
    std::string parent_id;          // Host parent of the spawned session
    std::string prompt;
    int depth = 0;
    Clock::time_point created_at;
    std::string output;
    bool completed = false;
};

// Peer as listed to other agents of the same universe
struct ParallelAgent {
    std::string alias;
    std::vector<std::string> status;    // Status history, most recent last
    bool idle = false;
};

// Live agent as seen by the recall query
struct LiveAgent {
    std::string alias;
    SessionStatus status = SessionStatus::ACTIVE;
};

} // namespace pocket::kernel
