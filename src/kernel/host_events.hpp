#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace pocket::kernel {

// Tool invocation from an agent: {"tool", "sessionID", "callID"?, "args"}
struct ToolCall {
    std::string tool;
    std::string session_id;
    std::string call_id;
    nlohmann::json args = nlohmann::json::object();

    // Throws nlohmann::json::exception on malformed payloads
    static ToolCall from_json(const nlohmann::json& j);
};

// Host notification that a tool finished: {"tool", "sessionID", "metadata": {"sessionId"|"session_id"}}
struct ToolExecuteAfter {
    std::string tool;
    std::string session_id;
    std::string child_session_id;   // Session the task tool ran, if any

    static ToolExecuteAfter from_json(const nlohmann::json& j);
};

struct BroadcastArgs {
    std::optional<std::string> send_to;
    std::string message;
    std::optional<uint64_t> reply_to;

    static BroadcastArgs from_json(const nlohmann::json& j);
};

struct SubagentArgs {
    std::string prompt;
    std::string description;

    static SubagentArgs from_json(const nlohmann::json& j);
};

struct RecallArgs {
    std::optional<std::string> agent_name;
    bool show_output = false;

    static RecallArgs from_json(const nlohmann::json& j);
};

} // namespace pocket::kernel
