#include "kernel/host_events.hpp"

using json = nlohmann::json;

namespace pocket::kernel {

namespace {

std::optional<std::string> optional_string(const json& j, const char* key) {
    if (!j.contains(key) || j.at(key).is_null()) {
        return std::nullopt;
    }
    auto value = j.at(key).get<std::string>();
    if (value.empty()) {
        return std::nullopt;
    }
    return value;
}

} // namespace

ToolCall ToolCall::from_json(const json& j) {
    ToolCall call;
    call.tool = j.at("tool").get<std::string>();
    call.session_id = j.at("sessionID").get<std::string>();
    call.call_id = j.value("callID", "");
    if (j.contains("args") && j.at("args").is_object()) {
        call.args = j.at("args");
    }
    return call;
}

ToolExecuteAfter ToolExecuteAfter::from_json(const json& j) {
    ToolExecuteAfter event;
    event.tool = j.at("tool").get<std::string>();
    event.session_id = j.value("sessionID", "");
    if (j.contains("metadata") && j.at("metadata").is_object()) {
        const auto& metadata = j.at("metadata");
        event.child_session_id = metadata.value("sessionId", "");
        if (event.child_session_id.empty()) {
            event.child_session_id = metadata.value("session_id", "");
        }
    }
    return event;
}

BroadcastArgs BroadcastArgs::from_json(const json& j) {
    BroadcastArgs args;
    args.send_to = optional_string(j, "send_to");
    if (args.send_to) {
        auto& target = *args.send_to;
        auto begin = target.find_first_not_of(" \t\n");
        auto end = target.find_last_not_of(" \t\n");
        target = begin == std::string::npos ? "" : target.substr(begin, end - begin + 1);
        if (target.empty()) {
            args.send_to.reset();
        }
    }
    if (j.contains("message") && !j.at("message").is_null()) {
        args.message = j.at("message").get<std::string>();
    }
    if (j.contains("reply_to") && j.at("reply_to").is_number()) {
        args.reply_to = j.at("reply_to").get<uint64_t>();
    }
    return args;
}

SubagentArgs SubagentArgs::from_json(const json& j) {
    SubagentArgs args;
    if (j.contains("prompt") && !j.at("prompt").is_null()) {
        args.prompt = j.at("prompt").get<std::string>();
    }
    if (j.contains("description") && !j.at("description").is_null()) {
        args.description = j.at("description").get<std::string>();
    }
    return args;
}

RecallArgs RecallArgs::from_json(const json& j) {
    RecallArgs args;
    args.agent_name = optional_string(j, "agent_name");
    if (j.contains("show_output") && j.at("show_output").is_boolean()) {
        args.show_output = j.at("show_output").get<bool>();
    }
    return args;
}

} // namespace pocket::kernel
