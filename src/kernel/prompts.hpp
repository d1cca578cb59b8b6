#pragma once
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "kernel/types.hpp"

// Text shown to agents and to the host. Kept in one place so wording stays consistent.
namespace pocket::kernel::prompts {

// broadcast
extern const char* const BROADCAST_MISSING_MESSAGE;
extern const char* const BROADCAST_SELF_MESSAGE;
extern const char* const BROADCAST_NOT_REGISTERED;

std::string resume_broadcast(const std::string& sender_alias);
std::string broadcast_result(const std::string& alias,
                             const std::vector<std::string>& recipients,
                             const std::vector<ParallelAgent>& agents,
                             const std::optional<HandledMessage>& handled);
std::string unknown_recipient(const std::string& recipient, const std::vector<std::string>& known);

// subagent
extern const char* const SUBAGENT_NOT_CHILD_SESSION;
extern const char* const SUBAGENT_MISSING_PROMPT;
extern const char* const SUBAGENT_CREATE_FAILED;

std::string subagent_result(const std::string& alias, const std::string& session_id,
                            const std::string& description);
std::string subagent_max_depth(int depth, int max_depth);
std::string subagent_error(const std::string& error);
std::string format_subagent_output(const std::string& alias, const std::string& output);
std::string received_subagent_output(const std::string& alias, const std::string& output);
std::string agent_completed(const std::string& alias);
std::string agent_completed_with_summary(const std::string& alias, const std::string& summary);
std::string subagent_running(const std::string& alias, const std::string& description);

// recall
extern const char* const RECALL_EMPTY;
extern const char* const RECALL_AGENT_ACTIVE;
extern const char* const RECALL_AGENT_IDLE_NO_OUTPUT;

std::string recall_not_found(const std::string& agent_name);

// context assembly
extern const char* const ANNOUNCE_HINT;

// Summary posted to the main session once every first-level child is done.
// Empty when there are no agents.
std::optional<std::string> universe_summary(
    const std::vector<std::pair<std::string, std::vector<std::string>>>& agents);

struct SystemPromptOptions {
    bool subagent_enabled = true;
    bool allow_subagent = true;
    bool recall_enabled = true;
    int depth = 0;
    int max_depth = 0;
};

std::string system_prompt(const SystemPromptOptions& options);

// user command
std::string user_message(const std::string& message);

// /pocket command
extern const char* const POCKET_NO_UNIVERSE;
extern const char* const POCKET_NO_COORDINATOR;
extern const char* const POCKET_EMPTY_INPUT;
std::string pocket_agent_not_found(const std::string& alias);
std::string pocket_agent_finished(const std::string& alias);
std::string pocket_sent(const std::string& alias);
std::string pocket_send_failed(const std::string& alias, const std::string& error);

} // namespace pocket::kernel::prompts
