#include "kernel/prompts.hpp"
#include <sstream>
#include <spdlog/fmt/fmt.h>

namespace pocket::kernel::prompts {

const char* const BROADCAST_MISSING_MESSAGE = "Error: 'message' parameter is required.";
const char* const BROADCAST_SELF_MESSAGE =
    "Warning: You cannot send a message to yourself. The target alias is your own alias. "
    "Choose a different recipient.";
const char* const BROADCAST_NOT_REGISTERED =
    "Internal error: Session not properly initialized. Please try again.";

const char* const SUBAGENT_NOT_CHILD_SESSION =
    "Error: subagent can only be called from a subagent session (a session with a parentID). "
    "Main sessions should use the 'task' tool directly.";
const char* const SUBAGENT_MISSING_PROMPT = "Error: 'prompt' parameter is required.";
const char* const SUBAGENT_CREATE_FAILED = "Error: Failed to create session. No session ID returned.";

const char* const RECALL_EMPTY = "No agents in history yet.";
const char* const RECALL_AGENT_ACTIVE = "[Agent is still active - no output yet]";
const char* const RECALL_AGENT_IDLE_NO_OUTPUT = "[Agent is idle but has not produced output yet]";

const char* const ANNOUNCE_HINT =
    "Call broadcast(message='what you are working on') to announce yourself first.";

namespace {

std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) {
            out += sep;
        }
        out += items[i];
    }
    return out;
}

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

std::string agents_section(const std::vector<ParallelAgent>& agents) {
    if (agents.empty()) {
        return "No other agents available yet.";
    }

    std::vector<std::string> lines{"Available agents:"};
    for (const auto& agent : agents) {
        lines.push_back("  - " + agent.alias);
        for (const auto& status : agent.status) {
            lines.push_back("      → " + status);
        }
    }
    return join(lines, "\n");
}

std::string confirmation_section(const std::vector<std::string>& recipients,
                                 const std::optional<HandledMessage>& handled) {
    if (handled) {
        return fmt::format("Replied to #{} from {}:\n  \"{}\"", handled->seq, handled->from, handled->body);
    }
    if (!recipients.empty()) {
        return "Message sent to: " + join(recipients, ", ");
    }
    return "";
}

} // namespace

std::string resume_broadcast(const std::string& sender_alias) {
    return fmt::format("[Broadcast from {}]: New message received. Check your inbox.", sender_alias);
}

std::string broadcast_result(const std::string& alias,
                             const std::vector<std::string>& recipients,
                             const std::vector<ParallelAgent>& agents,
                             const std::optional<HandledMessage>& handled) {
    return fmt::format("You are: {}\n\n{}\n{}", alias, agents_section(agents),
                       confirmation_section(recipients, handled));
}

std::string unknown_recipient(const std::string& recipient, const std::vector<std::string>& known) {
    std::string known_list = known.empty()
        ? std::string("No agents available yet.")
        : "Known agents: " + join(known, ", ");
    return fmt::format("Error: Unknown recipient \"{}\". {}", recipient, known_list);
}

std::string subagent_result(const std::string& alias, const std::string& session_id,
                            const std::string& description) {
    return fmt::format("Spawned {} (session: {})\nTask: {}\n"
                       "The agent is now running in parallel and can be reached via broadcast.",
                       alias, session_id, description);
}

std::string subagent_max_depth(int depth, int max_depth) {
    return fmt::format("Error: Maximum subagent depth reached ({}/{}). "
                       "This session cannot spawn more subagents.", depth, max_depth);
}

std::string subagent_error(const std::string& error) {
    return "Error: Failed to create subagent: " + error;
}

std::string format_subagent_output(const std::string& alias, const std::string& output) {
    return fmt::format("[{0} completed]\n\n<output={0}>\n{1}\n</output>", alias, trim(output));
}

std::string received_subagent_output(const std::string& alias, const std::string& output) {
    return fmt::format("[Received {} completed task]\n{}", alias, output);
}

std::string agent_completed(const std::string& alias) {
    return fmt::format("Agent {} completed.", alias);
}

std::string agent_completed_with_summary(const std::string& alias, const std::string& summary) {
    return fmt::format("Agent {} completed:\n{}", alias, summary);
}

std::string subagent_running(const std::string& alias, const std::string& description) {
    return fmt::format("Subagent {} is running.\nTask: {}", alias, description);
}

std::string recall_not_found(const std::string& agent_name) {
    return fmt::format("No agent found with name '{}'.", agent_name);
}

std::optional<std::string> universe_summary(
    const std::vector<std::pair<std::string, std::vector<std::string>>>& agents) {
    if (agents.empty()) {
        return std::nullopt;
    }

    std::ostringstream out;
    out << "[Pocket Universe Summary]\n\n";
    out << "The following agents completed their work:\n\n";
    for (const auto& [alias, statuses] : agents) {
        out << "## " << alias << "\n";
        if (!statuses.empty()) {
            out << "Status history:\n";
            for (const auto& status : statuses) {
                out << "  → " << status << "\n";
            }
        }
        out << "\n";
    }
    return out.str();
}

std::string system_prompt(const SystemPromptOptions& options) {
    std::string subagent_intro;
    if (options.subagent_enabled) {
        if (options.allow_subagent) {
            subagent_intro = "Use `subagent` to create new sibling agents for parallel work.";
        } else {
            subagent_intro = fmt::format(
                "You have reached the maximum subagent depth ({}/{}) and cannot call `subagent` "
                "from this session.", options.depth, options.max_depth);
        }
    }

    const bool spawning = options.subagent_enabled && options.allow_subagent;

    std::vector<std::string> lines{
        "<instructions tool=\"pocket-universe\">",
        "# Pocket Universe - Parallel Agent Orchestration",
        "",
        "Use `broadcast` to communicate with other parallel agents.",
        subagent_intro,
        "",
        "## IMPORTANT: Announce Yourself First",
        "Your first action should be calling `broadcast(message=\"what you're working on\")` to "
        "announce yourself. Until you do, other agents won't know your purpose.",
        "",
        "**Status updates**: Calling `broadcast(message=\"...\")` without `send_to` updates your "
        "status. This is passive visibility - other agents see your status history when they "
        "broadcast. Status updates do NOT send messages or wake other agents.",
        "",
        "## Sending Messages",
        "- `broadcast(message=\"...\")` → **status update** (visible to all, not a message)",
        "- `broadcast(send_to=\"agentB\", message=\"...\")` → send message to specific agent",
        "- `broadcast(reply_to=1, message=\"...\")` → reply to message #1",
        "",
        "**Important:** Broadcasting without `send_to` updates your status but does NOT queue a "
        "message. Use `send_to` for direct communication that needs a reply.",
    };

    if (spawning) {
        lines.insert(lines.end(), {
            "",
            "## Spawning Agents",
            "- `subagent(prompt=\"...\", description=\"...\")` → create a sibling agent",
            "- **Fire-and-forget**: subagent() returns immediately, you continue working",
            "- **Output piping**: When subagent completes, its output arrives as a message",
        });
    }

    if (options.recall_enabled) {
        lines.insert(lines.end(), {
            "",
            "## Querying Agent History",
            "Use `recall()` to see all agents and their status history. Use "
            "`recall(agent_name=\"X\", show_output=true)` to retrieve a completed agent's final output.",
        });
    }

    lines.insert(lines.end(), {
        "",
        "## Receiving Messages",
        "Messages appear as synthetic `broadcast` tool results:",
        "```",
        "{",
        "  agents: [{ name: \"agentA\", status: \"Working on X\" }],",
        "  messages: [{ id: 1, from: \"agentA\", content: \"...\" }]",
        "}",
        "```",
        "",
        "- **agents**: Other agents and their current status",
        "- **messages**: Messages to reply to using `reply_to`",
    });

    if (spawning) {
        lines.push_back("When you receive output from a subagent, process it and incorporate the results.");
    }
    lines.push_back("</instructions>");

    return join(lines, "\n");
}

std::string user_message(const std::string& message) {
    return "**Message from user:**\n\n" + message;
}

const char* const POCKET_NO_UNIVERSE = "No active pocket universe. Start a task first.";
const char* const POCKET_NO_COORDINATOR = "No coordinator found. No agents in the current pocket.";
const char* const POCKET_EMPTY_INPUT = "Usage: /pocket [@agent] <message>";

std::string pocket_agent_not_found(const std::string& alias) {
    return fmt::format("Agent '{}' not found in current pocket.", alias);
}

std::string pocket_agent_finished(const std::string& alias) {
    return fmt::format("Agent '{}' is from a previous pocket and has completed.", alias);
}

std::string pocket_sent(const std::string& alias) {
    return fmt::format("Message sent to {}.", alias);
}

std::string pocket_send_failed(const std::string& alias, const std::string& error) {
    return fmt::format("Failed to send message to {}: {}", alias, error);
}

} // namespace pocket::kernel::prompts
