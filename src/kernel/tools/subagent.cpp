#include "kernel/tool_handlers.hpp"
#include "core/text.hpp"
#include "kernel/tool_router.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/completion_barrier.hpp"
#include "kernel/delivery.hpp"
#include "kernel/host.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/prompts.hpp"
#include "kernel/resume_engine.hpp"
#include "kernel/session_lookup.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/session_updates.hpp"
#include "kernel/status_ledger.hpp"
#include "kernel/universe.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

namespace {
constexpr size_t DEFAULT_DESCRIPTION_LENGTH = 50;
}

void SubagentTool::register_tools(ToolRouter& router) {
    router.register_handler("subagent",
        [this](const ToolCall& call) { return handle_subagent(call); });
}

std::string SubagentTool::handle_subagent(const ToolCall& call) {
    try {
        const std::string& caller = call.session_id;
        SubagentArgs args = SubagentArgs::from_json(call.args);

        if (args.prompt.empty()) {
            spdlog::warn("subagent called by {} without prompt", caller);
            return prompts::SUBAGENT_MISSING_PROMPT;
        }

        auto parent = context_.lookup.parent_of(caller);
        if (!parent) {
            spdlog::warn("subagent called from non-child session {}", caller);
            return prompts::SUBAGENT_NOT_CHILD_SESSION;
        }

        const int caller_depth = context_.registry.depth(caller);
        const int max_depth = context_.config.tools.subagent.max_depth;
        if (caller_depth >= max_depth) {
            spdlog::warn("subagent max depth reached for {} ({}/{})", caller, caller_depth, max_depth);
            return prompts::subagent_max_depth(caller_depth, max_depth);
        }

        const std::string caller_alias = context_.registry.alias(caller);
        const std::string description = args.description.empty()
            ? core::text::truncate_utf8(args.prompt, DEFAULT_DESCRIPTION_LENGTH)
            : args.description;

        spdlog::info("subagent called by {} (depth {}, prompt {} chars)",
                     caller_alias, caller_depth, args.prompt.size());

        auto created = context_.host.create_session(
            *parent, description + " (subagent from " + caller_alias + ")");
        if (!created.success) {
            spdlog::error("subagent session creation for {} failed: {}", caller_alias, created.error);
            return prompts::subagent_error(created.error);
        }
        if (created.session_id.empty()) {
            spdlog::error("subagent session creation for {} returned no id", caller_alias);
            return prompts::SUBAGENT_CREATE_FAILED;
        }
        const std::string session_id = created.session_id;

        std::string root = context_.registry.root_of(caller).value_or("");
        if (root.empty()) {
            root = context_.lookup.root_of(caller);
        }
        auto alias = context_.registry.register_session(session_id, root);
        if (!alias) {
            return prompts::subagent_error("session " + session_id + " could not be registered");
        }

        context_.registry.set_depth(session_id, caller_depth + 1);
        context_.tracker.track(session_id, *alias);
        context_.barrier.add_pending(caller, session_id);

        SubagentInfo info;
        info.session_id = session_id;
        info.alias = *alias;
        info.description = description;
        info.parent_session_id = caller;
        info.parent_id = *parent;
        info.prompt = args.prompt;
        info.depth = caller_depth + 1;
        info.created_at = Clock::now();
        context_.universe.add_subagent(info);

        spdlog::info("{} spawned {} (session {}, depth {})", caller_alias, *alias, session_id, caller_depth + 1);
        context_.updates.subagent_spawned(caller, caller_alias, *alias, description);

        const std::string prompt = args.prompt;
        const std::string new_alias = *alias;
        bool submitted = context_.tasks.submit("subagent:" + new_alias,
            [this, caller, session_id, new_alias, prompt]() {
                run_subagent(caller, session_id, new_alias, prompt);
            });
        if (!submitted) {
            context_.barrier.remove_pending(caller, session_id);
            context_.tracker.mark_idle(session_id, new_alias);
            return prompts::subagent_error("coordinator is shutting down");
        }

        return prompts::subagent_result(new_alias, session_id, description);

    } catch (const std::exception& e) {
        spdlog::error("subagent failed for {}: {}", call.session_id, e.what());
        return prompts::subagent_error(e.what());
    }
}

void SubagentTool::run_subagent(const std::string& caller_session, const std::string& session_id,
                                const std::string& alias, const std::string& prompt) {
    auto status = context_.host.prompt(session_id, prompt);
    if (!status.success) {
        spdlog::error("Subagent {} prompt failed: {}", alias, status.error);
    } else {
        spdlog::info("Subagent {} finished its turn", alias);
    }

    if (context_.registry.is_retired(session_id)) {
        spdlog::debug("Subagent {} finished after its universe was reset", alias);
        return;
    }

    std::string output = context_.lookup.final_output(session_id, alias);
    context_.ledger.archive(alias, output);
    context_.universe.complete_subagent(session_id, output);

    // Delivered before the child turns idle so a waiting caller finds the output
    context_.delivery.deliver(SubagentCompletion{caller_session, session_id, alias, output});

    context_.tracker.mark_idle(session_id, alias);
    context_.updates.subagent_completed(session_id, alias);

    context_.resume.resume_if_needed(session_id);
}

} // namespace pocket::kernel
