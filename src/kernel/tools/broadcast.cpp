#include "kernel/tool_handlers.hpp"
#include "kernel/tool_router.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/prompts.hpp"
#include "kernel/resume_engine.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/session_updates.hpp"
#include "kernel/status_ledger.hpp"
#include <spdlog/spdlog.h>

namespace pocket::kernel {

void BroadcastTool::register_tools(ToolRouter& router) {
    router.register_handler("broadcast",
        [this](const ToolCall& call) { return handle_broadcast(call); });
}

std::string BroadcastTool::handle_broadcast(const ToolCall& call) {
    try {
        const std::string& session_id = call.session_id;

        auto alias_opt = context_.registry.find_alias(session_id);
        if (!alias_opt) {
            spdlog::warn("broadcast from unregistered session {}", session_id);
            return prompts::BROADCAST_NOT_REGISTERED;
        }
        const std::string alias = *alias_opt;

        BroadcastArgs args = BroadcastArgs::from_json(call.args);
        if (args.message.empty()) {
            spdlog::warn("broadcast from {} without message", alias);
            return prompts::BROADCAST_MISSING_MESSAGE;
        }

        const size_t max_length = context_.mailbox.config().max_message_length;
        std::string body = MailboxStore::truncate_body(args.message, max_length);
        if (body.size() != args.message.size()) {
            spdlog::warn("broadcast from {} truncated ({} -> {} chars)", alias, args.message.size(), max_length);
        }

        auto agents = parallel_agents(context_, session_id);
        std::vector<std::string> known;
        for (const auto& agent : agents) {
            known.push_back(agent.alias);
        }

        spdlog::info("broadcast called by {} (send_to={}, reply_to={}, length={})",
                     alias, args.send_to.value_or("-"),
                     args.reply_to ? std::to_string(*args.reply_to) : "-", body.size());

        std::optional<HandledMessage> handled;
        if (args.reply_to) {
            context_.registry.mark_announced(session_id);
            auto marked = context_.mailbox.mark_handled(session_id, {*args.reply_to});
            if (!marked.empty()) {
                handled = marked.front();
                if (args.send_to && *args.send_to != handled->from) {
                    spdlog::warn("{} replied to #{}, ignoring send_to={}", alias, handled->seq, *args.send_to);
                }
            }
        }

        std::string target;
        if (handled) {
            target = handled->from;
        } else if (args.send_to) {
            target = *args.send_to;
        } else {
            // No recipient: status update only, nobody is woken
            context_.registry.mark_announced(session_id);
            std::string stored = context_.ledger.append_status(alias, body);
            spdlog::info("{} status: {}", alias, stored.substr(0, 80));
            context_.updates.status_update(session_id, alias, stored);
            return prompts::broadcast_result(alias, known, agents, std::nullopt);
        }

        auto recipient = context_.registry.resolve(target);
        if (!recipient) {
            spdlog::warn("broadcast from {} to unknown recipient {}", alias, target);
            return prompts::unknown_recipient(target, known);
        }
        if (*recipient == session_id) {
            spdlog::warn("{} tried to message itself", alias);
            return prompts::BROADCAST_SELF_MESSAGE;
        }

        const std::string recipient_alias = context_.registry.alias(*recipient);
        auto message = context_.mailbox.send(alias, *recipient, body);
        spdlog::info("{} -> {}: message #{} queued", alias, recipient_alias, message.seq);
        context_.updates.message_sent(session_id, alias, recipient_alias, body);

        if (context_.tracker.is_idle(*recipient)) {
            if (context_.resume.resume(*recipient, alias)) {
                spdlog::info("{} resumed idle {}", alias, recipient_alias);
            }
        }

        return prompts::broadcast_result(alias, {recipient_alias}, agents, handled);

    } catch (const std::exception& e) {
        spdlog::error("broadcast failed for {}: {}", call.session_id, e.what());
        return std::string("Error: invalid request: ") + e.what();
    }
}

} // namespace pocket::kernel
