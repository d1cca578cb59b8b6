#include "kernel/coordinator.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/context.hpp"
#include "kernel/delivery.hpp"
#include "kernel/event_bus.hpp"
#include "kernel/host.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/mailbox.hpp"
#include "kernel/parent_cache.hpp"
#include "kernel/prompts.hpp"
#include "kernel/reaper.hpp"
#include "kernel/resume_engine.hpp"
#include "kernel/session_lookup.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/session_updates.hpp"
#include "kernel/status_ledger.hpp"
#include "kernel/tool_handlers.hpp"
#include "kernel/universe.hpp"
#include <cctype>
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pocket::kernel {

namespace {

std::string trim(const std::string& text) {
    const char* ws = " \t\r\n";
    auto begin = text.find_first_not_of(ws);
    if (begin == std::string::npos) {
        return "";
    }
    auto end = text.find_last_not_of(ws);
    return text.substr(begin, end - begin + 1);
}

bool is_alias_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '_';
}

} // namespace

std::optional<PocketCommand> parse_pocket_command(const std::string& input) {
    std::string trimmed = trim(input);
    if (trimmed.empty()) {
        return std::nullopt;
    }

    if (trimmed[0] == '@') {
        size_t end = 1;
        while (end < trimmed.size() && is_alias_char(trimmed[end])) {
            ++end;
        }
        if (end > 1 && end < trimmed.size() && std::isspace(static_cast<unsigned char>(trimmed[end]))) {
            std::string message = trim(trimmed.substr(end));
            if (!message.empty()) {
                return PocketCommand{trimmed.substr(1, end - 1), message};
            }
        }
    }
    return PocketCommand{std::nullopt, trimmed};
}

Coordinator::Coordinator(SessionHost& host, CoordinatorConfig config)
    : config_(std::move(config))
    , host_(host) {
    registry_ = std::make_unique<IdentityRegistry>();
    mailbox_ = std::make_unique<MailboxStore>(config_.mailbox);
    tracker_ = std::make_unique<SessionTracker>();
    barrier_ = std::make_unique<CompletionBarrier>(*tracker_, *mailbox_, *registry_, config_.barrier);
    ledger_ = std::make_unique<StatusLedger>(config_.ledger);
    parents_ = std::make_unique<ParentCache>(config_.reaper.parent_cache_ttl, config_.reaper.parent_failure_ttl);
    lookup_ = std::make_unique<SessionLookup>(host_, *parents_);
    universe_ = std::make_unique<Universe>();
    bus_ = std::make_unique<EventBus>();
    tasks_ = std::make_unique<AsyncTaskManager>(config_.worker_count);
    updates_ = std::make_unique<SessionUpdates>(*bus_, host_, *tasks_, *registry_, config_.session_update);
    resume_ = std::make_unique<ResumeEngine>(host_, *tracker_, *mailbox_, *registry_, *tasks_,
                                             *updates_, config_.resume);
    delivery_ = make_delivery_strategy(config_.tools.subagent, host_, *mailbox_, *tracker_, *resume_);
    reaper_ = std::make_unique<Reaper>(*mailbox_, *parents_, config_.reaper.interval);

    barrier_->set_pending_output_source([this](const std::string& session_id) {
        return delivery_->take_pending(session_id);
    });

    context_ = std::make_unique<CoordinatorContext>(CoordinatorContext{
        config_, host_, *registry_, *mailbox_, *tracker_, *barrier_, *ledger_, *lookup_,
        *updates_, *resume_, *delivery_, *tasks_, *universe_});

    if (config_.tools.broadcast) {
        modules_.push_back(std::make_unique<BroadcastTool>(*context_));
    }
    if (config_.tools.subagent.enabled) {
        modules_.push_back(std::make_unique<SubagentTool>(*context_));
    }
    if (config_.tools.recall.enabled) {
        modules_.push_back(std::make_unique<RecallTool>(*context_));
    }
    for (auto& module : modules_) {
        module->register_tools(router_);
    }

    spdlog::info("Coordinator ready (delivery={}, workers={}, max_depth={})",
                 delivery_->name(), config_.worker_count, config_.tools.subagent.max_depth);
}

Coordinator::~Coordinator() {
    shutdown();
}

void Coordinator::start() {
    reaper_->start();
}

void Coordinator::shutdown() {
    reaper_->stop();
    tasks_->shutdown();
}

std::string Coordinator::handle_tool(const ToolCall& call) {
    try {
        return router_.handle(call);
    } catch (const std::exception& e) {
        spdlog::error("Tool {} failed for {}: {}", call.tool, call.session_id, e.what());
        return std::string("Error: ") + e.what();
    }
}

json Coordinator::handle_tool_json(const json& payload) {
    json response;
    try {
        ToolCall call = ToolCall::from_json(payload);
        response["success"] = true;
        response["output"] = handle_tool(call);
    } catch (const std::exception& e) {
        spdlog::error("Failed to parse tool call: {}", e.what());
        response["success"] = false;
        response["error"] = std::string("invalid request: ") + e.what();
    }
    return response;
}

std::optional<std::string> Coordinator::ensure_registered(const std::string& session_id) {
    if (auto alias = registry_->find_alias(session_id)) {
        return alias;
    }
    if (registry_->is_retired(session_id)) {
        return std::nullopt;
    }
    if (!lookup_->is_child(session_id)) {
        return std::nullopt;
    }
    return registry_->register_session(session_id, lookup_->root_of(session_id));
}

std::vector<std::string> Coordinator::on_system_transform(const std::string& session_id) {
    try {
        auto parent = lookup_->parent_of(session_id);
        if (!parent) {
            return {};
        }

        auto alias = ensure_registered(session_id);
        if (!alias) {
            return {};
        }
        tracker_->track(session_id, *alias);

        if (!lookup_->parent_of(*parent)) {
            universe_->track_first_level(*parent, session_id, *alias);
        }

        if (ledger_->history(*alias).empty()) {
            if (auto description = universe_->pop_task_description(*parent)) {
                ledger_->append_status(*alias, *description);
                spdlog::info("Applied task description as initial status of {}", *alias);
            }
        }

        const int depth = registry_->depth(session_id);
        prompts::SystemPromptOptions options;
        options.subagent_enabled = config_.tools.subagent.enabled;
        options.allow_subagent = depth < config_.tools.subagent.max_depth;
        options.recall_enabled = config_.tools.recall.enabled;
        options.depth = depth;
        options.max_depth = config_.tools.subagent.max_depth;
        return {prompts::system_prompt(options)};

    } catch (const std::exception& e) {
        spdlog::error("system transform failed for {}: {}", session_id, e.what());
        return {};
    }
}

void Coordinator::on_tool_before(const ToolCall& call) {
    try {
        if (call.tool != "task") {
            return;
        }
        std::string description = call.args.value("description", "");
        if (description.empty()) {
            return;
        }
        universe_->push_task_description(call.session_id, description);
        spdlog::debug("Captured task description for children of {}", call.session_id);
    } catch (const std::exception& e) {
        spdlog::error("tool.before failed for {}: {}", call.session_id, e.what());
    }
}

void Coordinator::on_tool_after(const ToolExecuteAfter& event) {
    try {
        if (event.tool != "task" || event.child_session_id.empty()) {
            return;
        }
        const std::string& child = event.child_session_id;
        if (registry_->is_retired(child)) {
            spdlog::debug("task result for retired session {}, ignoring", child);
            return;
        }

        auto alias = ensure_registered(child);
        if (!alias) {
            return;
        }
        tracker_->mark_idle(child, *alias);
        resume_->resume_if_needed(child);
    } catch (const std::exception& e) {
        spdlog::error("tool.after failed for {}: {}", event.session_id, e.what());
    }
}

void Coordinator::on_session_idle(const std::string& session_id) {
    try {
        auto alias = registry_->find_alias(session_id);
        if (!alias) {
            return;
        }
        tracker_->mark_idle(session_id, *alias);

        auto subagent = universe_->subagent(session_id);
        if (subagent && !subagent->completed) {
            ledger_->record_output(*alias, lookup_->final_output(session_id, *alias));
        }

        resume_->resume_if_needed(session_id);
    } catch (const std::exception& e) {
        spdlog::error("session.idle failed for {}: {}", session_id, e.what());
    }
}

BarrierOutcome Coordinator::on_before_complete(const std::string& session_id) {
    BarrierOutcome outcome;
    try {
        auto alias = registry_->find_alias(session_id);
        if (!alias) {
            return outcome;
        }

        outcome = barrier_->await(session_id);
        spdlog::info("before_complete for {}: {} after {} iteration(s)", *alias,
                     barrier_outcome_to_string(outcome.kind), outcome.iterations);
        if (outcome.kind == BarrierOutcome::Kind::RESUME) {
            return outcome;
        }

        finish_first_level(session_id, *alias);
    } catch (const std::exception& e) {
        spdlog::error("before_complete failed for {}: {}", session_id, e.what());
    }
    return outcome;
}

void Coordinator::finish_first_level(const std::string& session_id, const std::string& alias) {
    ledger_->archive(alias, lookup_->final_output(session_id, alias));

    auto parent = lookup_->parent_of(session_id);
    if (!parent || lookup_->parent_of(*parent)) {
        return;
    }

    auto remaining = universe_->complete_first_level(*parent, session_id);
    if (!remaining) {
        spdlog::warn("No first-level tracking for {}, ending universe on {}", *parent, alias);
        finish_universe(*parent);
        return;
    }

    spdlog::info("First-level child {} completed, {} remaining", alias, *remaining);
    if (*remaining == 0) {
        finish_universe(*parent);
    }
}

void Coordinator::finish_universe(const std::string& main_session_id) {
    std::vector<std::pair<std::string, std::vector<std::string>>> agents;
    for (const auto& identity : registry_->live()) {
        if (identity.root_id == main_session_id) {
            agents.emplace_back(identity.alias, ledger_->history(identity.alias));
        }
    }

    if (auto summary = prompts::universe_summary(agents)) {
        universe_->set_summary(main_session_id, *summary);
        std::string text = *summary;
        tasks_->submit("summary:" + main_session_id, [this, main_session_id, text]() {
            auto status = host_.persist(main_session_id, text, true);
            if (!status.success) {
                spdlog::error("Failed to post universe summary to {}: {}", main_session_id, status.error);
            }
        });
        spdlog::info("All first-level children of {} done, posting summary of {} agent(s)",
                     main_session_id, agents.size());
    }

    reset_universe(main_session_id);
}

void Coordinator::reset_universe(const std::string& main_session_id) {
    auto retired = registry_->reset();
    mailbox_->reset();
    tracker_->reset();
    barrier_->reset();
    ledger_->clear_live();
    delivery_->reset();
    universe_->reset();
    spdlog::info("Pocket universe under {} ended, {} session(s) retired", main_session_id, retired.size());
}

ContextInjection Coordinator::on_messages_transform(const std::string& session_id) {
    ContextInjection injection;
    try {
        auto parent = lookup_->parent_of(session_id);
        if (!parent) {
            injection.summary_cover = universe_->summary(session_id);
            return injection;
        }

        auto alias = ensure_registered(session_id);
        if (!alias) {
            return injection;
        }

        if (auto pending = delivery_->take_pending(session_id)) {
            injection.pending_outputs.push_back(*pending);
        }
        for (const auto& subagent : universe_->take_subagent_notices(session_id)) {
            injection.subagent_notices.push_back(prompts::subagent_running(subagent.alias, subagent.description));
        }

        json inbox;
        inbox["you_are"] = *alias;
        if (!registry_->announced(session_id)) {
            inbox["hint"] = prompts::ANNOUNCE_HINT;
        }

        auto agents = parallel_agents(*context_, session_id);
        if (!agents.empty()) {
            json list = json::array();
            for (const auto& agent : agents) {
                list.push_back({{"name", agent.alias}, {"status", agent.status}});
            }
            inbox["agents"] = list;
        }

        auto messages = mailbox_->unhandled(session_id);
        if (!messages.empty()) {
            json list = json::array();
            std::vector<uint64_t> seqs;
            for (const auto& message : messages) {
                list.push_back({{"id", message.seq}, {"from", message.from}, {"content", message.body}});
                seqs.push_back(message.seq);
            }
            inbox["messages"] = list;
            mailbox_->mark_presented(session_id, seqs);
        }

        spdlog::debug("Inbox for {}: {} agent(s), {} message(s)", *alias, agents.size(), messages.size());
        injection.inbox = inbox;

    } catch (const std::exception& e) {
        spdlog::error("messages transform failed for {}: {}", session_id, e.what());
    }
    return injection;
}

CommandResult Coordinator::pocket_command(const std::string& main_session_id, const std::string& input) {
    try {
        auto command = parse_pocket_command(input);
        if (!command) {
            return {false, prompts::POCKET_EMPTY_INPUT};
        }

        spdlog::info("/pocket from {} to {} ({} chars)", main_session_id,
                     command->target.value_or("coordinator"), command->message.size());

        if (!universe_->pocket_id()) {
            spdlog::warn("/pocket failed, no active universe");
            return {false, prompts::POCKET_NO_UNIVERSE};
        }

        std::string target_session;
        std::string target_alias;
        if (command->target) {
            target_alias = *command->target;
            auto resolved = registry_->resolve(target_alias);
            if (!resolved) {
                spdlog::warn("/pocket failed, {} not found", target_alias);
                return {false, prompts::pocket_agent_not_found(target_alias)};
            }
            target_session = *resolved;
        } else {
            auto coordinator = universe_->coordinator(main_session_id);
            if (!coordinator) {
                spdlog::warn("/pocket failed, no coordinator for {}", main_session_id);
                return {false, prompts::POCKET_NO_COORDINATOR};
            }
            target_session = coordinator->session_id;
            target_alias = coordinator->alias;
        }

        if (registry_->is_retired(target_session)) {
            spdlog::warn("/pocket failed, {} belongs to a finished universe", target_alias);
            return {false, prompts::pocket_agent_finished(target_alias)};
        }

        const std::string text = prompts::user_message(command->message);
        const bool woke = tracker_->try_activate(target_session);
        bool submitted = tasks_->submit("pocket:" + target_alias,
            [this, target_session, target_alias, text, woke]() {
                auto status = host_.prompt(target_session, text);
                if (woke && !registry_->is_retired(target_session)) {
                    tracker_->mark_idle(target_session, target_alias);
                }
                if (!status.success) {
                    spdlog::error("/pocket prompt to {} failed: {}", target_alias, status.error);
                }
            });
        if (!submitted) {
            if (woke) {
                tracker_->mark_idle(target_session, target_alias);
            }
            return {false, prompts::pocket_send_failed(target_alias, "coordinator is shutting down")};
        }

        updates_->user_message_sent(main_session_id, target_alias, command->message);
        return {true, prompts::pocket_sent(target_alias)};

    } catch (const std::exception& e) {
        spdlog::error("/pocket failed: {}", e.what());
        return {false, std::string("Internal error: ") + e.what()};
    }
}

} // namespace pocket::kernel
