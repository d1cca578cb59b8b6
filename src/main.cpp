#include <chrono>
#include <filesystem>
#include <iostream>
#include <optional>
#include <thread>
#include <vector>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "core/logger.hpp"
#include "host/local_host.hpp"
#include "kernel/async_task_manager.hpp"
#include "kernel/config.hpp"
#include "kernel/coordinator.hpp"
#include "kernel/identity_registry.hpp"

using json = nlohmann::json;
using namespace pocket;

namespace {

const char* const MAIN_SESSION = "ses_main";

kernel::ToolCall tool_call(const std::string& tool, const std::string& session_id, json args) {
    kernel::ToolCall call;
    call.tool = tool;
    call.session_id = session_id;
    call.args = std::move(args);
    return call;
}

// Drives one task child the way the host would: first turn, then the
// completion barrier until it lets the session finish.
void run_child(host::LocalHost& host, kernel::Coordinator& coordinator,
               const std::string& session_id, const std::string& prompt) {
    coordinator.on_system_transform(session_id);
    auto status = host.prompt(session_id, prompt);
    if (!status.success) {
        spdlog::error("Child {} failed: {}", session_id, status.error);
    }

    for (;;) {
        auto outcome = coordinator.on_before_complete(session_id);
        if (outcome.kind != kernel::BarrierOutcome::Kind::RESUME) {
            break;
        }
        coordinator.on_messages_transform(session_id);
        status = host.prompt(session_id, outcome.resume_prompt);
        if (!status.success) {
            spdlog::error("Resume of child {} failed: {}", session_id, status.error);
        }
    }

    kernel::ToolExecuteAfter after;
    after.tool = "task";
    after.session_id = MAIN_SESSION;
    after.child_session_id = session_id;
    coordinator.on_tool_after(after);
}

} // namespace

int main(int argc, char* argv[]) {
    std::optional<std::filesystem::path> config_path;
    if (argc > 1) {
        config_path = argv[1];
    }

    // Console first so config loading can report problems
    core::init_logger();
    auto config = kernel::load_coordinator_config(config_path);
    if (!config.logging.file.empty()) {
        core::add_log_file(config.logging.file);
    }
    core::set_log_level(core::parse_log_level(config.logging.level));

    spdlog::info("pocket_sim starting");

    host::LocalHost host;
    host.add_session(MAIN_SESSION, "", "main");

    kernel::Coordinator coordinator(host, config);
    coordinator.start();

    // Scripted agents: the first task child announces itself, spawns a
    // helper and messages its sibling; the sibling replies.
    host.set_responder([&](const std::string& session_id, const std::string& prompt) -> std::string {
        const std::string alias = coordinator.registry().alias(session_id);
        const std::string title = host.title(session_id);

        if (title.find("subagent") != std::string::npos) {
            return "Summary of the API docs: three endpoints, token auth.";
        }
        if (prompt.rfind("Research", 0) == 0) {
            coordinator.handle_tool(tool_call("broadcast", session_id, {{"message", "Researching the API"}}));
            std::cout << coordinator.handle_tool(tool_call("subagent", session_id,
                {{"prompt", "Summarize the API docs"}, {"description", "Summarize docs"}})) << "\n\n";
            coordinator.handle_tool(tool_call("broadcast", session_id,
                {{"send_to", "agentB"}, {"message", "hi, which endpoints do you need?"}}));
            return "Research started.";
        }
        if (prompt.rfind("Build", 0) == 0) {
            coordinator.handle_tool(tool_call("broadcast", session_id, {{"message", "Building the client"}}));
            return "Client scaffolded.";
        }

        auto injection = coordinator.on_messages_transform(session_id);
        if (injection.inbox && injection.inbox->contains("messages")) {
            for (const auto& message : (*injection.inbox)["messages"]) {
                if (message.value("content", "").rfind("hi", 0) != 0) {
                    continue;
                }
                coordinator.handle_tool(tool_call("broadcast", session_id,
                    {{"reply_to", message["id"]}, {"message", "bye from " + alias}}));
            }
        }
        return alias + " processed its inbox.";
    });

    for (const auto& description : {"Research API", "Build client"}) {
        coordinator.on_tool_before(tool_call("task", MAIN_SESSION, {{"description", description}}));
    }
    auto child_a = host.create_session(MAIN_SESSION, "Research API");
    auto child_b = host.create_session(MAIN_SESSION, "Build client");
    if (!child_a.success || !child_b.success) {
        spdlog::error("Failed to create task sessions");
        return 1;
    }

    // Register both before either runs so they can see each other
    coordinator.on_system_transform(child_a.session_id);
    coordinator.on_system_transform(child_b.session_id);

    std::thread a(run_child, std::ref(host), std::ref(coordinator), child_a.session_id,
                  std::string("Research the API"));
    std::thread b(run_child, std::ref(host), std::ref(coordinator), child_b.session_id,
                  std::string("Build the client"));
    a.join();
    b.join();

    if (!coordinator.tasks().wait_idle(std::chrono::seconds(5))) {
        spdlog::warn("Background tasks still running after 5s");
    }

    std::cout << coordinator.handle_tool(tool_call("recall", MAIN_SESSION, json::object())) << "\n";

    auto cover = coordinator.on_messages_transform(MAIN_SESSION);
    if (cover.summary_cover) {
        std::cout << "\n" << *cover.summary_cover;
    }

    coordinator.shutdown();
    spdlog::info("pocket_sim finished");
    return 0;
}
