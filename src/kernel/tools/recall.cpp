#include "kernel/tool_handlers.hpp"
#include "kernel/tool_router.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/prompts.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/status_ledger.hpp"
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pocket::kernel {

void RecallTool::register_tools(ToolRouter& router) {
    router.register_handler("recall",
        [this](const ToolCall& call) { return handle_recall(call); });
}

std::string RecallTool::handle_recall(const ToolCall& call) {
    try {
        RecallArgs args = RecallArgs::from_json(call.args);
        spdlog::info("recall called by {} (agent={}, show_output={})",
                     context_.registry.alias(call.session_id),
                     args.agent_name.value_or("all"), args.show_output);

        std::vector<LiveAgent> live;
        for (const auto& identity : context_.registry.live()) {
            auto state = context_.tracker.state(identity.session_id);
            live.push_back(LiveAgent{identity.alias,
                                     state ? state->status : SessionStatus::ACTIVE});
        }

        json result = context_.ledger.query(args.agent_name, args.show_output, live,
                                            context_.config.tools.recall.cross_pocket);
        if (result["agents"].empty()) {
            if (args.agent_name) {
                return prompts::recall_not_found(*args.agent_name);
            }
            return prompts::RECALL_EMPTY;
        }
        // Host output may carry invalid UTF-8
        return result.dump(2, ' ', false, json::error_handler_t::replace);

    } catch (const std::exception& e) {
        spdlog::error("recall failed for {}: {}", call.session_id, e.what());
        json response;
        response["success"] = false;
        response["error"] = std::string("invalid request: ") + e.what();
        return response.dump();
    }
}

} // namespace pocket::kernel
