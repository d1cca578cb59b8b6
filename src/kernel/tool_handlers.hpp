#pragma once
#include <string>
#include "kernel/context.hpp"
#include "kernel/host_events.hpp"
#include "kernel/module.hpp"

namespace pocket::kernel {

class BroadcastTool : public ToolModule {
public:
    explicit BroadcastTool(CoordinatorContext& context) : context_(context) {}
    void register_tools(ToolRouter& router) override;

private:
    std::string handle_broadcast(const ToolCall& call);
    CoordinatorContext& context_;
};

class SubagentTool : public ToolModule {
public:
    explicit SubagentTool(CoordinatorContext& context) : context_(context) {}
    void register_tools(ToolRouter& router) override;

private:
    std::string handle_subagent(const ToolCall& call);
    // Runs on the task pool until the spawned session's first turn ends
    void run_subagent(const std::string& caller_session, const std::string& session_id,
                      const std::string& alias, const std::string& prompt);
    CoordinatorContext& context_;
};

class RecallTool : public ToolModule {
public:
    explicit RecallTool(CoordinatorContext& context) : context_(context) {}
    void register_tools(ToolRouter& router) override;

private:
    std::string handle_recall(const ToolCall& call);
    CoordinatorContext& context_;
};

} // namespace pocket::kernel
