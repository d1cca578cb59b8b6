#pragma once
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include "kernel/host_events.hpp"

namespace pocket::kernel {

// Dispatch table from tool name to handler. Handlers return the text the
// agent sees as the tool result.
class ToolRouter {
public:
    using Handler = std::function<std::string(const ToolCall&)>;

    ToolRouter() = default;

    std::string handle(const ToolCall& call) const;
    void register_handler(const std::string& tool, Handler handler);
    std::vector<std::string> tools() const;

private:
    std::unordered_map<std::string, Handler> handlers_;
};

} // namespace pocket::kernel
