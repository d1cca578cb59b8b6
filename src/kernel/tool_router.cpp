#include "kernel/tool_router.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pocket::kernel {

std::string ToolRouter::handle(const ToolCall& call) const {
    auto it = handlers_.find(call.tool);
    if (it != handlers_.end()) {
        return it->second(call);
    }

    spdlog::warn("Unknown tool '{}' called by {}", call.tool, call.session_id);
    return "Error: Unknown tool '" + call.tool + "'.";
}

void ToolRouter::register_handler(const std::string& tool, Handler handler) {
    handlers_[tool] = std::move(handler);
}

std::vector<std::string> ToolRouter::tools() const {
    std::vector<std::string> names;
    names.reserve(handlers_.size());
    for (const auto& [name, handler] : handlers_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());
    return names;
}

} // namespace pocket::kernel
