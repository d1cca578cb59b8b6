#include "kernel/context.hpp"
#include "kernel/identity_registry.hpp"
#include "kernel/session_tracker.hpp"
#include "kernel/status_ledger.hpp"

namespace pocket::kernel {

std::vector<ParallelAgent> parallel_agents(CoordinatorContext& context, const std::string& session_id) {
    std::vector<ParallelAgent> agents;
    for (const auto& peer : context.registry.peers(session_id)) {
        ParallelAgent agent;
        agent.alias = peer.alias;
        agent.status = context.ledger.history(peer.alias);
        agent.idle = context.tracker.is_idle(peer.session_id);
        agents.push_back(std::move(agent));
    }
    return agents;
}

} // namespace pocket::kernel
