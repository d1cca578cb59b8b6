#pragma once
#include <string>
#include <vector>
#include "kernel/config.hpp"
#include "kernel/types.hpp"

namespace pocket::kernel {

class AsyncTaskManager;
class CompletionBarrier;
class DeliveryStrategy;
class IdentityRegistry;
class MailboxStore;
class ResumeEngine;
class SessionHost;
class SessionLookup;
class SessionTracker;
class SessionUpdates;
class StatusLedger;
class Universe;

// Components shared by the tool modules. Owned by the Coordinator.
struct CoordinatorContext {
    const CoordinatorConfig& config;
    SessionHost& host;
    IdentityRegistry& registry;
    MailboxStore& mailbox;
    SessionTracker& tracker;
    CompletionBarrier& barrier;
    StatusLedger& ledger;
    SessionLookup& lookup;
    SessionUpdates& updates;
    ResumeEngine& resume;
    DeliveryStrategy& delivery;
    AsyncTaskManager& tasks;
    Universe& universe;
};

// Peers of session_id with their status history, in registration order
std::vector<ParallelAgent> parallel_agents(CoordinatorContext& context, const std::string& session_id);

} // namespace pocket::kernel
