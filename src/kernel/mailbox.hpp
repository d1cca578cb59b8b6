#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <random>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>
#include "kernel/config.hpp"
#include "kernel/types.hpp"

namespace pocket::kernel {

// Per-recipient bounded message queues.
//
// handled: the recipient replied with reply_to.
// presented: the message was shown through context assembly. Presented
// messages stay unhandled but no longer justify waking the recipient.
class MailboxStore {
public:
    explicit MailboxStore(MailboxConfig config = {});

    Message send(const std::string& from, const std::string& to, const std::string& body);

    std::vector<Message> unhandled(const std::string& session_id) const;
    std::vector<Message> needing_wake(const std::string& session_id) const;

    std::vector<HandledMessage> mark_handled(const std::string& session_id,
                                             const std::vector<uint64_t>& seqs);
    void mark_presented(const std::string& session_id, const std::vector<uint64_t>& seqs);

    // TTL sweep followed by capacity trim. Returns number of messages dropped.
    size_t expire(Clock::time_point now);

    size_t size(const std::string& session_id) const;
    size_t mailbox_count() const;
    void reset();

    const MailboxConfig& config() const { return config_; }

    static std::string truncate_body(const std::string& body, size_t max_length);

private:
    std::string generate_id();

    MailboxConfig config_;
    std::unordered_map<std::string, std::deque<Message>> mailboxes_;
    std::unordered_map<std::string, uint64_t> last_seq_;
    std::unordered_map<std::string, std::unordered_set<uint64_t>> presented_;
    std::mt19937_64 rng_;
    mutable std::mutex mutex_;
};

} // namespace pocket::kernel
