#include "kernel/mailbox.hpp"
#include "core/text.hpp"
#include <algorithm>
#include <spdlog/spdlog.h>

namespace pocket::kernel {

namespace {

constexpr const char* TRUNCATION_MARKER = "... [truncated]";

} // namespace

MailboxStore::MailboxStore(MailboxConfig config)
    : config_(config)
    , rng_(std::random_device{}()) {
    if (config_.capacity == 0) {
        config_.capacity = 1;
    }
}

std::string MailboxStore::truncate_body(const std::string& body, size_t max_length) {
    if (body.size() <= max_length) {
        return body;
    }
    return core::text::truncate_utf8(body, max_length) + TRUNCATION_MARKER;
}

std::string MailboxStore::generate_id() {
    static const char alphabet[] = "0123456789abcdefghijklmnopqrstuvwxyz";
    std::uniform_int_distribution<size_t> dist(0, sizeof(alphabet) - 2);
    std::string id(8, '0');
    for (auto& c : id) {
        c = alphabet[dist(rng_)];
    }
    return id;
}

Message MailboxStore::send(const std::string& from, const std::string& to, const std::string& body) {
    std::lock_guard<std::mutex> lock(mutex_);

    Message message;
    message.id = generate_id();
    message.seq = ++last_seq_[to];
    message.from = from;
    message.to = to;
    message.body = truncate_body(body, config_.max_message_length);
    message.created_at = Clock::now();

    if (message.body.size() != body.size()) {
        spdlog::warn("Message from {} to {} truncated ({} -> {} chars)",
                     from, to, body.size(), config_.max_message_length);
    }

    auto& queue = mailboxes_[to];
    if (queue.size() >= config_.capacity) {
        auto handled = std::find_if(queue.begin(), queue.end(),
                                    [](const Message& m) { return m.handled; });
        if (handled != queue.end()) {
            queue.erase(handled);
        } else {
            queue.pop_front();
        }
        spdlog::warn("Mailbox for {} full, removed oldest message", to);
    }

    queue.push_back(message);
    spdlog::info("Message #{} sent {} -> {} ({} chars)", message.seq, from, to, message.body.size());
    return message;
}

std::vector<Message> MailboxStore::unhandled(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Message> result;
    auto it = mailboxes_.find(session_id);
    if (it == mailboxes_.end()) {
        return result;
    }
    for (const auto& message : it->second) {
        if (!message.handled) {
            result.push_back(message);
        }
    }
    return result;
}

std::vector<Message> MailboxStore::needing_wake(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<Message> result;
    auto it = mailboxes_.find(session_id);
    if (it == mailboxes_.end()) {
        return result;
    }

    const std::unordered_set<uint64_t>* presented = nullptr;
    auto presented_it = presented_.find(session_id);
    if (presented_it != presented_.end()) {
        presented = &presented_it->second;
    }

    for (const auto& message : it->second) {
        if (message.handled) {
            continue;
        }
        if (presented && presented->count(message.seq) > 0) {
            continue;
        }
        result.push_back(message);
    }
    return result;
}

std::vector<HandledMessage> MailboxStore::mark_handled(const std::string& session_id,
                                                       const std::vector<uint64_t>& seqs) {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<HandledMessage> handled;
    auto it = mailboxes_.find(session_id);
    if (it == mailboxes_.end()) {
        return handled;
    }

    for (auto& message : it->second) {
        if (message.handled) {
            continue;
        }
        if (std::find(seqs.begin(), seqs.end(), message.seq) == seqs.end()) {
            continue;
        }
        message.handled = true;
        handled.push_back(HandledMessage{message.seq, message.from, message.body});
        spdlog::info("Message #{} for {} marked handled (from {})", message.seq, session_id, message.from);
    }
    return handled;
}

void MailboxStore::mark_presented(const std::string& session_id, const std::vector<uint64_t>& seqs) {
    if (seqs.empty()) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    auto& presented = presented_[session_id];
    presented.insert(seqs.begin(), seqs.end());
    spdlog::debug("Marked {} message(s) presented for {}", seqs.size(), session_id);
}

size_t MailboxStore::expire(Clock::time_point now) {
    std::lock_guard<std::mutex> lock(mutex_);

    size_t removed = 0;
    for (auto it = mailboxes_.begin(); it != mailboxes_.end(); ) {
        auto& queue = it->second;
        size_t before = queue.size();

        std::deque<Message> alive;
        for (auto& message : queue) {
            auto age = now - message.created_at;
            auto ttl = message.handled ? config_.handled_ttl : config_.unhandled_ttl;
            if (age < ttl) {
                alive.push_back(std::move(message));
            }
        }

        if (alive.size() > config_.capacity) {
            // Unhandled first, then the newest handled ones. Queue order is kept.
            std::vector<uint64_t> unhandled_seqs;
            std::vector<uint64_t> handled_seqs;
            for (const auto& message : alive) {
                (message.handled ? handled_seqs : unhandled_seqs).push_back(message.seq);
            }

            std::unordered_set<uint64_t> keep;
            if (unhandled_seqs.size() >= config_.capacity) {
                keep.insert(unhandled_seqs.end() - static_cast<std::ptrdiff_t>(config_.capacity),
                            unhandled_seqs.end());
            } else {
                keep.insert(unhandled_seqs.begin(), unhandled_seqs.end());
                size_t room = config_.capacity - unhandled_seqs.size();
                keep.insert(handled_seqs.end() - static_cast<std::ptrdiff_t>(room), handled_seqs.end());
            }

            std::deque<Message> trimmed;
            for (auto& message : alive) {
                if (keep.count(message.seq) > 0) {
                    trimmed.push_back(std::move(message));
                }
            }
            alive = std::move(trimmed);
        }

        removed += before - alive.size();
        queue = std::move(alive);

        if (queue.empty()) {
            it = mailboxes_.erase(it);
        } else {
            ++it;
        }
    }

    if (removed > 0) {
        spdlog::debug("Mailbox sweep removed {} expired message(s)", removed);
    }
    return removed;
}

size_t MailboxStore::size(const std::string& session_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = mailboxes_.find(session_id);
    return it != mailboxes_.end() ? it->second.size() : 0;
}

size_t MailboxStore::mailbox_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return mailboxes_.size();
}

void MailboxStore::reset() {
    std::lock_guard<std::mutex> lock(mutex_);
    mailboxes_.clear();
    last_seq_.clear();
    presented_.clear();
}

} // namespace pocket::kernel
