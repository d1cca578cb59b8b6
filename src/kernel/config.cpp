#include "kernel/config.hpp"
#include "core/config.hpp"
#include "core/paths.hpp"
#include <spdlog/spdlog.h>

using json = nlohmann::json;

namespace pocket::kernel {

namespace {

void read_ms(const json& j, const char* key, std::chrono::milliseconds& out) {
    if (j.contains(key)) {
        out = std::chrono::milliseconds(j.at(key).get<int64_t>());
    }
}

template <typename T>
void read(const json& j, const char* key, T& out) {
    if (j.contains(key)) {
        out = j.at(key).get<T>();
    }
}

} // namespace

CoordinatorConfig config_from_json(const json& j, CoordinatorConfig base) {
    CoordinatorConfig config = std::move(base);
    if (!j.is_object()) {
        return config;
    }

    if (j.contains("logging")) {
        const auto& logging = j.at("logging");
        // Older files use a plain boolean to switch the debug log on.
        if (logging.is_boolean()) {
            if (logging.get<bool>()) {
                config.logging.level = "debug";
            }
        } else {
            read(logging, "level", config.logging.level);
            read(logging, "file", config.logging.file);
        }
    }

    if (j.contains("mailbox")) {
        const auto& m = j.at("mailbox");
        read(m, "capacity", config.mailbox.capacity);
        read(m, "max_message_length", config.mailbox.max_message_length);
        read_ms(m, "handled_ttl_ms", config.mailbox.handled_ttl);
        read_ms(m, "unhandled_ttl_ms", config.mailbox.unhandled_ttl);
    }

    if (j.contains("ledger")) {
        const auto& l = j.at("ledger");
        read(l, "max_status_length", config.ledger.max_status_length);
        read(l, "max_status_history", config.ledger.max_status_history);
    }

    if (j.contains("barrier")) {
        const auto& b = j.at("barrier");
        read(b, "max_iterations", config.barrier.max_iterations);
        read_ms(b, "child_wait_timeout_ms", config.barrier.child_wait_timeout);
        read_ms(b, "poll_interval_ms", config.barrier.poll_interval);
    }

    if (j.contains("resume")) {
        read(j.at("resume"), "max_chain_length", config.resume.max_chain_length);
    }

    if (j.contains("reaper")) {
        const auto& r = j.at("reaper");
        read_ms(r, "interval_ms", config.reaper.interval);
        read_ms(r, "parent_cache_ttl_ms", config.reaper.parent_cache_ttl);
        read_ms(r, "parent_failure_ttl_ms", config.reaper.parent_failure_ttl);
    }

    if (j.contains("tools")) {
        const auto& t = j.at("tools");
        read(t, "broadcast", config.tools.broadcast);
        if (t.contains("subagent")) {
            const auto& s = t.at("subagent");
            read(s, "enabled", config.tools.subagent.enabled);
            read(s, "max_depth", config.tools.subagent.max_depth);
            read(s, "forced_attention", config.tools.subagent.forced_attention);
        }
        if (t.contains("recall")) {
            const auto& r = t.at("recall");
            if (r.is_boolean()) {
                config.tools.recall.enabled = r.get<bool>();
            } else {
                read(r, "enabled", config.tools.recall.enabled);
                read(r, "cross_pocket", config.tools.recall.cross_pocket);
            }
        }
    }

    if (j.contains("session_update")) {
        const auto& u = j.at("session_update");
        if (u.contains("broadcast")) {
            read(u.at("broadcast"), "status_update", config.session_update.status_update);
            read(u.at("broadcast"), "message_sent", config.session_update.message_sent);
        }
        if (u.contains("subagent")) {
            read(u.at("subagent"), "creation", config.session_update.subagent_spawned);
            read(u.at("subagent"), "completion", config.session_update.subagent_completed);
            read(u.at("subagent"), "resumption", config.session_update.session_resumed);
        }
        if (u.contains("user")) {
            read(u.at("user"), "message_sent", config.session_update.user_message_sent);
        }
    }

    read(j, "workers", config.worker_count);
    if (config.worker_count == 0) {
        config.worker_count = 1;
    }

    return config;
}

CoordinatorConfig load_coordinator_config(const std::optional<std::filesystem::path>& path) {
    CoordinatorConfig config;

    auto source = path ? path : core::paths::find_config();
    if (source) {
        auto document = core::config::load_json_file(*source);
        if (document) {
            try {
                config = config_from_json(*document);
                spdlog::info("Loaded config from {}", source->string());
            } catch (const json::exception& e) {
                spdlog::warn("Invalid config {}: {} (using defaults)", source->string(), e.what());
                config = CoordinatorConfig{};
            }
        }
    }

    auto level = core::config::get_env("POCKET_LOG_LEVEL");
    if (!level.empty()) {
        config.logging.level = level;
    }
    return config;
}

} // namespace pocket::kernel
