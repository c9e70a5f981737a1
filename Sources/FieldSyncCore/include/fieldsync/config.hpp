#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include "scheduler.hpp"
#include "sync_processor.hpp"
#include <nlohmann/json.hpp>
#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>

namespace fieldsync {

class config_error : public std::runtime_error {
public:
    explicit config_error(const std::string& msg) : std::runtime_error(msg) {}
};

struct fieldsync_config {
    /// Database file path. Use ":memory:" for an in-memory database.
    std::string database_path = "fieldsync.sqlite";

    /// Remote authority root, e.g. "https://cadastro.example.org".
    /// Empty = no remote configured; only usable with an injected authority.
    std::string base_url;

    /// How long a raw reachability report must stand before it counts.
    std::chrono::milliseconds debounce{2000};

    sync_options sync;

    /// Lifetime of a cached session, counted from the last online validation.
    std::chrono::seconds session_ttl{std::chrono::hours(24 * 7)};

    log_level level = log_level::warn;

    /// Scheduler for connectivity events and coordinator callbacks.
    /// nullptr = immediate_scheduler.
    std::shared_ptr<scheduler> sched = nullptr;
};

log_level log_level_from_string(const std::string& s);

/// Overlay the keys present in j onto defaults. Unknown keys are ignored;
/// wrong types or out-of-range values throw config_error.
fieldsync_config config_from_json(const nlohmann::json& j, fieldsync_config defaults = {});

/// Read a JSON config file. A missing file yields the defaults.
fieldsync_config load_config(const std::string& path);

} // namespace fieldsync

#endif // __cplusplus
