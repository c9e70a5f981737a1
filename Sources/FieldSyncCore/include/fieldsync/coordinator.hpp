#pragma once

#ifdef __cplusplus

#include "auth_cache.hpp"
#include "connectivity.hpp"
#include "local_store.hpp"
#include "remote.hpp"
#include "sync_processor.hpp"
#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace fieldsync {

/// Read-only snapshot for status indicators.
struct sync_status_view {
    connectivity_mode mode = connectivity_mode::offline;
    auth_mode auth = auth_mode::unauthenticated;
    queue_stats queue;
    std::optional<drain_report> last_drain;
    std::optional<timestamp_t> offline_since;
    bool requires_reauthentication = false;
    bool draining = false;
};

// ============================================================================
// sync_coordinator - connectivity transitions drive auth refresh and drains
// ============================================================================
//
// offline -> online: validate the cached session, then drain unless the
//                    remote refused it.
// online -> offline: record offline mode; queued items stay pending.
//
// Apart from request_drain() and retry_failed_item(), nothing else starts a
// drain. While a new login is required, no drain runs at all.

class sync_coordinator {
public:
    using auth_expired_handler = std::function<void(const std::string& reason)>;
    using drain_complete_handler = std::function<void(const drain_report& report)>;
    using error_handler = std::function<void(const std::string& error)>;

    sync_coordinator(local_store& store,
                     connectivity_monitor& monitor,
                     offline_auth_cache& auth,
                     remote_authority& remote,
                     sync_options options = {});
    ~sync_coordinator();

    sync_coordinator(const sync_coordinator&) = delete;
    sync_coordinator& operator=(const sync_coordinator&) = delete;

    /// Apply the startup policy for the monitor's current mode; when online
    /// with a cached session, validate it and drain.
    auth_mode start();

    /// Explicit drain. Returns the report, or a deferred report without
    /// touching the queue when a login is required or a drain is running.
    drain_report request_drain();

    /// Move a failed item back to pending and drain if online. Returns false
    /// when blocked by a required login or the item was not failed.
    bool retry_failed_item(const global_id_t& id);

    /// Online login; a successful login drains the queue when online.
    validation_result login(const credentials& creds);
    void logout();

    sync_status_view status();

    void set_on_auth_expired(auth_expired_handler handler) { on_auth_expired_ = std::move(handler); }
    void set_on_drain_complete(drain_complete_handler handler) { on_drain_complete_ = std::move(handler); }
    void set_on_error(error_handler handler) { on_error_ = std::move(handler); }

    bool is_draining() const { return drain_in_progress_.load(); }
    sync_processor& processor() { return processor_; }

private:
    local_store& store_;
    connectivity_monitor& monitor_;
    offline_auth_cache& auth_;
    remote_authority& remote_;
    sync_processor processor_;

    connectivity_monitor::subscription_id subscription_ = 0;
    std::atomic<bool> drain_in_progress_{false};
    std::mutex report_mutex_;
    std::optional<drain_report> last_report_;

    auth_expired_handler on_auth_expired_;
    drain_complete_handler on_drain_complete_;
    error_handler on_error_;

    void on_transition(const connectivity_event& event);
    void refresh_and_drain();
    drain_report run_drain();
    void notify_auth_expired(const std::string& reason);
    void notify_error(const std::string& error);
};

} // namespace fieldsync

#endif // __cplusplus
