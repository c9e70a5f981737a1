#pragma once

#ifdef __cplusplus

#include "conflict.hpp"
#include "connectivity.hpp"
#include "local_store.hpp"
#include "remote.hpp"
#include <atomic>
#include <functional>
#include <optional>
#include <string>

namespace fieldsync {

struct sync_options {
    int64_t attempt_cap = 5;          // transient failures before an item is demoted to failed
    int max_conflict_rounds = 3;      // resolve/resend cycles per item per drain
};

/// Probes evaluated between items; a drain never consults global state.
struct drain_context {
    std::function<connectivity_mode()> mode;
    std::function<bool()> authorized;
};

enum class drain_outcome {
    finished,          // every eligible item was attempted
    stopped_offline,   // mode flipped to offline between items
    stopped_network,   // transient failure, rest of the queue left untouched
    deferred,          // not authorized, nothing attempted from that point on
    auth_expired,      // remote refused the session mid-drain
    already_running    // re-entrant call, no-op
};

const char* to_string(drain_outcome outcome);

struct drain_report {
    drain_outcome outcome = drain_outcome::finished;
    size_t attempted = 0;     // remote calls made
    size_t completed = 0;
    size_t conflicts = 0;
    size_t rejected = 0;
    size_t demoted = 0;       // hit the attempt cap
    size_t follow_ups = 0;    // local edits re-queued after keep_remote
    std::optional<std::string> last_error;
};

// ============================================================================
// sync_processor - drains the mutation queue against the remote authority
// ============================================================================

class sync_processor {
public:
    sync_processor(local_store& store, remote_authority& remote,
                   sync_options options = {}, conflict_resolver resolver = {});

    sync_processor(const sync_processor&) = delete;
    sync_processor& operator=(const sync_processor&) = delete;

    /// Single-flight. Storage failures and unexpected remote errors
    /// propagate; the item in flight is put back to pending first.
    drain_report drain(const drain_context& context);

    /// Move a failed item back to pending so the next drain picks it up.
    /// Returns false if the item exists but is not failed.
    bool retry_failed_item(const global_id_t& id);

    bool is_draining() const { return draining_.load(); }
    const sync_options& options() const { return options_; }

private:
    enum class step { next, again, stop };

    local_store& store_;
    remote_authority& remote_;
    sync_options options_;
    conflict_resolver resolver_;
    std::atomic<bool> draining_{false};

    step process(const sync_queue_item& item, int conflict_round, drain_report& report);
    step send(const sync_queue_item& item, int conflict_round, drain_report& report);
    void release_in_flight(const sync_queue_item& item, const char* reason);
    step on_accepted(const sync_queue_item& item, const mutation_accepted& accepted, drain_report& report);
    step on_conflict(const sync_queue_item& item, const mutation_conflict& conflict,
                     int conflict_round, drain_report& report);
    void on_network_failure(const sync_queue_item& item, const std::string& message,
                            drain_report& report);
};

} // namespace fieldsync

#endif // __cplusplus
