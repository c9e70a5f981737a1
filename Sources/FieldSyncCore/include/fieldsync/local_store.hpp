#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include "entities.hpp"
#include "mutation.hpp"
#include "session.hpp"
#include <nlohmann/json.hpp>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fieldsync {

/// Raised when a write could not be durably committed or violates a
/// queue invariant. Never swallowed: callers must not report the capture
/// as saved.
class store_error : public db_error {
public:
    explicit store_error(const std::string& msg) : db_error(msg) {}
};

enum class queue_status {
    pending,
    processing,
    completed,
    failed
};

const char* to_string(queue_status status);
queue_status queue_status_from_string(const std::string& s);

// ============================================================================
// SyncQueueItem - one pending mutation against one entity
// ============================================================================

struct sync_queue_item {
    global_id_t id;
    int64_t sequence = 0;            // insertion order, breaks createdAt ties
    mutation change;
    queue_status status = queue_status::pending;
    int64_t attempts = 0;
    std::optional<timestamp_t> last_attempt;
    std::optional<std::string> error;
    timestamp_t created_at{};
    int64_t transient_failures = 0;  // network failures since the last manual retry
    bool rejected = false;           // remote authority refused the payload

    const char* type() const { return mutation_type(change); }
    const global_id_t& reference_id() const { return fieldsync::reference_id(change); }

    nlohmann::json to_json() const;
};

/// Build a new pending queue item for a mutation.
sync_queue_item make_queue_item(mutation change, timestamp_t created_at = now());

/// Partial update of a queue item. Unset members are left untouched;
/// the nested optionals distinguish "leave" from "clear".
struct queue_item_patch {
    std::optional<queue_status> status;
    std::optional<int64_t> attempts;
    std::optional<std::optional<timestamp_t>> last_attempt;
    std::optional<std::optional<std::string>> error;
    std::optional<mutation> change;
    std::optional<int64_t> transient_failures;
    std::optional<bool> rejected;
};

struct queue_stats {
    size_t pending = 0;
    size_t processing = 0;
    size_t completed = 0;
    size_t failed = 0;

    /// Items still needing attention (everything not completed).
    size_t depth() const { return pending + processing + failed; }
};

// ============================================================================
// local_store - durable entity tables + mutation queue on SQLite
// ============================================================================
//
// Every public write goes through one serialized path guarded by
// write_mutex_; each call is one statement or one transaction, so a crash
// leaves a row at either its old or its new value.

class local_store {
public:
    explicit local_store(const std::string& path = ":memory:");
    ~local_store();

    local_store(const local_store&) = delete;
    local_store& operator=(const local_store&) = delete;

    // Entities
    void put(const entity& e);
    std::optional<entity> get(entity_kind kind, const global_id_t& id);
    std::optional<mission> get_mission(const global_id_t& id);
    std::optional<property_collection> get_collection(const global_id_t& id);
    std::optional<photo> get_photo(const global_id_t& id);
    bool remove(entity_kind kind, const global_id_t& id);
    void set_sync_status(entity_kind kind, const global_id_t& id, sync_status status);

    // Sync outcomes applied by the queue processor
    /// Overlay fields that the remote authority now holds, adopt its version
    /// (collections) and mark the entity synced unless other queue items for
    /// it are still outstanding. A missing entity is left missing.
    void confirm_synced(entity_kind kind, const global_id_t& id,
                        const nlohmann::json& fields, std::optional<int64_t> version);
    /// Overwrite the local entity with the remote state and mark it synced.
    void replace_with_remote(entity_kind kind, const global_id_t& id,
                             const nlohmann::json& remote_fields, int64_t remote_version);
    /// Overlay fields onto the local entity without touching its version.
    void merge_into_entity(entity_kind kind, const global_id_t& id,
                           const nlohmann::json& fields, sync_status status);
    /// True if any non-completed queue item other than except_id targets id.
    bool has_outstanding(const global_id_t& reference_id, const global_id_t& except_id = {});

    std::vector<mission> missions();
    std::vector<property_collection> collections_for_mission(const global_id_t& mission_id);
    std::vector<photo> photos_for_collection(const global_id_t& collection_id);

    // Capture helpers: write the entity and enqueue its mutation together
    sync_queue_item save_mission(mission m);
    sync_queue_item save_collection(property_collection c);
    sync_queue_item save_photo(photo p);
    sync_queue_item update_mission_status(const global_id_t& mission_id, const std::string& status);
    sync_queue_item edit_collection(const global_id_t& collection_id, const nlohmann::json& changed);
    sync_queue_item edit_photo(const global_id_t& photo_id, const nlohmann::json& changed);
    sync_queue_item delete_entity(entity_kind kind, const global_id_t& id);

    // Queue
    void enqueue(const sync_queue_item& item);

    /// Pending items plus failed items still eligible for automatic retry
    /// (not rejected, transient failures within attempt_cap), ordered by
    /// createdAt then insertion sequence. The processor demotes an item only
    /// once it is over the cap, so a failed item comes back here only when
    /// the cap has since been raised.
    std::vector<sync_queue_item> scan_pending(int64_t attempt_cap);

    std::optional<sync_queue_item> get_queue_item(const global_id_t& id);
    void update_queue_item(const global_id_t& id, const queue_item_patch& patch);
    std::vector<sync_queue_item> queue_items();
    queue_stats stats();
    size_t purge_completed();
    bool purge_item(const global_id_t& id);
    /// Items left in processing by a crash or an aborted drain go back to
    /// pending, and their entities from syncing to pending. Run on open and
    /// before every drain.
    size_t recover_interrupted();

    // Mission cache
    void cache_missions(const std::vector<mission>& list);
    /// Drop cached missions that have nothing left to upload.
    size_t clear_cache();

    /// Dump of every table as JSON, for support and backup.
    nlohmann::json export_data();

    // Session rows (owned by offline_auth_cache)
    std::optional<cached_session> load_session();
    void store_session(const cached_session& s);
    void clear_session();
    offline_state load_offline_state();
    void store_offline_state(const offline_state& state);

private:
    std::unique_ptr<database> db_;
    std::recursive_mutex write_mutex_;

    void ensure_schema();
    void put_locked(const entity& e);
    void enqueue_locked(const sync_queue_item& item);
    std::vector<sync_queue_item> load_queue(const std::string& where,
                                            const std::vector<column_value_t>& params);

    template<typename Fn>
    auto write(const char* what, Fn&& fn) -> decltype(fn());
};

} // namespace fieldsync

#endif // __cplusplus
