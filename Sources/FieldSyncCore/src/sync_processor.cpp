#include "fieldsync/sync_processor.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

using json = nlohmann::json;

const char* to_string(drain_outcome outcome) {
    switch (outcome) {
        case drain_outcome::finished: return "finished";
        case drain_outcome::stopped_offline: return "stopped_offline";
        case drain_outcome::stopped_network: return "stopped_network";
        case drain_outcome::deferred: return "deferred";
        case drain_outcome::auth_expired: return "auth_expired";
        case drain_outcome::already_running: return "already_running";
    }
    return "finished";
}

namespace {

queue_item_patch status_patch(queue_status status) {
    queue_item_patch patch;
    patch.status = status;
    return patch;
}

queue_item_patch completed_patch() {
    auto patch = status_patch(queue_status::completed);
    patch.error.emplace();  // clear
    return patch;
}

queue_item_patch rewrite_patch(mutation change) {
    auto patch = status_patch(queue_status::pending);
    patch.change = std::move(change);
    return patch;
}

// Clears the single-flight flag however the drain exits.
struct drain_guard {
    std::atomic<bool>& flag;
    ~drain_guard() { flag.store(false); }
};

} // namespace

sync_processor::sync_processor(local_store& store, remote_authority& remote,
                               sync_options options, conflict_resolver resolver)
    : store_(store), remote_(remote), options_(options), resolver_(resolver) {}

drain_report sync_processor::drain(const drain_context& context) {
    drain_report report;
    bool expected = false;
    if (!draining_.compare_exchange_strong(expected, true)) {
        LOG_DEBUG("sync", "Drain already running");
        report.outcome = drain_outcome::already_running;
        return report;
    }
    drain_guard guard{draining_};

    // Nothing is in flight between drains; anything still marked so was
    // abandoned by a drain that threw or a process that died.
    if (auto n = store_.recover_interrupted()) {
        LOG_WARN("sync", "Released %zu queue items left in processing", n);
    }

    auto items = store_.scan_pending(options_.attempt_cap);
    LOG_INFO("sync", "Draining %zu queued mutations", items.size());

    for (const auto& scanned : items) {
        if (context.mode && context.mode() == connectivity_mode::offline) {
            report.outcome = drain_outcome::stopped_offline;
            break;
        }
        if (context.authorized && !context.authorized()) {
            report.outcome = drain_outcome::deferred;
            break;
        }

        // Re-read: an earlier item in this drain may have touched this one
        auto item = store_.get_queue_item(scanned.id);
        if (!item || item->status == queue_status::completed) continue;

        step s = step::next;
        for (int round = 0;; ++round) {
            s = process(*item, round, report);
            if (s != step::again) break;
            item = store_.get_queue_item(scanned.id);
            if (!item) {
                s = step::next;
                break;
            }
        }
        if (s == step::stop) break;
    }

    LOG_INFO("sync", "Drain %s: %zu attempted, %zu completed, %zu conflicts, %zu rejected",
             to_string(report.outcome), report.attempted, report.completed,
             report.conflicts, report.rejected);
    return report;
}

sync_processor::step sync_processor::process(const sync_queue_item& item, int conflict_round,
                                              drain_report& report) {
    const auto kind = target_kind(item.change);
    const auto& ref = item.reference_id();
    const int64_t attempts = item.attempts + 1;

    queue_item_patch start = status_patch(queue_status::processing);
    start.attempts = attempts;
    start.last_attempt = now();
    store_.update_queue_item(item.id, start);

    try {
        if (!is_delete(item.change)) {
            store_.set_sync_status(kind, ref, sync_status::syncing);
        }
        report.attempted++;
        LOG_DEBUG("sync", "Sending %s for %s (attempt %lld)", item.type(), ref.c_str(), (long long)attempts);
        return send(item, conflict_round, report);
    } catch (const std::exception& e) {
        release_in_flight(item, e.what());
        throw;
    }
}

sync_processor::step sync_processor::send(const sync_queue_item& item, int conflict_round,
                                          drain_report& report) {
    const auto kind = target_kind(item.change);
    const auto& ref = item.reference_id();

    apply_result result;
    try {
        result = remote_.apply_mutation(ref, item.change, expected_version(item.change));
    } catch (const network_error& e) {
        on_network_failure(item, e.what(), report);
        return step::stop;
    }

    if (auto* accepted = std::get_if<mutation_accepted>(&result)) {
        return on_accepted(item, *accepted, report);
    }
    if (auto* conflict = std::get_if<mutation_conflict>(&result)) {
        return on_conflict(item, *conflict, conflict_round, report);
    }
    if (auto* rejected = std::get_if<mutation_rejected>(&result)) {
        auto patch = status_patch(queue_status::failed);
        patch.error = std::optional<std::string>(rejected->reason);
        patch.rejected = true;
        store_.update_queue_item(item.id, patch);
        if (!is_delete(item.change)) {
            store_.set_sync_status(kind, ref, sync_status::error);
        }
        report.rejected++;
        report.last_error = rejected->reason;
        LOG_WARN("sync", "%s for %s rejected: %s", item.type(), ref.c_str(), rejected->reason.c_str());
        return step::next;
    }

    const auto& unauthorized = std::get<mutation_unauthorized>(result);
    auto patch = status_patch(queue_status::pending);
    patch.error = std::optional<std::string>(unauthorized.reason);
    store_.update_queue_item(item.id, patch);
    if (!is_delete(item.change)) {
        store_.set_sync_status(kind, ref, sync_status::pending);
    }
    report.outcome = drain_outcome::auth_expired;
    report.last_error = unauthorized.reason;
    LOG_WARN("sync", "Session refused while sending %s, stopping drain", item.type());
    return step::stop;
}

sync_processor::step sync_processor::on_accepted(const sync_queue_item& item,
                                                 const mutation_accepted& accepted,
                                                 drain_report& report) {
    const auto kind = target_kind(item.change);
    const auto& ref = item.reference_id();

    store_.update_queue_item(item.id, completed_patch());
    if (is_delete(item.change)) {
        store_.remove(kind, ref);
    } else {
        std::optional<int64_t> version;
        if (kind == entity_kind::property_collection) {
            version = accepted.version > 0 ? accepted.version : local_version(item.change);
        }
        store_.confirm_synced(kind, ref, accepted.fields, version);
    }
    report.completed++;
    return step::next;
}

sync_processor::step sync_processor::on_conflict(const sync_queue_item& item,
                                                 const mutation_conflict& conflict,
                                                 int conflict_round,
                                                 drain_report& report) {
    const auto kind = target_kind(item.change);
    const auto& ref = item.reference_id();
    report.conflicts++;

    const int64_t local_v = local_version(item.change);
    const json local_payload = changed_fields(item.change);
    const json& remote_payload = conflict.changes_known ? conflict.remote_changes : conflict.remote_fields;

    auto decision = resolver_.resolve(local_v, local_payload, conflict.remote_version, remote_payload);
    LOG_INFO("sync", "Conflict on %s (local v%lld, remote v%lld): %s", ref.c_str(),
             (long long)local_v, (long long)conflict.remote_version, to_string(decision));

    const bool retry_now = conflict_round + 1 < options_.max_conflict_rounds;

    if (std::holds_alternative<keep_local>(decision)) {
        auto rebased = rebase(item.change, conflict.remote_version, local_v + 1, local_payload);
        store_.update_queue_item(item.id, rewrite_patch(std::move(rebased)));
        return retry_now ? step::again : step::next;
    }

    if (auto* m = std::get_if<merged>(&decision)) {
        auto rebased = rebase(item.change, conflict.remote_version, conflict.remote_version + 1, m->payload);
        store_.merge_into_entity(kind, ref, m->payload, sync_status::pending);
        store_.update_queue_item(item.id, rewrite_patch(std::move(rebased)));
        return retry_now ? step::again : step::next;
    }

    const auto& remote_wins = std::get<keep_remote>(decision);
    store_.update_queue_item(item.id, completed_patch());
    store_.replace_with_remote(kind, ref, conflict.remote_fields, conflict.remote_version);
    report.completed++;

    if (remote_wins.follow_up && !remote_wins.follow_up->empty()) {
        const int64_t next_version = conflict.remote_version + 1;
        auto follow_up = make_queue_item(
            rebase(item.change, conflict.remote_version, next_version, *remote_wins.follow_up));
        store_.enqueue(follow_up);
        store_.merge_into_entity(kind, ref, *remote_wins.follow_up, sync_status::pending);
        if (kind == entity_kind::property_collection) {
            if (auto c = store_.get_collection(ref)) {
                c->version = next_version;
                store_.put(*c);
            }
        }
        report.follow_ups++;
        LOG_INFO("sync", "Re-queued local edit of %s as %s", ref.c_str(), follow_up.id.c_str());
    }
    return step::next;
}

void sync_processor::on_network_failure(const sync_queue_item& item, const std::string& message,
                                        drain_report& report) {
    const auto kind = target_kind(item.change);
    const auto& ref = item.reference_id();
    const int64_t failures = item.transient_failures + 1;
    const bool demote = failures > options_.attempt_cap;

    auto patch = status_patch(demote ? queue_status::failed : queue_status::pending);
    patch.error = std::optional<std::string>(message);
    patch.transient_failures = failures;
    store_.update_queue_item(item.id, patch);
    if (!is_delete(item.change)) {
        store_.set_sync_status(kind, ref, demote ? sync_status::error : sync_status::pending);
    }

    if (demote) {
        report.demoted++;
        LOG_WARN("sync", "%s for %s failed %lld times, needs manual retry",
                 item.type(), ref.c_str(), (long long)failures);
    } else {
        LOG_WARN("sync", "Network failure on %s, stopping drain: %s", ref.c_str(), message.c_str());
    }
    report.outcome = drain_outcome::stopped_network;
    report.last_error = message;
}

// Best effort: if the store itself is failing this cannot succeed either,
// and the next drain's recovery pass picks the item up.
void sync_processor::release_in_flight(const sync_queue_item& item, const char* reason) {
    try {
        auto current = store_.get_queue_item(item.id);
        if (!current || current->status != queue_status::processing) return;
        auto patch = status_patch(queue_status::pending);
        patch.error = std::optional<std::string>(reason);
        store_.update_queue_item(item.id, patch);
        if (!is_delete(item.change)) {
            store_.set_sync_status(target_kind(item.change), item.reference_id(), sync_status::pending);
        }
    } catch (const db_error& e) {
        LOG_ERROR("sync", "Could not release %s after a failed send: %s", item.id.c_str(), e.what());
    }
}

bool sync_processor::retry_failed_item(const global_id_t& id) {
    auto item = store_.get_queue_item(id);
    if (!item) {
        throw store_error("No queue item " + id);
    }
    if (item->status != queue_status::failed) {
        return false;
    }

    auto patch = status_patch(queue_status::pending);
    patch.error.emplace();
    patch.rejected = false;
    patch.transient_failures = 0;
    store_.update_queue_item(id, patch);
    if (!is_delete(item->change)) {
        store_.set_sync_status(target_kind(item->change), item->reference_id(), sync_status::pending);
    }
    LOG_INFO("sync", "Queue item %s scheduled for retry", id.c_str());
    return true;
}

} // namespace fieldsync
