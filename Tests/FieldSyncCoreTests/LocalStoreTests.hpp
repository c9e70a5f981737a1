#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <filesystem>
#include <iostream>

namespace local_store_tests {

using namespace test_support;

// ============================================================================
// test_entity_round_trip - put/get/remove for every entity kind
// ============================================================================

void test_entity_round_trip() {
    std::cout << "  test_entity_round_trip..." << std::flush;

    local_store store;
    auto m = make_mission("Av. Brasil 100");
    m.latitude = -23.55;
    m.longitude = -46.63;
    m.deadline = from_millis(1700000000000);
    store.put(m);

    auto c = make_collection(m.id);
    c.version = 3;
    store.put(c);

    auto p = make_photo(c);
    p.is_primary = true;
    store.put(p);

    auto got_m = store.get_mission(m.id);
    assert(got_m);
    assert(got_m->title == "Av. Brasil 100");
    assert(got_m->latitude && *got_m->latitude == -23.55);
    assert(got_m->deadline && to_millis(*got_m->deadline) == 1700000000000);
    assert(got_m->sync_state == sync_status::pending);

    auto got_c = store.get_collection(c.id);
    assert(got_c);
    assert(got_c->version == 3);
    assert(got_c->fields["owner"] == "Silva");
    assert(got_c->fields["floors"] == 2);

    auto got_p = store.get_photo(p.id);
    assert(got_p);
    assert(got_p->is_primary);
    assert(got_p->kind == "facade");
    assert(!got_p->remote_path);

    auto generic = store.get(entity_kind::photo, p.id);
    assert(generic && kind_of(*generic) == entity_kind::photo);

    store.set_sync_status(entity_kind::property_collection, c.id, sync_status::synced);
    assert(store.get_collection(c.id)->sync_state == sync_status::synced);

    assert(store.remove(entity_kind::photo, p.id));
    assert(!store.get_photo(p.id));
    assert(!store.remove(entity_kind::photo, p.id));

    assert(store.collections_for_mission(m.id).size() == 1);
    assert(store.missions().size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_save_helpers_enqueue - capture writes entity + mutation together
// ============================================================================

void test_save_helpers_enqueue() {
    std::cout << "  test_save_helpers_enqueue..." << std::flush;

    local_store store;
    auto m = make_mission();
    auto mission_item = store.save_mission(m);
    assert(mission_item.type() == std::string("create_mission"));

    auto c = make_collection(m.id);
    auto item = store.save_collection(c);
    assert(item.reference_id() == c.id);
    assert(std::holds_alternative<create_collection>(item.change));

    auto stored = store.get_collection(c.id);
    assert(stored && stored->sync_state == sync_status::pending);
    assert(stored->version == 1);

    auto p = make_photo(c);
    store.save_photo(p);
    assert(store.photos_for_collection(c.id).size() == 1);

    auto queued = store.queue_items();
    assert(queued.size() == 3);
    for (const auto& q : queued) {
        assert(q.status == queue_status::pending);
        assert(q.attempts == 0);
        assert(!q.last_attempt);
    }

    // Payload survives the trip through the table
    auto reloaded = store.get_queue_item(item.id);
    assert(reloaded);
    const auto& created = std::get<create_collection>(reloaded->change);
    assert(created.record.fields["owner"] == "Silva");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_edit_collection_bumps_version
// ============================================================================

void test_edit_collection_bumps_version() {
    std::cout << "  test_edit_collection_bumps_version..." << std::flush;

    local_store store;
    auto c = synced_collection(store, 3);

    auto item = store.edit_collection(c.id, json{{"floors", 3}});
    const auto& edit = std::get<update_collection>(item.change);
    assert(edit.base_version == 3);
    assert(edit.version == 4);
    assert(edit.fields == json({{"floors", 3}}));
    assert(expected_version(item.change) == 3);
    assert(local_version(item.change) == 4);

    auto stored = store.get_collection(c.id);
    assert(stored->version == 4);
    assert(stored->fields["floors"] == 3);
    assert(stored->fields["owner"] == "Silva");
    assert(stored->sync_state == sync_status::pending);

    bool threw = false;
    try {
        store.edit_collection("missing", json{{"floors", 1}});
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);

    // A failed edit leaves nothing behind
    assert(store.queue_items().size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_scan_is_fifo_by_created_at
// ============================================================================

void test_scan_is_fifo_by_created_at() {
    std::cout << "  test_scan_is_fifo_by_created_at..." << std::flush;

    local_store store;
    auto base = from_millis(1700000000000);

    // Arrival order differs from creation order
    auto late = make_queue_item(delete_mission{"m-late"}, base + std::chrono::seconds(30));
    auto early = make_queue_item(delete_mission{"m-early"}, base);
    auto middle = make_queue_item(delete_mission{"m-middle"}, base + std::chrono::seconds(10));
    auto tie = make_queue_item(delete_mission{"m-tie"}, base + std::chrono::seconds(10));
    store.enqueue(late);
    store.enqueue(early);
    store.enqueue(middle);
    store.enqueue(tie);

    auto scanned = store.scan_pending(5);
    assert(scanned.size() == 4);
    assert(scanned[0].reference_id() == "m-early");
    assert(scanned[1].reference_id() == "m-middle");
    assert(scanned[2].reference_id() == "m-tie");   // same createdAt, inserted later
    assert(scanned[3].reference_id() == "m-late");
    assert(scanned[1].sequence < scanned[2].sequence);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_queue_item_invariants - attempts never decrease, completed is final
// ============================================================================

void test_queue_item_invariants() {
    std::cout << "  test_queue_item_invariants..." << std::flush;

    local_store store;
    auto item = make_queue_item(delete_photo{"p-1"});
    store.enqueue(item);

    queue_item_patch bump;
    bump.attempts = 2;
    bump.last_attempt = now();
    bump.error = std::optional<std::string>("timeout");
    store.update_queue_item(item.id, bump);

    auto stored = store.get_queue_item(item.id);
    assert(stored->attempts == 2);
    assert(stored->last_attempt);
    assert(stored->error && *stored->error == "timeout");

    queue_item_patch lower;
    lower.attempts = 1;
    bool threw = false;
    try {
        store.update_queue_item(item.id, lower);
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.get_queue_item(item.id)->attempts == 2);

    queue_item_patch done;
    done.status = queue_status::completed;
    done.error.emplace();
    store.update_queue_item(item.id, done);
    assert(!store.get_queue_item(item.id)->error);

    queue_item_patch reopen;
    reopen.status = queue_status::pending;
    threw = false;
    try {
        store.update_queue_item(item.id, reopen);
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);
    assert(store.get_queue_item(item.id)->status == queue_status::completed);

    threw = false;
    try {
        store.update_queue_item("no-such-item", done);
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);

    // A rewrite may not point the item at another entity
    queue_item_patch retarget;
    retarget.change = delete_photo{"p-2"};
    auto other = make_queue_item(delete_photo{"p-1"});
    store.enqueue(other);
    threw = false;
    try {
        store.update_queue_item(other.id, retarget);
    } catch (const store_error&) {
        threw = true;
    }
    assert(threw);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_scan_eligibility - rejected and capped failures stay out
// ============================================================================

void test_scan_eligibility() {
    std::cout << "  test_scan_eligibility..." << std::flush;

    local_store store;
    auto rejected = make_queue_item(delete_mission{"rejected"});
    auto capped = make_queue_item(delete_mission{"capped"});
    auto retryable = make_queue_item(delete_mission{"retryable"});
    auto done = make_queue_item(delete_mission{"done"});
    for (const auto& i : {rejected, capped, retryable, done}) store.enqueue(i);

    queue_item_patch p;
    p.status = queue_status::failed;
    p.attempts = 1;
    p.rejected = true;
    store.update_queue_item(rejected.id, p);

    p = {};
    p.status = queue_status::failed;
    p.attempts = 9;
    p.transient_failures = 6;
    store.update_queue_item(capped.id, p);

    p = {};
    p.status = queue_status::failed;
    p.attempts = 2;
    store.update_queue_item(retryable.id, p);

    p = {};
    p.status = queue_status::completed;
    p.attempts = 1;
    store.update_queue_item(done.id, p);

    auto scanned = store.scan_pending(5);
    assert(scanned.size() == 1);
    assert(scanned[0].reference_id() == "retryable");

    // Raising the cap brings a demoted item back; rejection never does
    auto raised = store.scan_pending(6);
    assert(raised.size() == 2);
    assert(raised[0].reference_id() == "capped");
    assert(raised[1].reference_id() == "retryable");

    auto s = store.stats();
    assert(s.failed == 3);
    assert(s.completed == 1);
    assert(s.depth() == 3);

    assert(store.purge_completed() == 1);
    assert(!store.get_queue_item(done.id));
    assert(store.purge_item(capped.id));
    assert(store.stats().failed == 2);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_has_outstanding_and_confirm
// ============================================================================

void test_has_outstanding_and_confirm() {
    std::cout << "  test_has_outstanding_and_confirm..." << std::flush;

    local_store store;
    auto c = synced_collection(store, 1);
    auto first = store.edit_collection(c.id, json{{"floors", 3}});
    auto second = store.edit_collection(c.id, json{{"owner", "Costa"}});

    assert(store.has_outstanding(c.id));
    assert(store.has_outstanding(c.id, first.id));

    queue_item_patch done;
    done.status = queue_status::completed;
    store.update_queue_item(first.id, done);

    // Second edit still queued: the entity stays pending
    store.confirm_synced(entity_kind::property_collection, c.id, json::object(), 2);
    assert(store.get_collection(c.id)->sync_state == sync_status::pending);
    assert(store.get_collection(c.id)->version == 3);

    store.update_queue_item(second.id, done);
    store.confirm_synced(entity_kind::property_collection, c.id, json::object(), 3);
    auto stored = store.get_collection(c.id);
    assert(stored->sync_state == sync_status::synced);
    assert(stored->version == 3);

    store.replace_with_remote(entity_kind::property_collection, c.id, json{{"owner", "Remote"}}, 7);
    stored = store.get_collection(c.id);
    assert(stored->version == 7);
    assert(stored->fields == json({{"owner", "Remote"}}));
    assert(stored->mission_id == c.mission_id);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_mission_cache - cached missions never clobber unsent local edits
// ============================================================================

void test_mission_cache() {
    std::cout << "  test_mission_cache..." << std::flush;

    local_store store;
    auto local = make_mission("Local edit");
    store.save_mission(local);

    auto from_server = local;
    from_server.title = "Server copy";
    auto other = make_mission("Other");
    store.cache_missions({from_server, other});

    assert(store.get_mission(local.id)->title == "Local edit");
    assert(store.get_mission(other.id)->sync_state == sync_status::synced);

    assert(store.clear_cache() == 1);
    assert(!store.get_mission(other.id));
    assert(store.get_mission(local.id));

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_export_and_sessions
// ============================================================================

void test_export_and_sessions() {
    std::cout << "  test_export_and_sessions..." << std::flush;

    local_store store;
    auto m = make_mission();
    store.save_mission(m);

    cached_session s;
    s.identity = make_session("very-secret-token");
    s.captured_at = now();
    s.expires_at = s.captured_at + std::chrono::hours(1);
    store.store_session(s);

    auto loaded = store.load_session();
    assert(loaded);
    assert(loaded->identity.token == "very-secret-token");
    assert(loaded->identity.user.email == "agent@example.org");

    auto dump = store.export_data();
    assert(dump["missions"].size() == 1);
    assert(dump["syncQueue"].size() == 1);
    assert(dump["syncQueue"][0]["type"] == "create_mission");
    assert(dump.dump().find("very-secret-token") == std::string::npos);

    store.clear_session();
    assert(!store.load_session());

    offline_state state;
    state.is_offline = true;
    state.since = now();
    store.store_offline_state(state);
    assert(store.load_offline_state().is_offline);
    assert(store.load_offline_state().since);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_file_store_survives_reopen
// ============================================================================

void test_file_store_survives_reopen() {
    std::cout << "  test_file_store_survives_reopen..." << std::flush;

    auto path = std::filesystem::temp_directory_path() / ("fieldsync_store_" + make_global_id() + ".sqlite");
    global_id_t collection_id;
    global_id_t item_id;
    {
        local_store store(path.string());
        auto m = make_mission();
        store.save_mission(m);
        auto c = make_collection(m.id);
        collection_id = c.id;
        item_id = store.save_collection(c).id;

        // Killed while the item was on the wire
        queue_item_patch patch;
        patch.status = queue_status::processing;
        patch.attempts = 1;
        store.update_queue_item(item_id, patch);
        store.set_sync_status(entity_kind::property_collection, collection_id, sync_status::syncing);
    }
    {
        local_store store(path.string());
        assert(store.get_collection(collection_id)->sync_state == sync_status::pending);
        auto item = store.get_queue_item(item_id);
        assert(item && item->status == queue_status::pending);
        assert(item->attempts == 1);
        assert(store.queue_items().size() == 2);
        assert(store.scan_pending(5).size() == 2);
    }

    std::filesystem::remove(path);
    std::filesystem::remove(path.string() + "-wal");
    std::filesystem::remove(path.string() + "-shm");

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_decode_rejects_malformed_payloads
// ============================================================================

void test_decode_rejects_malformed_payloads() {
    std::cout << "  test_decode_rejects_malformed_payloads..." << std::flush;

    bool threw = false;
    try {
        decode_mutation("teleport_mission", json{{"id", "x"}});
    } catch (const payload_error&) {
        threw = true;
    }
    assert(threw);

    threw = false;
    try {
        decode_mutation("update_collection", json{{"id", "x"}, {"fields", json::object()}});
    } catch (const payload_error&) {
        threw = true;
    }
    assert(threw);

    auto m = decode_mutation("update_collection",
                             json{{"id", "x"}, {"baseVersion", 2}, {"version", 3}, {"fields", {{"a", 1}}}});
    assert(expected_version(m) == 2);
    assert(local_version(m) == 3);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing local store..." << std::endl;
    test_entity_round_trip();
    test_save_helpers_enqueue();
    test_edit_collection_bumps_version();
    test_scan_is_fifo_by_created_at();
    test_queue_item_invariants();
    test_scan_eligibility();
    test_has_outstanding_and_confirm();
    test_mission_cache();
    test_export_and_sessions();
    test_file_store_survives_reopen();
    test_decode_rejects_malformed_payloads();
}

} // namespace local_store_tests
