#include "fieldsync/local_store.hpp"
#include "fieldsync/log.hpp"
#include <type_traits>

namespace fieldsync {

using json = nlohmann::json;

namespace {

constexpr const char* kMissionTable = "Mission";
constexpr const char* kCollectionTable = "PropertyCollection";
constexpr const char* kPhotoTable = "Photo";
constexpr const char* kQueueTable = "SyncQueue";
constexpr const char* kSessionTable = "CachedSession";
constexpr const char* kOfflineStateTable = "OfflineState";
constexpr const char* kSingletonId = "current";

using values_t = database::values_t;

const char* table_for(entity_kind kind) {
    switch (kind) {
        case entity_kind::mission: return kMissionTable;
        case entity_kind::property_collection: return kCollectionTable;
        case entity_kind::photo: return kPhotoTable;
    }
    return kMissionTable;
}

// ----------------------------------------------------------------------------
// Row accessors
// ----------------------------------------------------------------------------

std::string get_str(const database::row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it != row.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return "";
}

std::optional<std::string> get_opt_str(const database::row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it != row.end() && std::holds_alternative<std::string>(it->second)) {
        return std::get<std::string>(it->second);
    }
    return std::nullopt;
}

int64_t get_int(const database::row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it != row.end() && std::holds_alternative<int64_t>(it->second)) {
        return std::get<int64_t>(it->second);
    }
    return 0;
}

std::optional<double> get_opt_real(const database::row_t& row, const std::string& key) {
    auto it = row.find(key);
    if (it == row.end()) return std::nullopt;
    if (std::holds_alternative<double>(it->second)) return std::get<double>(it->second);
    if (std::holds_alternative<int64_t>(it->second)) {
        return static_cast<double>(std::get<int64_t>(it->second));
    }
    return std::nullopt;
}

std::optional<timestamp_t> get_opt_ts(const database::row_t& row, const std::string& key) {
    auto seconds = get_opt_real(row, key);
    if (!seconds) return std::nullopt;
    return detail::timestamp_from_seconds(*seconds);
}

timestamp_t get_ts(const database::row_t& row, const std::string& key) {
    return get_opt_ts(row, key).value_or(timestamp_t{});
}

json parse_json_column(const database::row_t& row, const std::string& key) {
    auto text = get_str(row, key);
    if (text.empty()) return json::object();
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw payload_error("Corrupt JSON in column " + key + ": " + e.what());
    }
}

// ----------------------------------------------------------------------------
// Schemas
// ----------------------------------------------------------------------------

table_schema mission_schema() {
    return {kMissionTable, {
        {"title", column_type::text},
        {"status", column_type::text},
        {"priority", column_type::text},
        {"assignedTo", column_type::text},
        {"address", column_type::text},
        {"propertyCode", column_type::text},
        {"notes", column_type::text},
        {"latitude", column_type::real, true},
        {"longitude", column_type::real, true},
        {"deadline", column_type::real, true},
        {"updatedAt", column_type::real},
        {"syncStatus", column_type::text},
    }, {{"syncStatus"}, {"assignedTo"}}};
}

table_schema collection_schema() {
    return {kCollectionTable, {
        {"missionId", column_type::text},
        {"fields", column_type::text},
        {"collectedBy", column_type::text},
        {"collectedAt", column_type::real},
        {"version", column_type::integer},
        {"syncStatus", column_type::text},
    }, {{"missionId"}, {"syncStatus"}}};
}

table_schema photo_schema() {
    return {kPhotoTable, {
        {"collectionId", column_type::text},
        {"missionId", column_type::text},
        {"photoType", column_type::text},
        {"filename", column_type::text},
        {"localPath", column_type::text},
        {"remotePath", column_type::text, true},
        {"isPrimary", column_type::integer},
        {"latitude", column_type::real, true},
        {"longitude", column_type::real, true},
        {"width", column_type::integer},
        {"height", column_type::integer},
        {"fileSize", column_type::integer},
        {"capturedAt", column_type::real},
        {"syncStatus", column_type::text},
    }, {{"collectionId"}, {"syncStatus"}}};
}

table_schema queue_schema() {
    return {kQueueTable, {
        {"type", column_type::text},
        {"referenceId", column_type::text},
        {"entityKind", column_type::text},
        {"payload", column_type::text},
        {"status", column_type::text},
        {"attempts", column_type::integer},
        {"lastAttempt", column_type::real, true},
        {"error", column_type::text, true},
        {"createdAt", column_type::real},
        {"transientFailures", column_type::integer},
        {"rejected", column_type::integer},
    }, {{"createdAt", "id"}, {"status"}, {"referenceId"}}};
}

table_schema session_schema() {
    return {kSessionTable, {
        {"user", column_type::text},
        {"token", column_type::text},
        {"capturedAt", column_type::real},
        {"expiresAt", column_type::real},
    }, {}};
}

table_schema offline_state_schema() {
    return {kOfflineStateTable, {
        {"isOffline", column_type::integer},
        {"since", column_type::real, true},
    }, {}};
}

// ----------------------------------------------------------------------------
// Entity <-> row
// ----------------------------------------------------------------------------

values_t to_values(const mission& m) {
    return {
        {"globalId", m.id},
        {"title", m.title},
        {"status", m.status},
        {"priority", m.priority},
        {"assignedTo", m.assigned_to},
        {"address", m.address},
        {"propertyCode", m.property_code},
        {"notes", m.notes},
        {"latitude", detail::to_column_value(m.latitude)},
        {"longitude", detail::to_column_value(m.longitude)},
        {"deadline", detail::to_column_value(m.deadline)},
        {"updatedAt", detail::to_column_value(m.updated_at)},
        {"syncStatus", std::string(to_string(m.sync_state))},
    };
}

values_t to_values(const property_collection& c) {
    return {
        {"globalId", c.id},
        {"missionId", c.mission_id},
        {"fields", c.fields.dump()},
        {"collectedBy", c.collected_by},
        {"collectedAt", detail::to_column_value(c.collected_at)},
        {"version", c.version},
        {"syncStatus", std::string(to_string(c.sync_state))},
    };
}

values_t to_values(const photo& p) {
    return {
        {"globalId", p.id},
        {"collectionId", p.collection_id},
        {"missionId", p.mission_id},
        {"photoType", p.kind},
        {"filename", p.filename},
        {"localPath", p.local_path},
        {"remotePath", detail::to_column_value(p.remote_path)},
        {"isPrimary", detail::to_column_value(p.is_primary)},
        {"latitude", detail::to_column_value(p.latitude)},
        {"longitude", detail::to_column_value(p.longitude)},
        {"width", p.width},
        {"height", p.height},
        {"fileSize", p.file_size},
        {"capturedAt", detail::to_column_value(p.captured_at)},
        {"syncStatus", std::string(to_string(p.sync_state))},
    };
}

mission mission_from_row(const database::row_t& row) {
    mission m;
    m.id = get_str(row, "globalId");
    m.title = get_str(row, "title");
    m.status = get_str(row, "status");
    m.priority = get_str(row, "priority");
    m.assigned_to = get_str(row, "assignedTo");
    m.address = get_str(row, "address");
    m.property_code = get_str(row, "propertyCode");
    m.notes = get_str(row, "notes");
    m.latitude = get_opt_real(row, "latitude");
    m.longitude = get_opt_real(row, "longitude");
    m.deadline = get_opt_ts(row, "deadline");
    m.updated_at = get_ts(row, "updatedAt");
    m.sync_state = sync_status_from_string(get_str(row, "syncStatus"));
    return m;
}

property_collection collection_from_row(const database::row_t& row) {
    property_collection c;
    c.id = get_str(row, "globalId");
    c.mission_id = get_str(row, "missionId");
    c.fields = parse_json_column(row, "fields");
    c.collected_by = get_str(row, "collectedBy");
    c.collected_at = get_ts(row, "collectedAt");
    c.version = get_int(row, "version");
    c.sync_state = sync_status_from_string(get_str(row, "syncStatus"));
    return c;
}

photo photo_from_row(const database::row_t& row) {
    photo p;
    p.id = get_str(row, "globalId");
    p.collection_id = get_str(row, "collectionId");
    p.mission_id = get_str(row, "missionId");
    p.kind = get_str(row, "photoType");
    p.filename = get_str(row, "filename");
    p.local_path = get_str(row, "localPath");
    p.remote_path = get_opt_str(row, "remotePath");
    p.is_primary = get_int(row, "isPrimary") != 0;
    p.latitude = get_opt_real(row, "latitude");
    p.longitude = get_opt_real(row, "longitude");
    p.width = get_int(row, "width");
    p.height = get_int(row, "height");
    p.file_size = get_int(row, "fileSize");
    p.captured_at = get_ts(row, "capturedAt");
    p.sync_state = sync_status_from_string(get_str(row, "syncStatus"));
    return p;
}

values_t to_values(const sync_queue_item& item) {
    return {
        {"globalId", item.id},
        {"type", std::string(item.type())},
        {"referenceId", item.reference_id()},
        {"entityKind", std::string(to_string(target_kind(item.change)))},
        {"payload", encode_payload(item.change).dump()},
        {"status", std::string(to_string(item.status))},
        {"attempts", item.attempts},
        {"lastAttempt", detail::to_column_value(item.last_attempt)},
        {"error", detail::to_column_value(item.error)},
        {"createdAt", detail::to_column_value(item.created_at)},
        {"transientFailures", item.transient_failures},
        {"rejected", detail::to_column_value(item.rejected)},
    };
}

sync_queue_item queue_item_from_row(const database::row_t& row) {
    sync_queue_item item;
    item.id = get_str(row, "globalId");
    item.sequence = get_int(row, "id");
    item.change = decode_mutation(get_str(row, "type"), parse_json_column(row, "payload"));
    item.status = queue_status_from_string(get_str(row, "status"));
    item.attempts = get_int(row, "attempts");
    item.last_attempt = get_opt_ts(row, "lastAttempt");
    item.error = get_opt_str(row, "error");
    item.created_at = get_ts(row, "createdAt");
    item.transient_failures = get_int(row, "transientFailures");
    item.rejected = get_int(row, "rejected") != 0;
    return item;
}

// Overlay a JSON field set onto an entity. Collections take the fields into
// their form object; missions and photos overlay their own JSON encoding.
entity overlay(const entity& e, const json& fields) {
    if (!fields.is_object()) {
        throw payload_error("Field set must be a JSON object");
    }
    return std::visit([&](const auto& v) -> entity {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, property_collection>) {
            T copy = v;
            copy.fields.update(fields);
            return copy;
        } else {
            auto j = v.to_json();
            j.update(fields);
            j["id"] = v.id;
            j["syncStatus"] = to_string(v.sync_state);
            return T::from_json(j);
        }
    }, e);
}

} // namespace

// ============================================================================
// queue item helpers
// ============================================================================

const char* to_string(queue_status status) {
    switch (status) {
        case queue_status::pending: return "pending";
        case queue_status::processing: return "processing";
        case queue_status::completed: return "completed";
        case queue_status::failed: return "failed";
    }
    return "pending";
}

queue_status queue_status_from_string(const std::string& s) {
    if (s == "pending") return queue_status::pending;
    if (s == "processing") return queue_status::processing;
    if (s == "completed") return queue_status::completed;
    if (s == "failed") return queue_status::failed;
    throw payload_error("Unknown queue status: " + s);
}

json sync_queue_item::to_json() const {
    json j;
    j["id"] = id;
    j["type"] = type();
    j["referenceId"] = reference_id();
    j["payload"] = encode_payload(change);
    j["status"] = to_string(status);
    j["attempts"] = attempts;
    j["lastAttempt"] = last_attempt ? json(to_millis(*last_attempt)) : json(nullptr);
    j["error"] = error ? json(*error) : json(nullptr);
    j["createdAt"] = to_millis(created_at);
    j["transientFailures"] = transient_failures;
    j["rejected"] = rejected;
    return j;
}

sync_queue_item make_queue_item(mutation change, timestamp_t created_at) {
    sync_queue_item item;
    item.id = make_global_id();
    item.change = std::move(change);
    item.created_at = created_at;
    return item;
}

// ============================================================================
// local_store
// ============================================================================

local_store::local_store(const std::string& path)
    : db_(std::make_unique<database>(path)) {
    ensure_schema();
    if (auto n = recover_interrupted()) {
        LOG_WARN("local_store", "Recovered %zu queue items interrupted mid-send", n);
    }
}

local_store::~local_store() = default;

void local_store::ensure_schema() {
    db_->ensure_table(mission_schema());
    db_->ensure_table(collection_schema());
    db_->ensure_table(photo_schema());
    db_->ensure_table(queue_schema());
    db_->ensure_table(session_schema());
    db_->ensure_table(offline_state_schema());
}

template<typename Fn>
auto local_store::write(const char* what, Fn&& fn) -> decltype(fn()) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    try {
        if (db_->is_in_transaction()) {
            // Nested inside an enclosing write; the outer call commits.
            return fn();
        }
        transaction tx(*db_);
        if constexpr (std::is_void_v<decltype(fn())>) {
            fn();
            tx.commit();
        } else {
            auto result = fn();
            tx.commit();
            return result;
        }
    } catch (const store_error&) {
        throw;
    } catch (const db_error& e) {
        LOG_ERROR("local_store", "%s failed: %s", what, e.what());
        throw store_error(std::string(what) + " failed: " + e.what());
    }
}

// ----------------------------------------------------------------------------
// Entities
// ----------------------------------------------------------------------------

void local_store::put_locked(const entity& e) {
    std::visit([this](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if (v.id.empty()) {
            throw store_error("Cannot store an entity without an id");
        }
        const char* table = kMissionTable;
        if constexpr (std::is_same_v<T, property_collection>) table = kCollectionTable;
        if constexpr (std::is_same_v<T, photo>) table = kPhotoTable;
        db_->upsert(table, to_values(v));
    }, e);
}

void local_store::put(const entity& e) {
    write("put", [&] { put_locked(e); });
    LOG_DEBUG("local_store", "Stored %s %s", to_string(kind_of(e)), id_of(e).c_str());
}

std::optional<entity> local_store::get(entity_kind kind, const global_id_t& id) {
    switch (kind) {
        case entity_kind::mission:
            if (auto m = get_mission(id)) return entity{*m};
            break;
        case entity_kind::property_collection:
            if (auto c = get_collection(id)) return entity{*c};
            break;
        case entity_kind::photo:
            if (auto p = get_photo(id)) return entity{*p};
            break;
    }
    return std::nullopt;
}

std::optional<mission> local_store::get_mission(const global_id_t& id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query("SELECT * FROM Mission WHERE globalId = ?", {id});
    if (rows.empty()) return std::nullopt;
    return mission_from_row(rows[0]);
}

std::optional<property_collection> local_store::get_collection(const global_id_t& id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query("SELECT * FROM PropertyCollection WHERE globalId = ?", {id});
    if (rows.empty()) return std::nullopt;
    return collection_from_row(rows[0]);
}

std::optional<photo> local_store::get_photo(const global_id_t& id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query("SELECT * FROM Photo WHERE globalId = ?", {id});
    if (rows.empty()) return std::nullopt;
    return photo_from_row(rows[0]);
}

bool local_store::remove(entity_kind kind, const global_id_t& id) {
    return write("remove", [&] { return db_->remove(table_for(kind), id) > 0; });
}

void local_store::set_sync_status(entity_kind kind, const global_id_t& id, sync_status status) {
    write("set_sync_status", [&] {
        db_->update(table_for(kind), id, {{"syncStatus", std::string(to_string(status))}});
    });
}

std::vector<mission> local_store::missions() {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    std::vector<mission> result;
    for (const auto& row : db_->query("SELECT * FROM Mission ORDER BY id ASC")) {
        result.push_back(mission_from_row(row));
    }
    return result;
}

std::vector<property_collection> local_store::collections_for_mission(const global_id_t& mission_id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    std::vector<property_collection> result;
    for (const auto& row : db_->query(
             "SELECT * FROM PropertyCollection WHERE missionId = ? ORDER BY id ASC", {mission_id})) {
        result.push_back(collection_from_row(row));
    }
    return result;
}

std::vector<photo> local_store::photos_for_collection(const global_id_t& collection_id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    std::vector<photo> result;
    for (const auto& row : db_->query(
             "SELECT * FROM Photo WHERE collectionId = ? ORDER BY id ASC", {collection_id})) {
        result.push_back(photo_from_row(row));
    }
    return result;
}

// ----------------------------------------------------------------------------
// Capture helpers
// ----------------------------------------------------------------------------

sync_queue_item local_store::save_mission(mission m) {
    if (m.id.empty()) m.id = make_global_id();
    m.updated_at = now();
    m.sync_state = sync_status::pending;
    auto item = make_queue_item(create_mission{m});
    write("save_mission", [&] {
        put_locked(m);
        enqueue_locked(item);
    });
    return item;
}

sync_queue_item local_store::save_collection(property_collection c) {
    if (c.id.empty()) c.id = make_global_id();
    if (c.collected_at == timestamp_t{}) c.collected_at = now();
    if (c.version < 1) c.version = 1;
    c.sync_state = sync_status::pending;
    auto item = make_queue_item(create_collection{c});
    write("save_collection", [&] {
        put_locked(c);
        enqueue_locked(item);
    });
    LOG_INFO("local_store", "Saved collection %s (version %lld)", c.id.c_str(), (long long)c.version);
    return item;
}

sync_queue_item local_store::save_photo(photo p) {
    if (p.id.empty()) p.id = make_global_id();
    if (p.captured_at == timestamp_t{}) p.captured_at = now();
    p.sync_state = sync_status::pending;
    auto item = make_queue_item(upload_photo{p});
    write("save_photo", [&] {
        put_locked(p);
        enqueue_locked(item);
    });
    return item;
}

sync_queue_item local_store::update_mission_status(const global_id_t& mission_id, const std::string& status) {
    return write("update_mission_status", [&] {
        auto m = get_mission(mission_id);
        if (!m) throw store_error("No mission " + mission_id);
        m->status = status;
        m->updated_at = now();
        m->sync_state = sync_status::pending;
        auto item = make_queue_item(fieldsync::update_mission_status{mission_id, status});
        put_locked(*m);
        enqueue_locked(item);
        return item;
    });
}

sync_queue_item local_store::edit_collection(const global_id_t& collection_id, const json& changed) {
    if (!changed.is_object() || changed.empty()) {
        throw store_error("Collection edit needs a non-empty field object");
    }
    return write("edit_collection", [&] {
        auto c = get_collection(collection_id);
        if (!c) throw store_error("No property collection " + collection_id);

        update_collection edit;
        edit.collection_id = collection_id;
        edit.base_version = c->version;
        edit.version = c->version + 1;
        edit.fields = changed;

        c->fields.update(changed);
        c->version = edit.version;
        c->sync_state = sync_status::pending;

        auto item = make_queue_item(edit);
        put_locked(*c);
        enqueue_locked(item);
        return item;
    });
}

sync_queue_item local_store::edit_photo(const global_id_t& photo_id, const json& changed) {
    if (!changed.is_object() || changed.empty()) {
        throw store_error("Photo edit needs a non-empty field object");
    }
    return write("edit_photo", [&] {
        auto p = get_photo(photo_id);
        if (!p) throw store_error("No photo " + photo_id);
        auto updated = std::get<photo>(overlay(entity{*p}, changed));
        updated.sync_state = sync_status::pending;
        auto item = make_queue_item(update_photo{photo_id, changed});
        put_locked(updated);
        enqueue_locked(item);
        return item;
    });
}

sync_queue_item local_store::delete_entity(entity_kind kind, const global_id_t& id) {
    return write("delete_entity", [&] {
        auto existing = get(kind, id);
        if (!existing) throw store_error(std::string("No ") + to_string(kind) + " " + id);

        mutation change;
        switch (kind) {
            case entity_kind::mission:
                change = delete_mission{id};
                break;
            case entity_kind::property_collection:
                change = delete_collection{id, std::get<property_collection>(*existing).version};
                break;
            case entity_kind::photo:
                change = delete_photo{id};
                break;
        }
        auto item = make_queue_item(std::move(change));
        db_->remove(table_for(kind), id);
        enqueue_locked(item);
        return item;
    });
}

// ----------------------------------------------------------------------------
// Sync outcomes
// ----------------------------------------------------------------------------

bool local_store::has_outstanding(const global_id_t& reference_id, const global_id_t& except_id) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query(
        "SELECT COUNT(*) AS n FROM SyncQueue WHERE referenceId = ? AND status != 'completed' AND globalId != ?",
        {reference_id, except_id});
    return !rows.empty() && get_int(rows[0], "n") > 0;
}

void local_store::confirm_synced(entity_kind kind, const global_id_t& id,
                                 const json& fields, std::optional<int64_t> version) {
    write("confirm_synced", [&] {
        auto existing = get(kind, id);
        if (!existing) return;

        entity updated = fields.empty() ? *existing : overlay(*existing, fields);
        if (auto* c = std::get_if<property_collection>(&updated); c && version && *version > c->version) {
            c->version = *version;
        }
        fieldsync::set_sync_status(updated, has_outstanding(id) ? sync_status::pending : sync_status::synced);
        put_locked(updated);
    });
}

void local_store::replace_with_remote(entity_kind kind, const global_id_t& id,
                                      const json& remote_fields, int64_t remote_version) {
    write("replace_with_remote", [&] {
        auto existing = get(kind, id);
        entity updated;
        if (kind == entity_kind::property_collection) {
            property_collection c;
            if (existing) c = std::get<property_collection>(*existing);
            c.id = id;
            c.fields = remote_fields.is_object() ? remote_fields : json::object();
            c.version = remote_version;
            updated = c;
        } else if (existing) {
            updated = overlay(*existing, remote_fields);
        } else {
            json j = remote_fields.is_object() ? remote_fields : json::object();
            j["id"] = id;
            if (kind == entity_kind::mission) {
                updated = mission::from_json(j);
            } else {
                updated = photo::from_json(j);
            }
        }
        fieldsync::set_sync_status(updated, sync_status::synced);
        put_locked(updated);
    });
}

void local_store::merge_into_entity(entity_kind kind, const global_id_t& id,
                                    const json& fields, sync_status status) {
    write("merge_into_entity", [&] {
        auto existing = get(kind, id);
        if (!existing) return;
        auto updated = overlay(*existing, fields);
        fieldsync::set_sync_status(updated, status);
        put_locked(updated);
    });
}

// ----------------------------------------------------------------------------
// Queue
// ----------------------------------------------------------------------------

void local_store::enqueue_locked(const sync_queue_item& item) {
    if (item.id.empty()) {
        throw store_error("Cannot enqueue a queue item without an id");
    }
    db_->insert(kQueueTable, to_values(item));
}

void local_store::enqueue(const sync_queue_item& item) {
    write("enqueue", [&] { enqueue_locked(item); });
    LOG_DEBUG("local_store", "Enqueued %s for %s", item.type(), item.reference_id().c_str());
}

std::vector<sync_queue_item> local_store::load_queue(const std::string& where,
                                                     const std::vector<column_value_t>& params) {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    std::string sql = "SELECT * FROM SyncQueue";
    if (!where.empty()) sql += " WHERE " + where;
    sql += " ORDER BY createdAt ASC, id ASC";

    std::vector<sync_queue_item> items;
    for (const auto& row : db_->query(sql, params)) {
        items.push_back(queue_item_from_row(row));
    }
    return items;
}

std::vector<sync_queue_item> local_store::scan_pending(int64_t attempt_cap) {
    return load_queue(
        "status = 'pending' OR (status = 'failed' AND rejected = 0 AND transientFailures <= ?)",
        {attempt_cap});
}

std::optional<sync_queue_item> local_store::get_queue_item(const global_id_t& id) {
    auto items = load_queue("globalId = ?", {id});
    if (items.empty()) return std::nullopt;
    return items.front();
}

void local_store::update_queue_item(const global_id_t& id, const queue_item_patch& patch) {
    write("update_queue_item", [&] {
        auto current = get_queue_item(id);
        if (!current) {
            throw store_error("No queue item " + id);
        }
        if (current->status == queue_status::completed && patch.status &&
            *patch.status != queue_status::completed) {
            throw store_error("Queue item " + id + " is completed and cannot be reopened");
        }
        if (patch.attempts && *patch.attempts < current->attempts) {
            throw store_error("Queue item " + id + " attempts cannot decrease");
        }

        values_t values;
        if (patch.status) values.emplace_back("status", std::string(to_string(*patch.status)));
        if (patch.attempts) values.emplace_back("attempts", *patch.attempts);
        if (patch.last_attempt) values.emplace_back("lastAttempt", detail::to_column_value(*patch.last_attempt));
        if (patch.error) values.emplace_back("error", detail::to_column_value(*patch.error));
        if (patch.transient_failures) values.emplace_back("transientFailures", *patch.transient_failures);
        if (patch.rejected) values.emplace_back("rejected", detail::to_column_value(*patch.rejected));
        if (patch.change) {
            if (reference_id(*patch.change) != current->reference_id()) {
                throw store_error("Queue item " + id + " cannot be retargeted to another entity");
            }
            values.emplace_back("type", std::string(mutation_type(*patch.change)));
            values.emplace_back("payload", encode_payload(*patch.change).dump());
        }
        db_->update(kQueueTable, id, values);
    });
}

std::vector<sync_queue_item> local_store::queue_items() {
    return load_queue("", {});
}

queue_stats local_store::stats() {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    queue_stats s;
    for (const auto& row : db_->query("SELECT status, COUNT(*) AS n FROM SyncQueue GROUP BY status")) {
        auto n = static_cast<size_t>(get_int(row, "n"));
        switch (queue_status_from_string(get_str(row, "status"))) {
            case queue_status::pending: s.pending = n; break;
            case queue_status::processing: s.processing = n; break;
            case queue_status::completed: s.completed = n; break;
            case queue_status::failed: s.failed = n; break;
        }
    }
    return s;
}

size_t local_store::purge_completed() {
    return write("purge_completed", [&] {
        return static_cast<size_t>(db_->execute("DELETE FROM SyncQueue WHERE status = 'completed'"));
    });
}

size_t local_store::recover_interrupted() {
    return write("recover_interrupted", [&] {
        auto n = db_->execute("UPDATE SyncQueue SET status = 'pending' WHERE status = 'processing'");
        if (n > 0) {
            for (const char* table : {kMissionTable, kCollectionTable, kPhotoTable}) {
                db_->execute(std::string("UPDATE ") + table +
                             " SET syncStatus = 'pending' WHERE syncStatus = 'syncing'");
            }
        }
        return static_cast<size_t>(n);
    });
}

bool local_store::purge_item(const global_id_t& id) {
    return write("purge_item", [&] { return db_->remove(kQueueTable, id) > 0; });
}

// ----------------------------------------------------------------------------
// Mission cache
// ----------------------------------------------------------------------------

void local_store::cache_missions(const std::vector<mission>& list) {
    write("cache_missions", [&] {
        for (auto m : list) {
            auto local = get_mission(m.id);
            if (local && local->sync_state != sync_status::synced) {
                // Unsent local changes win until they are uploaded
                continue;
            }
            m.sync_state = sync_status::synced;
            put_locked(m);
        }
    });
    LOG_INFO("local_store", "Cached %zu missions", list.size());
}

size_t local_store::clear_cache() {
    return write("clear_cache", [&] {
        return static_cast<size_t>(db_->execute("DELETE FROM Mission WHERE syncStatus = 'synced'"));
    });
}

json local_store::export_data() {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    json out;
    out["exportedAt"] = to_millis(now());

    json missions_json = json::array();
    for (const auto& row : db_->query("SELECT * FROM Mission ORDER BY id ASC")) {
        missions_json.push_back(mission_from_row(row).to_json());
    }
    out["missions"] = std::move(missions_json);

    json collections_json = json::array();
    for (const auto& row : db_->query("SELECT * FROM PropertyCollection ORDER BY id ASC")) {
        collections_json.push_back(collection_from_row(row).to_json());
    }
    out["propertyCollections"] = std::move(collections_json);

    json photos_json = json::array();
    for (const auto& row : db_->query("SELECT * FROM Photo ORDER BY id ASC")) {
        photos_json.push_back(photo_from_row(row).to_json());
    }
    out["photos"] = std::move(photos_json);

    json queue_json = json::array();
    for (const auto& item : queue_items()) {
        queue_json.push_back(item.to_json());
    }
    out["syncQueue"] = std::move(queue_json);

    return out;
}

// ----------------------------------------------------------------------------
// Session rows
// ----------------------------------------------------------------------------

std::optional<cached_session> local_store::load_session() {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query("SELECT * FROM CachedSession WHERE globalId = ?", {std::string(kSingletonId)});
    if (rows.empty()) return std::nullopt;

    cached_session s;
    s.identity.user = user_record::from_json(parse_json_column(rows[0], "user"));
    s.identity.token = get_str(rows[0], "token");
    s.captured_at = get_ts(rows[0], "capturedAt");
    s.expires_at = get_ts(rows[0], "expiresAt");
    return s;
}

void local_store::store_session(const cached_session& s) {
    write("store_session", [&] {
        db_->upsert(kSessionTable, {
            {"globalId", std::string(kSingletonId)},
            {"user", s.identity.user.to_json().dump()},
            {"token", s.identity.token},
            {"capturedAt", detail::to_column_value(s.captured_at)},
            {"expiresAt", detail::to_column_value(s.expires_at)},
        });
    });
}

void local_store::clear_session() {
    write("clear_session", [&] { db_->remove(kSessionTable, kSingletonId); });
}

offline_state local_store::load_offline_state() {
    std::lock_guard<std::recursive_mutex> lock(write_mutex_);
    auto rows = db_->query("SELECT * FROM OfflineState WHERE globalId = ?", {std::string(kSingletonId)});
    offline_state state;
    if (!rows.empty()) {
        state.is_offline = get_int(rows[0], "isOffline") != 0;
        state.since = get_opt_ts(rows[0], "since");
    }
    return state;
}

void local_store::store_offline_state(const offline_state& state) {
    write("store_offline_state", [&] {
        db_->upsert(kOfflineStateTable, {
            {"globalId", std::string(kSingletonId)},
            {"isOffline", detail::to_column_value(state.is_offline)},
            {"since", detail::to_column_value(state.since)},
        });
    });
}

} // namespace fieldsync
