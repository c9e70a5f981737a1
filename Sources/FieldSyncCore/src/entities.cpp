#include "fieldsync/entities.hpp"

namespace fieldsync {

using json = nlohmann::json;

const char* to_string(entity_kind kind) {
    switch (kind) {
        case entity_kind::mission: return "Mission";
        case entity_kind::property_collection: return "PropertyCollection";
        case entity_kind::photo: return "Photo";
    }
    return "Unknown";
}

const char* to_string(sync_status status) {
    switch (status) {
        case sync_status::pending: return "pending";
        case sync_status::syncing: return "syncing";
        case sync_status::synced: return "synced";
        case sync_status::error: return "error";
    }
    return "pending";
}

entity_kind entity_kind_from_string(const std::string& s) {
    if (s == "Mission") return entity_kind::mission;
    if (s == "PropertyCollection") return entity_kind::property_collection;
    if (s == "Photo") return entity_kind::photo;
    throw payload_error("Unknown entity kind: " + s);
}

sync_status sync_status_from_string(const std::string& s) {
    if (s == "pending") return sync_status::pending;
    if (s == "syncing") return sync_status::syncing;
    if (s == "synced") return sync_status::synced;
    if (s == "error") return sync_status::error;
    throw payload_error("Unknown sync status: " + s);
}

// ============================================================================
// JSON field helpers
// ============================================================================

static std::string get_string(const json& j, const char* key, const std::string& fallback = "") {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return fallback;
}

static std::optional<std::string> get_optional_string(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

static std::optional<double> get_optional_double(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number()) {
        return j[key].get<double>();
    }
    return std::nullopt;
}

static int64_t get_int(const json& j, const char* key, int64_t fallback) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return j[key].get<int64_t>();
    }
    return fallback;
}

static std::optional<timestamp_t> get_optional_timestamp(const json& j, const char* key) {
    if (j.contains(key) && j[key].is_number_integer()) {
        return from_millis(j[key].get<int64_t>());
    }
    return std::nullopt;
}

static global_id_t require_id(const json& j, const char* what) {
    if (!j.is_object()) {
        throw payload_error(std::string(what) + " payload is not an object");
    }
    auto id = get_string(j, "id");
    if (id.empty()) {
        throw payload_error(std::string(what) + " payload has no id");
    }
    return id;
}

static json optional_to_json(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

// ============================================================================
// mission
// ============================================================================

json mission::to_json() const {
    json j;
    j["id"] = id;
    j["title"] = title;
    j["status"] = status;
    j["priority"] = priority;
    j["assignedTo"] = assigned_to;
    j["address"] = address;
    j["propertyCode"] = property_code;
    j["notes"] = notes;
    j["latitude"] = optional_to_json(latitude);
    j["longitude"] = optional_to_json(longitude);
    j["deadline"] = deadline ? json(to_millis(*deadline)) : json(nullptr);
    j["updatedAt"] = to_millis(updated_at);
    j["syncStatus"] = to_string(sync_state);
    return j;
}

mission mission::from_json(const json& j) {
    mission m;
    m.id = require_id(j, "Mission");
    m.title = get_string(j, "title");
    m.status = get_string(j, "status", "new");
    m.priority = get_string(j, "priority", "medium");
    m.assigned_to = get_string(j, "assignedTo");
    m.address = get_string(j, "address");
    m.property_code = get_string(j, "propertyCode");
    m.notes = get_string(j, "notes");
    m.latitude = get_optional_double(j, "latitude");
    m.longitude = get_optional_double(j, "longitude");
    m.deadline = get_optional_timestamp(j, "deadline");
    m.updated_at = get_optional_timestamp(j, "updatedAt").value_or(timestamp_t{});
    m.sync_state = sync_status_from_string(get_string(j, "syncStatus", "pending"));
    return m;
}

// ============================================================================
// property_collection
// ============================================================================

json property_collection::to_json() const {
    json j;
    j["id"] = id;
    j["missionId"] = mission_id;
    j["fields"] = fields;
    j["collectedBy"] = collected_by;
    j["collectedAt"] = to_millis(collected_at);
    j["version"] = version;
    j["syncStatus"] = to_string(sync_state);
    return j;
}

property_collection property_collection::from_json(const json& j) {
    property_collection c;
    c.id = require_id(j, "PropertyCollection");
    c.mission_id = get_string(j, "missionId");
    if (j.contains("fields")) {
        if (!j["fields"].is_object()) {
            throw payload_error("PropertyCollection fields must be an object");
        }
        c.fields = j["fields"];
    }
    c.collected_by = get_string(j, "collectedBy");
    c.collected_at = get_optional_timestamp(j, "collectedAt").value_or(timestamp_t{});
    c.version = get_int(j, "version", 1);
    c.sync_state = sync_status_from_string(get_string(j, "syncStatus", "pending"));
    return c;
}

// ============================================================================
// photo
// ============================================================================

json photo::to_json() const {
    json j;
    j["id"] = id;
    j["collectionId"] = collection_id;
    j["missionId"] = mission_id;
    j["type"] = kind;
    j["filename"] = filename;
    j["localPath"] = local_path;
    j["remotePath"] = remote_path ? json(*remote_path) : json(nullptr);
    j["isPrimary"] = is_primary;
    j["latitude"] = optional_to_json(latitude);
    j["longitude"] = optional_to_json(longitude);
    j["width"] = width;
    j["height"] = height;
    j["fileSize"] = file_size;
    j["capturedAt"] = to_millis(captured_at);
    j["syncStatus"] = to_string(sync_state);
    return j;
}

photo photo::from_json(const json& j) {
    photo p;
    p.id = require_id(j, "Photo");
    p.collection_id = get_string(j, "collectionId");
    p.mission_id = get_string(j, "missionId");
    p.kind = get_string(j, "type");
    p.filename = get_string(j, "filename");
    p.local_path = get_string(j, "localPath");
    p.remote_path = get_optional_string(j, "remotePath");
    p.is_primary = j.contains("isPrimary") && j["isPrimary"].is_boolean() && j["isPrimary"].get<bool>();
    p.latitude = get_optional_double(j, "latitude");
    p.longitude = get_optional_double(j, "longitude");
    p.width = get_int(j, "width", 0);
    p.height = get_int(j, "height", 0);
    p.file_size = get_int(j, "fileSize", 0);
    p.captured_at = get_optional_timestamp(j, "capturedAt").value_or(timestamp_t{});
    p.sync_state = sync_status_from_string(get_string(j, "syncStatus", "pending"));
    return p;
}

// ============================================================================
// entity helpers
// ============================================================================

entity_kind kind_of(const entity& e) {
    switch (e.index()) {
        case 0: return entity_kind::mission;
        case 1: return entity_kind::property_collection;
        default: return entity_kind::photo;
    }
}

const global_id_t& id_of(const entity& e) {
    return std::visit([](const auto& v) -> const global_id_t& { return v.id; }, e);
}

sync_status sync_status_of(const entity& e) {
    return std::visit([](const auto& v) { return v.sync_state; }, e);
}

void set_sync_status(entity& e, sync_status status) {
    std::visit([status](auto& v) { v.sync_state = status; }, e);
}

} // namespace fieldsync
