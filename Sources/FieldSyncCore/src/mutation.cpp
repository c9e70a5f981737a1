#include "fieldsync/mutation.hpp"
#include <type_traits>

namespace fieldsync {

using json = nlohmann::json;

const char* mutation_type(const mutation& m) {
    return std::visit([](const auto& v) -> const char* {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, create_mission>) return "create_mission";
        else if constexpr (std::is_same_v<T, update_mission_status>) return "update_mission_status";
        else if constexpr (std::is_same_v<T, delete_mission>) return "delete_mission";
        else if constexpr (std::is_same_v<T, create_collection>) return "create_collection";
        else if constexpr (std::is_same_v<T, update_collection>) return "update_collection";
        else if constexpr (std::is_same_v<T, delete_collection>) return "delete_collection";
        else if constexpr (std::is_same_v<T, upload_photo>) return "upload_photo";
        else if constexpr (std::is_same_v<T, update_photo>) return "update_photo";
        else return "delete_photo";
    }, m);
}

const global_id_t& reference_id(const mutation& m) {
    return std::visit([](const auto& v) -> const global_id_t& {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, create_mission> ||
                      std::is_same_v<T, create_collection> ||
                      std::is_same_v<T, upload_photo>) {
            return v.record.id;
        } else if constexpr (std::is_same_v<T, update_mission_status> ||
                             std::is_same_v<T, delete_mission>) {
            return v.mission_id;
        } else if constexpr (std::is_same_v<T, update_collection> ||
                             std::is_same_v<T, delete_collection>) {
            return v.collection_id;
        } else {
            return v.photo_id;
        }
    }, m);
}

entity_kind target_kind(const mutation& m) {
    switch (m.index()) {
        case 0: case 1: case 2: return entity_kind::mission;
        case 3: case 4: case 5: return entity_kind::property_collection;
        default: return entity_kind::photo;
    }
}

int64_t expected_version(const mutation& m) {
    if (auto* u = std::get_if<update_collection>(&m)) return u->base_version;
    if (auto* d = std::get_if<delete_collection>(&m)) return d->base_version;
    return 0;
}

int64_t local_version(const mutation& m) {
    if (auto* c = std::get_if<create_collection>(&m)) return c->record.version;
    if (auto* u = std::get_if<update_collection>(&m)) return u->version;
    return expected_version(m) + 1;
}

json changed_fields(const mutation& m) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, create_collection>) {
            return v.record.fields;
        } else if constexpr (std::is_same_v<T, update_collection> ||
                             std::is_same_v<T, update_photo>) {
            return v.fields;
        } else if constexpr (std::is_same_v<T, update_mission_status>) {
            return json{{"status", v.status}};
        } else if constexpr (std::is_same_v<T, create_mission> ||
                             std::is_same_v<T, upload_photo>) {
            auto j = v.record.to_json();
            j.erase("id");
            j.erase("syncStatus");
            return j;
        } else {
            return json::object();
        }
    }, m);
}

bool is_delete(const mutation& m) {
    return std::holds_alternative<delete_mission>(m) ||
           std::holds_alternative<delete_collection>(m) ||
           std::holds_alternative<delete_photo>(m);
}

mutation rebase(const mutation& m, int64_t remote_version, int64_t target_version,
                const json& fields) {
    return std::visit([&](const auto& v) -> mutation {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, create_collection> ||
                      std::is_same_v<T, update_collection>) {
            update_collection u;
            u.collection_id = reference_id(m);
            u.base_version = remote_version;
            u.version = target_version;
            u.fields = fields;
            return u;
        } else if constexpr (std::is_same_v<T, delete_collection>) {
            return delete_collection{v.collection_id, remote_version};
        } else if constexpr (std::is_same_v<T, update_mission_status>) {
            T copy = v;
            if (fields.contains("status") && fields["status"].is_string()) {
                copy.status = fields["status"].get<std::string>();
            }
            return copy;
        } else if constexpr (std::is_same_v<T, update_photo>) {
            T copy = v;
            copy.fields = fields;
            return copy;
        } else {
            return v;
        }
    }, m);
}

// ============================================================================
// Encoding
// ============================================================================

json encode_payload(const mutation& m) {
    return std::visit([](const auto& v) -> json {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, create_mission> ||
                      std::is_same_v<T, create_collection> ||
                      std::is_same_v<T, upload_photo>) {
            return v.record.to_json();
        } else if constexpr (std::is_same_v<T, update_mission_status>) {
            return json{{"id", v.mission_id}, {"status", v.status}};
        } else if constexpr (std::is_same_v<T, delete_mission>) {
            return json{{"id", v.mission_id}};
        } else if constexpr (std::is_same_v<T, update_collection>) {
            return json{{"id", v.collection_id},
                        {"baseVersion", v.base_version},
                        {"version", v.version},
                        {"fields", v.fields}};
        } else if constexpr (std::is_same_v<T, delete_collection>) {
            return json{{"id", v.collection_id}, {"baseVersion", v.base_version}};
        } else if constexpr (std::is_same_v<T, update_photo>) {
            return json{{"id", v.photo_id}, {"fields", v.fields}};
        } else {
            return json{{"id", v.photo_id}};
        }
    }, m);
}

static global_id_t payload_id(const json& payload, const std::string& type) {
    if (!payload.is_object() || !payload.contains("id") || !payload["id"].is_string()) {
        throw payload_error("Mutation " + type + " has no reference id");
    }
    return payload["id"].get<std::string>();
}

static int64_t payload_int(const json& payload, const char* key, const std::string& type) {
    if (!payload.contains(key) || !payload[key].is_number_integer()) {
        throw payload_error("Mutation " + type + " is missing integer field " + key);
    }
    return payload[key].get<int64_t>();
}

static json payload_fields(const json& payload, const std::string& type) {
    if (!payload.contains("fields") || !payload["fields"].is_object()) {
        throw payload_error("Mutation " + type + " is missing its fields object");
    }
    return payload["fields"];
}

mutation decode_mutation(const std::string& type, const json& payload) {
    if (type == "create_mission") {
        return create_mission{mission::from_json(payload)};
    }
    if (type == "update_mission_status") {
        if (!payload.contains("status") || !payload["status"].is_string()) {
            throw payload_error("Mutation update_mission_status has no status");
        }
        return update_mission_status{payload_id(payload, type), payload["status"].get<std::string>()};
    }
    if (type == "delete_mission") {
        return delete_mission{payload_id(payload, type)};
    }
    if (type == "create_collection") {
        return create_collection{property_collection::from_json(payload)};
    }
    if (type == "update_collection") {
        update_collection u;
        u.collection_id = payload_id(payload, type);
        u.base_version = payload_int(payload, "baseVersion", type);
        u.version = payload_int(payload, "version", type);
        u.fields = payload_fields(payload, type);
        return u;
    }
    if (type == "delete_collection") {
        return delete_collection{payload_id(payload, type), payload_int(payload, "baseVersion", type)};
    }
    if (type == "upload_photo") {
        return upload_photo{photo::from_json(payload)};
    }
    if (type == "update_photo") {
        return update_photo{payload_id(payload, type), payload_fields(payload, type)};
    }
    if (type == "delete_photo") {
        return delete_photo{payload_id(payload, type)};
    }
    throw payload_error("Unknown mutation type: " + type);
}

} // namespace fieldsync
