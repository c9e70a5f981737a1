#pragma once

#ifdef __cplusplus

#include "entities.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace fieldsync {

// ============================================================================
// Mutation variants
// ============================================================================
//
// A closed set of changes a field device can queue. Each variant carries
// its own typed payload and its own JSON encoding (see encode_payload /
// decode_mutation). Missions and photos are unversioned: their mutations
// are sent with expected version 0, which the remote authority treats as
// "no precondition". Property collections carry the version they were
// edited from (base_version) and the version the edit produces (version).

struct create_mission {
    mission record;
};

struct update_mission_status {
    global_id_t mission_id;
    std::string status;
};

struct delete_mission {
    global_id_t mission_id;
};

struct create_collection {
    property_collection record;
};

struct update_collection {
    global_id_t collection_id;
    int64_t base_version = 0;
    int64_t version = 1;
    nlohmann::json fields = nlohmann::json::object();  // changed fields only
};

struct delete_collection {
    global_id_t collection_id;
    int64_t base_version = 0;
};

struct upload_photo {
    photo record;
};

struct update_photo {
    global_id_t photo_id;
    nlohmann::json fields = nlohmann::json::object();
};

struct delete_photo {
    global_id_t photo_id;
};

using mutation = std::variant<
    create_mission,
    update_mission_status,
    delete_mission,
    create_collection,
    update_collection,
    delete_collection,
    upload_photo,
    update_photo,
    delete_photo
>;

/// Stable tag stored in the queue's type column ("create_collection", ...).
const char* mutation_type(const mutation& m);

const global_id_t& reference_id(const mutation& m);
entity_kind target_kind(const mutation& m);

/// Remote version the mutation was based on (0 = unconditional).
int64_t expected_version(const mutation& m);

/// Version the local edit produced; the conflict tie-breaker.
int64_t local_version(const mutation& m);

/// JSON object of the fields this mutation modifies.
nlohmann::json changed_fields(const mutation& m);

bool is_delete(const mutation& m);

/// Rewrite a mutation so it applies on top of remote_version and produces
/// target_version with the given field set. A create whose record already
/// exists remotely becomes an update.
mutation rebase(const mutation& m, int64_t remote_version, int64_t target_version,
                const nlohmann::json& fields);

nlohmann::json encode_payload(const mutation& m);

/// Throws payload_error for unknown types or malformed payloads.
mutation decode_mutation(const std::string& type, const nlohmann::json& payload);

} // namespace fieldsync

#endif // __cplusplus
