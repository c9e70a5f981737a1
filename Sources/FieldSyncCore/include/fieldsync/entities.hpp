#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <stdexcept>
#include <string>
#include <optional>
#include <variant>

namespace fieldsync {

/// Raised when a stored or received payload cannot be decoded.
class payload_error : public std::runtime_error {
public:
    explicit payload_error(const std::string& msg) : std::runtime_error(msg) {}
};

enum class entity_kind {
    mission,
    property_collection,
    photo
};

enum class sync_status {
    pending,
    syncing,
    synced,
    error
};

const char* to_string(entity_kind kind);
const char* to_string(sync_status status);
entity_kind entity_kind_from_string(const std::string& s);
sync_status sync_status_from_string(const std::string& s);

// ============================================================================
// Mission - a survey assignment cached for offline work
// ============================================================================

struct mission {
    global_id_t id;
    std::string title;
    std::string status = "new";       // new, in_progress, pending_photos, completed, approved, rejected
    std::string priority = "medium";  // low, medium, high
    std::string assigned_to;
    std::string address;
    std::string property_code;
    std::string notes;
    std::optional<double> latitude;
    std::optional<double> longitude;
    std::optional<timestamp_t> deadline;
    timestamp_t updated_at{};
    sync_status sync_state = sync_status::pending;

    nlohmann::json to_json() const;
    static mission from_json(const nlohmann::json& j);
};

// ============================================================================
// PropertyCollection - one filled-in property form with its GPS fix
// ============================================================================

struct property_collection {
    global_id_t id;
    global_id_t mission_id;
    nlohmann::json fields = nlohmann::json::object();  // form responses + capture metadata
    std::string collected_by;
    timestamp_t collected_at{};
    int64_t version = 1;
    sync_status sync_state = sync_status::pending;

    nlohmann::json to_json() const;
    static property_collection from_json(const nlohmann::json& j);
};

// ============================================================================
// Photo - a captured image attached to a collection
// ============================================================================

struct photo {
    global_id_t id;
    global_id_t collection_id;
    global_id_t mission_id;
    std::string kind;  // facade, number, lateral, back
    std::string filename;
    std::string local_path;
    std::optional<std::string> remote_path;
    bool is_primary = false;
    std::optional<double> latitude;
    std::optional<double> longitude;
    int64_t width = 0;
    int64_t height = 0;
    int64_t file_size = 0;
    timestamp_t captured_at{};
    sync_status sync_state = sync_status::pending;

    nlohmann::json to_json() const;
    static photo from_json(const nlohmann::json& j);
};

using entity = std::variant<mission, property_collection, photo>;

entity_kind kind_of(const entity& e);
const global_id_t& id_of(const entity& e);
sync_status sync_status_of(const entity& e);
void set_sync_status(entity& e, sync_status status);

} // namespace fieldsync

#endif // __cplusplus
