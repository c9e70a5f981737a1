#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <optional>

namespace fieldsync {

struct user_record {
    std::string id;
    std::string email;
    std::string first_name;
    std::string last_name;
    std::string role = "field_agent";  // field_agent, admin
    std::string team;
    bool is_active = true;

    nlohmann::json to_json() const;
    static user_record from_json(const nlohmann::json& j);
};

/// Identity returned by a successful online authentication or validation.
struct session {
    user_record user;
    std::string token;
};

/// The last known-good session as persisted on the device.
struct cached_session {
    session identity;
    timestamp_t captured_at{};
    timestamp_t expires_at{};

    bool is_expired(timestamp_t at) const { return at >= expires_at; }
};

/// Advisory offline-mode flag, persisted so the UI can show how long the
/// device has been working without a verified remote session.
struct offline_state {
    bool is_offline = false;
    std::optional<timestamp_t> since;
};

} // namespace fieldsync

#endif // __cplusplus
