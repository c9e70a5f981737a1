#include "fieldsync/session.hpp"

namespace fieldsync {

using json = nlohmann::json;

json user_record::to_json() const {
    json j;
    j["id"] = id;
    j["email"] = email;
    j["firstName"] = first_name;
    j["lastName"] = last_name;
    j["role"] = role;
    j["team"] = team;
    j["isActive"] = is_active;
    return j;
}

user_record user_record::from_json(const json& j) {
    user_record u;
    if (!j.is_object()) return u;

    auto str = [&j](const char* key, const std::string& fallback = "") {
        if (j.contains(key) && j[key].is_string()) {
            return j[key].get<std::string>();
        }
        return fallback;
    };

    u.id = str("id");
    u.email = str("email");
    u.first_name = str("firstName");
    u.last_name = str("lastName");
    u.role = str("role", "field_agent");
    u.team = str("team");
    if (j.contains("isActive") && j["isActive"].is_boolean()) {
        u.is_active = j["isActive"].get<bool>();
    }
    return u;
}

} // namespace fieldsync
