#include "fieldsync/conflict.hpp"
#include "fieldsync/entities.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

using json = nlohmann::json;

const char* to_string(const conflict_decision& d) {
    switch (d.index()) {
        case 0: return "keep_local";
        case 1: return "keep_remote";
        default: return "merged";
    }
}

static const json& as_object(const json& j, const char* side) {
    if (!j.is_object() && !j.is_null()) {
        throw payload_error(std::string(side) + " conflict payload must be a JSON object");
    }
    return j;
}

bool conflict_resolver::disjoint(const json& a, const json& b) {
    if (!a.is_object() || !b.is_object()) return true;
    const json& smaller = a.size() <= b.size() ? a : b;
    const json& larger = a.size() <= b.size() ? b : a;
    for (auto it = smaller.begin(); it != smaller.end(); ++it) {
        if (larger.contains(it.key())) return false;
    }
    return true;
}

conflict_decision conflict_resolver::resolve(int64_t local_version,
                                             const json& local_payload,
                                             int64_t remote_version,
                                             const json& remote_payload) const {
    const json& local = as_object(local_payload, "Local");
    const json& remote = as_object(remote_payload, "Remote");

    if (local_version > remote_version) {
        LOG_DEBUG("conflict", "v%lld > v%lld: keep local", (long long)local_version, (long long)remote_version);
        return keep_local{};
    }
    if (local_version < remote_version) {
        LOG_DEBUG("conflict", "v%lld < v%lld: keep remote", (long long)local_version, (long long)remote_version);
        return keep_remote{};
    }

    if (disjoint(local, remote)) {
        json payload = remote.is_object() ? remote : json::object();
        if (local.is_object()) payload.update(local);
        LOG_DEBUG("conflict", "v%lld: disjoint edits merged", (long long)local_version);
        return merged{std::move(payload)};
    }

    LOG_INFO("conflict", "v%lld: overlapping edits, remote wins, local edit kept as follow-up",
             (long long)local_version);
    return keep_remote{local.is_object() ? local : json::object()};
}

} // namespace fieldsync
