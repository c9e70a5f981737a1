#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <variant>

namespace fieldsync {

// ============================================================================
// Conflict decisions
// ============================================================================

/// Local edit supersedes; resend it on top of the remote version.
struct keep_local {};

/// Remote state wins. When both sides edited the same fields from the same
/// base, the local edit is carried in follow_up so it can be queued again
/// as a new mutation instead of being dropped.
struct keep_remote {
    std::optional<nlohmann::json> follow_up;
};

/// Both edits survive: union of the disjoint field sets.
struct merged {
    nlohmann::json payload;
};

using conflict_decision = std::variant<keep_local, keep_remote, merged>;

const char* to_string(const conflict_decision& d);

// ============================================================================
// conflict_resolver - last-writer-wins by version
// ============================================================================
//
// Versions are the only ordering; device clocks are not trusted. Payloads
// are JSON objects of changed fields.
//
//   local > remote  keep_local
//   local < remote  keep_remote
//   equal           merged if the changed-field sets are disjoint,
//                   otherwise keep_remote with the local edit as follow_up

class conflict_resolver {
public:
    conflict_decision resolve(int64_t local_version,
                              const nlohmann::json& local_payload,
                              int64_t remote_version,
                              const nlohmann::json& remote_payload) const;

    static bool disjoint(const nlohmann::json& a, const nlohmann::json& b);
};

} // namespace fieldsync

#endif // __cplusplus
