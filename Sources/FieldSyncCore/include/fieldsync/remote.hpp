#pragma once

#ifdef __cplusplus

#include "mutation.hpp"
#include "network.hpp"
#include "session.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <variant>

namespace fieldsync {

struct credentials {
    std::string email;
    std::string password;
};

// ============================================================================
// Remote results
// ============================================================================

/// The remote authority refused the session (401/403). Never retried
/// automatically; the user has to log in again.
struct auth_expired {
    std::string reason;
};

using validation_result = std::variant<session, auth_expired>;

struct mutation_accepted {
    int64_t version = 0;              // remote version after the write (0 if unversioned)
    nlohmann::json fields = nlohmann::json::object();  // authoritative fields echoed back, may be empty
};

struct mutation_conflict {
    int64_t remote_version = 0;
    nlohmann::json remote_fields = nlohmann::json::object();   // full remote state
    nlohmann::json remote_changes = nlohmann::json::object();  // fields changed since the common base
    bool changes_known = false;       // false: treat every remote field as changed
};

struct mutation_rejected {
    std::string reason;
};

struct mutation_unauthorized {
    std::string reason;
};

using apply_result = std::variant<
    mutation_accepted,
    mutation_conflict,
    mutation_rejected,
    mutation_unauthorized
>;

// ============================================================================
// remote_authority - the consumed remote endpoints
// ============================================================================
//
// All calls are synchronous. Transport failures throw network_error; every
// other outcome is a value.

class remote_authority {
public:
    virtual ~remote_authority() = default;

    /// Online login. Throws network_error when unreachable, returns
    /// auth_expired when the credentials are refused.
    virtual validation_result authenticate(const credentials& creds) = 0;

    virtual validation_result validate_session(const std::string& token) = 0;

    /// Apply one mutation. expected_version is the remote version the
    /// change was based on; 0 means no precondition.
    virtual apply_result apply_mutation(const global_id_t& reference_id,
                                        const mutation& change,
                                        int64_t expected_version) = 0;

    /// Bearer token used for apply_mutation.
    virtual void set_token(const std::string& token) = 0;
};

} // namespace fieldsync

#endif // __cplusplus
