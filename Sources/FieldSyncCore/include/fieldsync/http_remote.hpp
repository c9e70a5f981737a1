#pragma once

#ifdef __cplusplus

#include "remote.hpp"
#include <memory>
#include <string>

namespace fieldsync {

// ============================================================================
// http_remote_authority - JSON over an injected http_client
// ============================================================================
//
//   POST {base}/api/local-login      {username, password} -> {user, token}
//   GET  {base}/api/auth/user        Bearer token          -> user
//   POST {base}/api/sync/mutations   {type, referenceId, expectedVersion, payload}
//
// Status mapping for mutations: 2xx accepted, 401/403 unauthorized,
// 409 conflict, other 4xx rejected, 5xx and 0 throw network_error.

class http_remote_authority : public remote_authority {
public:
    http_remote_authority(std::string base_url, std::shared_ptr<http_client> client);

    validation_result authenticate(const credentials& creds) override;
    validation_result validate_session(const std::string& token) override;
    apply_result apply_mutation(const global_id_t& reference_id,
                                const mutation& change,
                                int64_t expected_version) override;
    void set_token(const std::string& token) override { token_ = token; }

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    std::shared_ptr<http_client> client_;
    std::string token_;

    http_response send(http_request& request, const char* what);
};

} // namespace fieldsync

#endif // __cplusplus
