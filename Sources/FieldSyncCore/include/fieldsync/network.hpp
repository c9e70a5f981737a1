#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace fieldsync {

using headers_map = std::map<std::string, std::string>;

/// Transport-level failure: timeout, connection refused, DNS, 5xx.
/// Always transient from the sync core's point of view.
class network_error : public std::runtime_error {
public:
    explicit network_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// HTTP Client Interface
// ============================================================================
//
// Injected by the platform layer (URLSession, OkHttp, libcurl, ...). The
// client is responsible for timeouts; a request that never reached the
// server is reported as status_code 0.

struct http_response {
    int status_code = 0;
    headers_map headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }
    std::string body_string() const {
        return std::string(body.begin(), body.end());
    }
};

struct http_request {
    std::string method = "GET";
    std::string url;
    headers_map headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& s) {
        body = std::vector<uint8_t>(s.begin(), s.end());
    }

    void set_json_body(const std::string& json) {
        set_body(json);
        headers["Content-Type"] = "application/json";
    }

    void set_bearer(const std::string& token) {
        if (!token.empty()) headers["Authorization"] = "Bearer " + token;
    }
};

class http_client {
public:
    virtual ~http_client() = default;

    // Synchronous request (blocks until complete or timed out)
    virtual http_response send(const http_request& request) = 0;
};

// ============================================================================
// Null implementation - every request looks unreachable
// ============================================================================

class null_http_client : public http_client {
public:
    http_response send(const http_request&) override {
        return http_response{503, {}, {}};  // Service Unavailable
    }
};

} // namespace fieldsync

#endif // __cplusplus
