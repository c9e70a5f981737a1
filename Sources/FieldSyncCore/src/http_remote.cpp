#include "fieldsync/http_remote.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

using json = nlohmann::json;

namespace {

// Bodies are JSON by contract, but error pages from proxies are not.
json parse_body(const http_response& response) {
    if (response.body.empty()) return json::object();
    auto parsed = json::parse(response.body_string(), nullptr, false);
    if (parsed.is_discarded()) return json::object();
    return parsed;
}

std::string message_of(const json& body, const std::string& fallback) {
    if (body.is_object() && body.contains("message") && body["message"].is_string()) {
        return body["message"].get<std::string>();
    }
    return fallback;
}

session session_from_body(const json& body, const std::string& fallback_token) {
    session s;
    const json& user = (body.is_object() && body.contains("user")) ? body["user"] : body;
    s.user = user_record::from_json(user);
    if (body.is_object() && body.contains("token") && body["token"].is_string()) {
        s.token = body["token"].get<std::string>();
    } else {
        s.token = fallback_token;
    }
    if (s.user.id.empty()) {
        throw payload_error("Session response carries no user id");
    }
    return s;
}

bool is_auth_status(int status) {
    return status == 401 || status == 403;
}

} // namespace

http_remote_authority::http_remote_authority(std::string base_url, std::shared_ptr<http_client> client)
    : base_url_(std::move(base_url)), client_(std::move(client)) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
    if (!client_) {
        client_ = std::make_shared<null_http_client>();
    }
}

http_response http_remote_authority::send(http_request& request, const char* what) {
    request.headers["Accept"] = "application/json";
    auto response = client_->send(request);
    if (response.status_code == 0) {
        LOG_WARN("remote", "%s: %s unreachable", what, request.url.c_str());
        throw network_error(std::string(what) + ": server unreachable");
    }
    if (response.status_code >= 500) {
        LOG_WARN("remote", "%s: server error %d", what, response.status_code);
        throw network_error(std::string(what) + ": server error " + std::to_string(response.status_code));
    }
    LOG_DEBUG("remote", "%s %s -> %d", request.method.c_str(), request.url.c_str(), response.status_code);
    return response;
}

validation_result http_remote_authority::authenticate(const credentials& creds) {
    http_request request;
    request.method = "POST";
    request.url = base_url_ + "/api/local-login";
    request.set_json_body(json{{"username", creds.email}, {"password", creds.password}}.dump());

    auto response = send(request, "authenticate");
    auto body = parse_body(response);
    if (response.is_success()) {
        auto s = session_from_body(body, "");
        token_ = s.token;
        return s;
    }
    // Wrong credentials come back as 400/401; neither is retryable
    return auth_expired{message_of(body, "Login refused (" + std::to_string(response.status_code) + ")")};
}

validation_result http_remote_authority::validate_session(const std::string& token) {
    http_request request;
    request.method = "GET";
    request.url = base_url_ + "/api/auth/user";
    request.set_bearer(token);

    auto response = send(request, "validate_session");
    auto body = parse_body(response);
    if (response.is_success()) {
        auto s = session_from_body(body, token);
        token_ = s.token;
        return s;
    }
    if (is_auth_status(response.status_code)) {
        return auth_expired{message_of(body, "Unauthorized")};
    }
    throw network_error("validate_session: unexpected status " + std::to_string(response.status_code));
}

apply_result http_remote_authority::apply_mutation(const global_id_t& reference_id,
                                                   const mutation& change,
                                                   int64_t expected_version) {
    http_request request;
    request.method = "POST";
    request.url = base_url_ + "/api/sync/mutations";
    request.set_bearer(token_);
    request.set_json_body(json{
        {"type", mutation_type(change)},
        {"referenceId", reference_id},
        {"entity", to_string(target_kind(change))},
        {"expectedVersion", expected_version},
        {"payload", encode_payload(change)},
    }.dump());

    auto response = send(request, "apply_mutation");
    auto body = parse_body(response);

    if (response.is_success()) {
        mutation_accepted accepted;
        if (body.contains("version") && body["version"].is_number_integer()) {
            accepted.version = body["version"].get<int64_t>();
        }
        if (body.contains("fields") && body["fields"].is_object()) {
            accepted.fields = body["fields"];
        }
        return accepted;
    }
    if (is_auth_status(response.status_code)) {
        return mutation_unauthorized{message_of(body, "Unauthorized")};
    }
    if (response.status_code == 409) {
        mutation_conflict conflict;
        if (body.contains("version") && body["version"].is_number_integer()) {
            conflict.remote_version = body["version"].get<int64_t>();
        }
        if (body.contains("fields") && body["fields"].is_object()) {
            conflict.remote_fields = body["fields"];
        }
        if (body.contains("changedFields") && body["changedFields"].is_object()) {
            conflict.remote_changes = body["changedFields"];
            conflict.changes_known = true;
        }
        LOG_INFO("remote", "Conflict on %s: remote version %lld",
                 reference_id.c_str(), (long long)conflict.remote_version);
        return conflict;
    }
    return mutation_rejected{message_of(body, "Rejected (" + std::to_string(response.status_code) + ")")};
}

} // namespace fieldsync
