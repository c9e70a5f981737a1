#include "fieldsync/auth_cache.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

const char* to_string(auth_mode mode) {
    switch (mode) {
        case auth_mode::unauthenticated: return "unauthenticated";
        case auth_mode::online_pending_validation: return "online_pending_validation";
        case auth_mode::online_authenticated: return "online_authenticated";
        case auth_mode::offline_authenticated: return "offline_authenticated";
    }
    return "unauthenticated";
}

const char* to_string(auth_sync_result result) {
    switch (result) {
        case auth_sync_result::validated: return "validated";
        case auth_sync_result::auth_expired: return "auth_expired";
        case auth_sync_result::unreachable: return "unreachable";
        case auth_sync_result::no_session: return "no_session";
    }
    return "no_session";
}

offline_auth_cache::offline_auth_cache(local_store& store, std::chrono::seconds session_ttl)
    : store_(store), ttl_(session_ttl) {}

std::optional<cached_session> offline_auth_cache::get_cached_session(timestamp_t at) {
    auto cached = store_.load_session();
    if (!cached) return std::nullopt;
    if (cached->is_expired(at)) {
        LOG_INFO("auth", "Cached session for %s has expired", cached->identity.user.email.c_str());
        return std::nullopt;
    }
    return cached;
}

void offline_auth_cache::save_session(const session& s) {
    cached_session cached;
    cached.identity = s;
    cached.captured_at = now();
    cached.expires_at = cached.captured_at + ttl_;
    store_.store_session(cached);
    requires_reauth_ = false;
    LOG_DEBUG("auth", "Session cached for %s", s.user.email.c_str());
}

void offline_auth_cache::set_offline_mode(bool enabled) {
    auto current = store_.load_offline_state();
    if (current.is_offline == enabled) return;

    offline_state state;
    state.is_offline = enabled;
    if (enabled) state.since = now();
    store_.store_offline_state(state);
    LOG_INFO("auth", "Offline mode %s", enabled ? "enabled" : "disabled");
}

bool offline_auth_cache::is_offline_mode() {
    return store_.load_offline_state().is_offline;
}

std::optional<timestamp_t> offline_auth_cache::offline_since() {
    return store_.load_offline_state().since;
}

void offline_auth_cache::invalidate(const std::string& reason) {
    LOG_WARN("auth", "Session refused by remote: %s", reason.c_str());
    store_.clear_session();
    verified_ = false;
    requires_reauth_ = true;
    mode_ = auth_mode::unauthenticated;
}

auth_sync_result offline_auth_cache::sync_with_server(remote_authority& remote) {
    auto cached = get_cached_session();
    if (!cached) {
        return requires_reauth_ ? auth_sync_result::auth_expired : auth_sync_result::no_session;
    }

    remote.set_token(cached->identity.token);
    validation_result result;
    try {
        result = remote.validate_session(cached->identity.token);
    } catch (const network_error& e) {
        LOG_WARN("auth", "Session validation unreachable: %s", e.what());
        return auth_sync_result::unreachable;
    }

    if (auto* expired = std::get_if<auth_expired>(&result)) {
        invalidate(expired->reason);
        return auth_sync_result::auth_expired;
    }

    save_session(std::get<session>(result));
    remote.set_token(std::get<session>(result).token);
    verified_ = true;
    mode_ = auth_mode::online_authenticated;
    set_offline_mode(false);
    return auth_sync_result::validated;
}

auth_mode offline_auth_cache::start(connectivity_mode mode) {
    auto cached = get_cached_session();
    if (!cached) {
        mode_ = auth_mode::unauthenticated;
    } else if (mode == connectivity_mode::offline) {
        mode_ = auth_mode::offline_authenticated;
        set_offline_mode(true);
    } else {
        mode_ = auth_mode::online_pending_validation;
    }
    LOG_INFO("auth", "Startup auth mode: %s", to_string(mode_));
    return mode_;
}

validation_result offline_auth_cache::login(remote_authority& remote, const credentials& creds) {
    auto result = remote.authenticate(creds);
    if (auto* s = std::get_if<session>(&result)) {
        save_session(*s);
        remote.set_token(s->token);
        verified_ = true;
        mode_ = auth_mode::online_authenticated;
        set_offline_mode(false);
        LOG_INFO("auth", "Logged in as %s", s->user.email.c_str());
    } else {
        LOG_WARN("auth", "Login refused: %s", std::get<auth_expired>(result).reason.c_str());
    }
    return result;
}

void offline_auth_cache::logout() {
    store_.clear_session();
    store_.store_offline_state(offline_state{});
    verified_ = false;
    requires_reauth_ = false;
    mode_ = auth_mode::unauthenticated;
    LOG_INFO("auth", "Logged out");
}

bool offline_auth_cache::can_work_offline() {
    return get_cached_session().has_value();
}

bool offline_auth_cache::is_authorized() {
    return !requires_reauth_ && get_cached_session().has_value();
}

std::optional<user_record> offline_auth_cache::current_user() {
    auto cached = get_cached_session();
    if (!cached) return std::nullopt;
    return cached->identity.user;
}

} // namespace fieldsync
