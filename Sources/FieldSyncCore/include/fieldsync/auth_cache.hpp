#pragma once

#ifdef __cplusplus

#include "connectivity.hpp"
#include "local_store.hpp"
#include "remote.hpp"
#include <chrono>
#include <optional>

namespace fieldsync {

enum class auth_mode {
    unauthenticated,
    online_pending_validation,   // online at startup, cached session not yet revalidated
    online_authenticated,
    offline_authenticated        // accepted from cache without remote validation
};

const char* to_string(auth_mode mode);

enum class auth_sync_result {
    validated,      // remote confirmed the session, cache refreshed
    auth_expired,   // remote refused it, cache cleared, login required
    unreachable,    // network failure, cache kept
    no_session      // nothing cached to validate
};

const char* to_string(auth_sync_result result);

// ============================================================================
// offline_auth_cache - last known-good session, persisted
// ============================================================================
//
// Owns the CachedSession and OfflineState rows of the local store. A session
// is written only after the remote authority accepted it, never from offline
// state. Once the remote refuses a session, requires_reauthentication()
// stays true until the next successful login.

class offline_auth_cache {
public:
    explicit offline_auth_cache(local_store& store,
                                std::chrono::seconds session_ttl = std::chrono::hours(24 * 7));

    /// Absent if nothing is cached or the cached session has expired.
    std::optional<cached_session> get_cached_session(timestamp_t at = now());

    void save_session(const session& s);

    void set_offline_mode(bool enabled);
    bool is_offline_mode();
    std::optional<timestamp_t> offline_since();

    auth_sync_result sync_with_server(remote_authority& remote);

    /// Startup policy for the connectivity mode the device boots in.
    auth_mode start(connectivity_mode mode);

    /// Online login. Throws network_error when the authority is unreachable.
    validation_result login(remote_authority& remote, const credentials& creds);
    void logout();

    bool can_work_offline();
    bool is_verified() const { return verified_; }
    bool requires_reauthentication() const { return requires_reauth_; }
    auth_mode mode() const { return mode_; }

    /// True when queued mutations may be sent: a usable session exists and
    /// the remote has not refused it.
    bool is_authorized();

    std::optional<user_record> current_user();

    /// The remote refused the session outside of sync_with_server (e.g. a
    /// 401 mid-drain). Clears the cache and requires a new login.
    void invalidate(const std::string& reason);

private:
    local_store& store_;
    std::chrono::seconds ttl_;
    bool verified_ = false;
    bool requires_reauth_ = false;
    auth_mode mode_ = auth_mode::unauthenticated;
};

} // namespace fieldsync

#endif // __cplusplus
