#pragma once

#ifdef __cplusplus

#include "auth_cache.hpp"
#include "config.hpp"
#include "connectivity.hpp"
#include "coordinator.hpp"
#include "local_store.hpp"
#include "network.hpp"
#include "remote.hpp"
#include <memory>

namespace fieldsync {

// ============================================================================
// sync_engine - the whole sync core, assembled from one configuration
// ============================================================================
//
// Owns the store, the connectivity monitor, the auth cache, the remote
// authority and the coordinator, built in dependency order and torn down in
// reverse. The host feeds raw reachability into monitor() and reads state
// through coordinator().
//
// Usage:
//   auto config = load_config("fieldsync.json");
//   sync_engine engine(config, platform_http_client);
//   engine.coordinator().start();

class sync_engine {
public:
    /// HTTP binding against config.base_url. Throws config_error when no
    /// base URL is configured.
    sync_engine(const fieldsync_config& config,
                std::shared_ptr<http_client> client,
                connectivity_mode initial = connectivity_mode::offline);

    /// Custom remote authority (tests, alternative transports).
    sync_engine(const fieldsync_config& config,
                std::unique_ptr<remote_authority> remote,
                connectivity_mode initial = connectivity_mode::offline);

    ~sync_engine();

    sync_engine(const sync_engine&) = delete;
    sync_engine& operator=(const sync_engine&) = delete;
    sync_engine(sync_engine&&) = delete;
    sync_engine& operator=(sync_engine&&) = delete;

    const fieldsync_config& config() const { return config_; }

    local_store& store() { return *store_; }
    connectivity_monitor& monitor() { return *monitor_; }
    offline_auth_cache& auth() { return *auth_; }
    remote_authority& remote() { return *remote_; }
    sync_coordinator& coordinator() { return *coordinator_; }

private:
    fieldsync_config config_;
    std::unique_ptr<local_store> store_;
    std::unique_ptr<connectivity_monitor> monitor_;
    std::unique_ptr<offline_auth_cache> auth_;
    std::unique_ptr<remote_authority> remote_;
    std::unique_ptr<sync_coordinator> coordinator_;
};

} // namespace fieldsync

#endif // __cplusplus
