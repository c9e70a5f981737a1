#include "fieldsync/engine.hpp"
#include "fieldsync/http_remote.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

namespace {

std::unique_ptr<remote_authority> make_http_remote(const fieldsync_config& config,
                                                   std::shared_ptr<http_client> client) {
    if (config.base_url.empty()) {
        throw config_error("baseUrl is required for the HTTP remote authority");
    }
    return std::make_unique<http_remote_authority>(config.base_url, std::move(client));
}

} // namespace

sync_engine::sync_engine(const fieldsync_config& config,
                         std::shared_ptr<http_client> client,
                         connectivity_mode initial)
    : sync_engine(config, make_http_remote(config, std::move(client)), initial) {}

sync_engine::sync_engine(const fieldsync_config& config,
                         std::unique_ptr<remote_authority> remote,
                         connectivity_mode initial)
    : config_(config) {
    if (!remote) {
        throw config_error("sync_engine needs a remote authority");
    }
    set_log_level(config_.level);

    store_ = std::make_unique<local_store>(config_.database_path);
    monitor_ = std::make_unique<connectivity_monitor>(initial, config_.debounce, config_.sched);
    auth_ = std::make_unique<offline_auth_cache>(*store_, config_.session_ttl);
    remote_ = std::move(remote);
    coordinator_ = std::make_unique<sync_coordinator>(*store_, *monitor_, *auth_, *remote_, config_.sync);

    LOG_INFO("engine", "Sync engine ready: %s, starting %s",
             config_.database_path.c_str(), to_string(initial));
}

sync_engine::~sync_engine() = default;

} // namespace fieldsync
