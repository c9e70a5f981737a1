#include "fieldsync/coordinator.hpp"
#include "fieldsync/log.hpp"

namespace fieldsync {

namespace {

struct in_progress_guard {
    std::atomic<bool>& flag;
    ~in_progress_guard() { flag.store(false); }
};

} // namespace

sync_coordinator::sync_coordinator(local_store& store,
                                   connectivity_monitor& monitor,
                                   offline_auth_cache& auth,
                                   remote_authority& remote,
                                   sync_options options)
    : store_(store)
    , monitor_(monitor)
    , auth_(auth)
    , remote_(remote)
    , processor_(store, remote, options) {
    subscription_ = monitor_.subscribe([this](const connectivity_event& event) {
        on_transition(event);
    });
}

sync_coordinator::~sync_coordinator() {
    monitor_.unsubscribe(subscription_);
}

auth_mode sync_coordinator::start() {
    auto mode = auth_.start(monitor_.current_mode());
    if (mode == auth_mode::online_pending_validation) {
        refresh_and_drain();
    }
    return auth_.mode();
}

void sync_coordinator::on_transition(const connectivity_event& event) {
    try {
        if (event.current == connectivity_mode::online) {
            refresh_and_drain();
        } else {
            auth_.set_offline_mode(true);
        }
    } catch (const db_error& e) {
        LOG_ERROR("coordinator", "Storage failure handling %s -> %s: %s",
                  to_string(event.previous), to_string(event.current), e.what());
        notify_error(e.what());
    } catch (const payload_error& e) {
        LOG_ERROR("coordinator", "Corrupt queue data: %s", e.what());
        notify_error(e.what());
    } catch (const std::exception& e) {
        // Runs on the scheduler; nothing above us can handle it
        LOG_ERROR("coordinator", "Remote authority failed handling %s -> %s: %s",
                  to_string(event.previous), to_string(event.current), e.what());
        notify_error(e.what());
    }
}

void sync_coordinator::refresh_and_drain() {
    auto result = auth_.sync_with_server(remote_);
    LOG_INFO("coordinator", "Session refresh: %s", to_string(result));
    if (result == auth_sync_result::auth_expired) {
        notify_auth_expired("Session expired, please log in again");
        return;
    }
    run_drain();
}

drain_report sync_coordinator::run_drain() {
    drain_report report;
    if (auth_.requires_reauthentication()) {
        LOG_INFO("coordinator", "Drain blocked until the user logs in again");
        report.outcome = drain_outcome::deferred;
        return report;
    }

    bool expected = false;
    if (!drain_in_progress_.compare_exchange_strong(expected, true)) {
        report.outcome = drain_outcome::already_running;
        return report;
    }

    drain_context context;
    context.mode = [this] { return monitor_.current_mode(); };
    context.authorized = [this] { return auth_.is_authorized(); };

    {
        in_progress_guard guard{drain_in_progress_};
        report = processor_.drain(context);
    }

    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        last_report_ = report;
    }

    if (report.outcome == drain_outcome::auth_expired) {
        auth_.invalidate(report.last_error.value_or("Unauthorized"));
        notify_auth_expired(report.last_error.value_or("Session expired, please log in again"));
    }
    if (on_drain_complete_) on_drain_complete_(report);
    return report;
}

drain_report sync_coordinator::request_drain() {
    return run_drain();
}

bool sync_coordinator::retry_failed_item(const global_id_t& id) {
    if (auth_.requires_reauthentication()) {
        LOG_WARN("coordinator", "Retry of %s blocked until the user logs in again", id.c_str());
        return false;
    }
    if (!processor_.retry_failed_item(id)) {
        return false;
    }
    if (monitor_.is_online()) {
        run_drain();
    }
    return true;
}

validation_result sync_coordinator::login(const credentials& creds) {
    auto result = auth_.login(remote_, creds);
    if (std::holds_alternative<session>(result) && monitor_.is_online()) {
        run_drain();
    }
    return result;
}

void sync_coordinator::logout() {
    auth_.logout();
}

sync_status_view sync_coordinator::status() {
    sync_status_view view;
    view.mode = monitor_.current_mode();
    view.auth = auth_.mode();
    view.queue = store_.stats();
    view.offline_since = auth_.offline_since();
    view.requires_reauthentication = auth_.requires_reauthentication();
    view.draining = drain_in_progress_.load();
    {
        std::lock_guard<std::mutex> lock(report_mutex_);
        view.last_drain = last_report_;
    }
    return view;
}

void sync_coordinator::notify_auth_expired(const std::string& reason) {
    if (on_auth_expired_) on_auth_expired_(reason);
}

void sync_coordinator::notify_error(const std::string& error) {
    if (on_error_) on_error_(error);
}

} // namespace fieldsync
