#include "fieldsync/connectivity.hpp"
#include "fieldsync/log.hpp"
#include <vector>

namespace fieldsync {

const char* to_string(connectivity_mode mode) {
    return mode == connectivity_mode::online ? "online" : "offline";
}

connectivity_monitor::connectivity_monitor(connectivity_mode initial,
                                           std::chrono::milliseconds debounce,
                                           shared_scheduler sched)
    : current_(initial), debounce_(debounce), scheduler_(std::move(sched)) {
    if (!scheduler_) {
        scheduler_ = std::make_shared<immediate_scheduler>();
    }
}

connectivity_mode connectivity_monitor::current_mode() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return current_;
}

connectivity_monitor::subscription_id connectivity_monitor::subscribe(handler_t handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_.emplace(id, std::move(handler));
    return id;
}

void connectivity_monitor::unsubscribe(subscription_id id) {
    std::lock_guard<std::mutex> lock(mutex_);
    handlers_.erase(id);
}

size_t connectivity_monitor::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return handlers_.size();
}

void connectivity_monitor::report(connectivity_mode mode, monotonic_t at) {
    std::lock_guard<std::mutex> lock(mutex_);
    LOG_DEBUG("connectivity", "Raw report: %s", to_string(mode));
    if (mode == current_) {
        // Back where we started; whatever was pending is cancelled
        candidate_.reset();
        return;
    }
    if (candidate_ && *candidate_ == mode) {
        return;
    }
    candidate_ = mode;
    candidate_at_ = at;
}

std::optional<monotonic_t> connectivity_monitor::deadline() const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!candidate_) return std::nullopt;
    return candidate_at_ + debounce_;
}

bool connectivity_monitor::tick(monotonic_t at) {
    connectivity_event event{};
    std::vector<handler_t> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!candidate_ || at < candidate_at_ + debounce_) {
            return false;
        }
        auto settled = *candidate_;
        candidate_.reset();
        if (settled == current_) {
            return false;
        }
        event = {current_, settled};
        current_ = settled;
        for (const auto& entry : handlers_) {
            targets.push_back(entry.second);
        }
    }

    LOG_INFO("connectivity", "Connectivity changed: %s -> %s",
             to_string(event.previous), to_string(event.current));
    if (!scheduler_->can_invoke()) {
        LOG_WARN("connectivity", "Scheduler shut down, %zu subscribers not notified", targets.size());
        return true;
    }
    for (auto& handler : targets) {
        scheduler_->invoke([handler, event] { handler(event); });
    }
    return true;
}

} // namespace fieldsync
