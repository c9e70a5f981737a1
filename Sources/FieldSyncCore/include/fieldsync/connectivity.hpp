#pragma once

#ifdef __cplusplus

#include "scheduler.hpp"
#include "types.hpp"
#include <chrono>
#include <functional>
#include <map>
#include <mutex>
#include <optional>

namespace fieldsync {

enum class connectivity_mode {
    offline,
    online
};

const char* to_string(connectivity_mode mode);

struct connectivity_event {
    connectivity_mode previous;
    connectivity_mode current;
};

// ============================================================================
// connectivity_monitor - debounced reachability
// ============================================================================
//
// The platform reports raw reachability through report(). A report that
// differs from the settled mode becomes the candidate and opens a debounce
// window; repeating the candidate leaves the window running, and a report
// of the settled mode cancels it. tick() settles a candidate whose window
// has elapsed. Subscribers are told only about settled changes, so
// offline->online->offline inside one window produces no event at all.
//
// Time is passed in explicitly. The host calls tick() from its timer,
// armed for deadline().

class connectivity_monitor {
public:
    using handler_t = std::function<void(const connectivity_event&)>;
    using subscription_id = uint64_t;

    connectivity_monitor(connectivity_mode initial,
                         std::chrono::milliseconds debounce,
                         shared_scheduler sched);

    connectivity_mode current_mode() const;
    bool is_online() const { return current_mode() == connectivity_mode::online; }

    subscription_id subscribe(handler_t handler);
    void unsubscribe(subscription_id id);
    size_t subscriber_count() const;

    /// Raw reachability signal. Opens a window only when the candidate changes.
    void report(connectivity_mode mode, monotonic_t at);

    /// Settle the candidate if its window has elapsed. Returns true if a
    /// transition was emitted.
    bool tick(monotonic_t at);

    /// When the pending candidate settles, if one is pending.
    std::optional<monotonic_t> deadline() const;

    std::chrono::milliseconds debounce() const { return debounce_; }

private:
    mutable std::mutex mutex_;
    connectivity_mode current_;
    std::optional<connectivity_mode> candidate_;
    monotonic_t candidate_at_{};
    std::chrono::milliseconds debounce_;
    shared_scheduler scheduler_;
    std::map<subscription_id, handler_t> handlers_;
    subscription_id next_id_ = 1;
};

} // namespace fieldsync

#endif // __cplusplus
