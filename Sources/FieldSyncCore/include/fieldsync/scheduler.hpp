#pragma once

#ifdef __cplusplus

#include <functional>
#include <memory>
#include <mutex>
#include <queue>
#include <vector>

namespace fieldsync {

// ============================================================================
// Scheduler interface - where connectivity events and sync callbacks run
// ============================================================================
//
// The connectivity monitor and the coordinator never call subscribers
// directly from the platform's network callback. They hand the work to a
// scheduler so the host decides which thread observes the change:
// - UI hosts: main_thread_scheduler, pumped from the run loop
// - Tests: immediate_scheduler

struct scheduler {
    virtual ~scheduler() = default;

    // Run fn on this scheduler's execution context. Callable from any thread.
    virtual void invoke(std::function<void()>&& fn) = 0;

    // False once the scheduler has been shut down.
    [[nodiscard]] virtual bool can_invoke() const noexcept = 0;
};

using shared_scheduler = std::shared_ptr<scheduler>;

// ============================================================================
// Immediate scheduler - runs callbacks synchronously on the calling thread
// ============================================================================

class immediate_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        if (fn) fn();
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }
};

// ============================================================================
// Main thread scheduler - queued until the host pumps it
// ============================================================================
//
// Work posted from any thread is held until the host's run loop calls
// process_pending().

class main_thread_scheduler : public scheduler {
public:
    void invoke(std::function<void()>&& fn) override {
        std::lock_guard<std::mutex> lock(mutex_);
        queue_.push(std::move(fn));
    }

    // Returns the number of callbacks that ran.
    size_t process_pending() {
        std::vector<std::function<void()>> pending;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            while (!queue_.empty()) {
                pending.push_back(std::move(queue_.front()));
                queue_.pop();
            }
        }
        for (auto& fn : pending) {
            if (fn) fn();
        }
        return pending.size();
    }

    size_t pending_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    [[nodiscard]] bool can_invoke() const noexcept override {
        return true;
    }

private:
    mutable std::mutex mutex_;
    std::queue<std::function<void()>> queue_;
};

} // namespace fieldsync

#endif // __cplusplus
