#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace connectivity_tests {

using namespace test_support;
using std::chrono::milliseconds;

// ============================================================================
// test_settles_after_debounce - one event, only after the window
// ============================================================================

void test_settles_after_debounce() {
    std::cout << "  test_settles_after_debounce..." << std::flush;

    connectivity_monitor monitor(connectivity_mode::offline, milliseconds(2000),
                                 std::make_shared<immediate_scheduler>());
    std::vector<connectivity_event> events;
    monitor.subscribe([&](const connectivity_event& e) { events.push_back(e); });

    monitor.report(connectivity_mode::online, t0());
    assert(monitor.deadline() && *monitor.deadline() == t0() + milliseconds(2000));

    assert(!monitor.tick(t0() + milliseconds(1999)));
    assert(events.empty());
    assert(monitor.current_mode() == connectivity_mode::offline);

    assert(monitor.tick(t0() + milliseconds(2000)));
    assert(events.size() == 1);
    assert(events[0].previous == connectivity_mode::offline);
    assert(events[0].current == connectivity_mode::online);
    assert(monitor.is_online());
    assert(!monitor.deadline());

    // Nothing pending: further ticks are silent
    assert(!monitor.tick(t0() + milliseconds(9000)));
    assert(events.size() == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_flapping_is_coalesced - offline->online->offline inside one window
// ============================================================================

void test_flapping_is_coalesced() {
    std::cout << "  test_flapping_is_coalesced..." << std::flush;

    connectivity_monitor monitor(connectivity_mode::offline, milliseconds(2000),
                                 std::make_shared<immediate_scheduler>());
    int events = 0;
    monitor.subscribe([&](const connectivity_event&) { events++; });

    monitor.report(connectivity_mode::online, t0());
    monitor.report(connectivity_mode::offline, t0() + milliseconds(400));
    monitor.report(connectivity_mode::online, t0() + milliseconds(800));
    monitor.report(connectivity_mode::offline, t0() + milliseconds(1200));

    // Each return to offline cancelled the pending change
    assert(!monitor.deadline());
    assert(!monitor.tick(t0() + milliseconds(2500)));
    assert(!monitor.tick(t0() + milliseconds(3200)));

    assert(events == 0);
    assert(monitor.current_mode() == connectivity_mode::offline);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_repeated_reports_emit_once
// ============================================================================

void test_repeated_reports_emit_once() {
    std::cout << "  test_repeated_reports_emit_once..." << std::flush;

    connectivity_monitor monitor(connectivity_mode::online, milliseconds(1000),
                                 std::make_shared<immediate_scheduler>());
    int events = 0;
    monitor.subscribe([&](const connectivity_event&) { events++; });

    // Same mode as current: never an event
    monitor.report(connectivity_mode::online, t0());
    assert(!monitor.tick(t0() + milliseconds(5000)));

    for (int i = 0; i < 5; ++i) {
        monitor.report(connectivity_mode::offline, t0() + milliseconds(6000 + i * 100));
    }
    assert(monitor.tick(t0() + milliseconds(8000)));
    monitor.report(connectivity_mode::offline, t0() + milliseconds(8100));
    assert(!monitor.tick(t0() + milliseconds(10000)));
    assert(events == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_steady_reports_settle - re-reports of the candidate keep its window
// ============================================================================

void test_steady_reports_settle() {
    std::cout << "  test_steady_reports_settle..." << std::flush;

    connectivity_monitor monitor(connectivity_mode::offline, milliseconds(2000),
                                 std::make_shared<immediate_scheduler>());
    int events = 0;
    monitor.subscribe([&](const connectivity_event&) { events++; });

    // The platform re-reports online every second, faster than the window
    bool settled_at_2s = false;
    for (int i = 0; i <= 10; ++i) {
        auto at = t0() + milliseconds(i * 1000);
        monitor.report(connectivity_mode::online, at);
        assert(monitor.deadline() && *monitor.deadline() == t0() + milliseconds(2000));
        if (monitor.tick(at)) {
            settled_at_2s = (i == 2);
        }
        if (monitor.is_online()) break;
    }
    assert(settled_at_2s);
    assert(events == 1);
    assert(monitor.is_online());
    assert(!monitor.deadline());

    // Further online reports match the settled mode
    monitor.report(connectivity_mode::online, t0() + milliseconds(3000));
    assert(!monitor.deadline());
    assert(!monitor.tick(t0() + milliseconds(6000)));
    assert(events == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_unsubscribe
// ============================================================================

void test_unsubscribe() {
    std::cout << "  test_unsubscribe..." << std::flush;

    connectivity_monitor monitor(connectivity_mode::offline, milliseconds(100), nullptr);
    int a = 0, b = 0;
    auto id_a = monitor.subscribe([&](const connectivity_event&) { a++; });
    monitor.subscribe([&](const connectivity_event&) { b++; });
    assert(monitor.subscriber_count() == 2);

    monitor.unsubscribe(id_a);
    monitor.report(connectivity_mode::online, t0());
    monitor.tick(t0() + milliseconds(100));

    assert(a == 0);
    assert(b == 1);

    std::cout << " OK" << std::endl;
}

// ============================================================================
// test_events_run_on_scheduler
// ============================================================================

void test_events_run_on_scheduler() {
    std::cout << "  test_events_run_on_scheduler..." << std::flush;

    auto sched = std::make_shared<main_thread_scheduler>();
    connectivity_monitor monitor(connectivity_mode::offline, milliseconds(100), sched);
    int events = 0;
    monitor.subscribe([&](const connectivity_event&) { events++; });

    monitor.report(connectivity_mode::online, t0());
    assert(monitor.tick(t0() + milliseconds(150)));

    // Mode is already settled; delivery waits for the run loop
    assert(monitor.is_online());
    assert(events == 0);
    assert(sched->pending_count() == 1);

    assert(sched->process_pending() == 1);
    assert(events == 1);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing connectivity monitor..." << std::endl;
    test_settles_after_debounce();
    test_flapping_is_coalesced();
    test_repeated_reports_emit_once();
    test_steady_reports_settle();
    test_unsubscribe();
    test_events_run_on_scheduler();
}

} // namespace connectivity_tests
