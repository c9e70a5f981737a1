#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <iostream>

namespace auth_cache_tests {

using namespace test_support;

void test_session_expiry() {
    std::cout << "  test_session_expiry..." << std::flush;

    local_store store;
    offline_auth_cache auth(store);
    assert(!auth.get_cached_session());
    assert(!auth.can_work_offline());

    auth.save_session(make_session());
    auto cached = auth.get_cached_session();
    assert(cached);
    assert(cached->identity.token == "token-0");
    assert(cached->expires_at - cached->captured_at == std::chrono::hours(24 * 7));

    // Past the TTL the session reads as absent
    assert(!auth.get_cached_session(now() + std::chrono::hours(24 * 8)));
    assert(auth.can_work_offline());

    std::cout << " OK" << std::endl;
}

void test_startup_policy() {
    std::cout << "  test_startup_policy..." << std::flush;

    local_store store;
    offline_auth_cache auth(store);

    assert(auth.start(connectivity_mode::offline) == auth_mode::unauthenticated);
    assert(auth.start(connectivity_mode::online) == auth_mode::unauthenticated);

    auth.save_session(make_session());
    assert(auth.start(connectivity_mode::offline) == auth_mode::offline_authenticated);
    assert(auth.is_offline_mode());
    assert(auth.offline_since());
    assert(!auth.is_verified());

    assert(auth.start(connectivity_mode::online) == auth_mode::online_pending_validation);

    std::cout << " OK" << std::endl;
}

void test_sync_with_server_outcomes() {
    std::cout << "  test_sync_with_server_outcomes..." << std::flush;

    local_store store;
    offline_auth_cache auth(store);
    mock_remote remote;

    assert(auth.sync_with_server(remote) == auth_sync_result::no_session);
    assert(remote.validate_calls == 0);

    auth.save_session(make_session("cached-token"));
    auth.set_offline_mode(true);

    remote.validation_unreachable = true;
    assert(auth.sync_with_server(remote) == auth_sync_result::unreachable);
    assert(auth.get_cached_session());
    assert(auth.is_offline_mode());

    remote.validation_unreachable = false;
    assert(auth.sync_with_server(remote) == auth_sync_result::validated);
    assert(auth.is_verified());
    assert(auth.mode() == auth_mode::online_authenticated);
    assert(!auth.is_offline_mode());
    assert(remote.token == "cached-token");

    remote.validation_refused = true;
    assert(auth.sync_with_server(remote) == auth_sync_result::auth_expired);
    assert(!auth.get_cached_session());
    assert(auth.requires_reauthentication());
    assert(!auth.is_authorized());

    // Still expired until a login succeeds; no silent retry
    int calls = remote.validate_calls;
    assert(auth.sync_with_server(remote) == auth_sync_result::auth_expired);
    assert(remote.validate_calls == calls);

    std::cout << " OK" << std::endl;
}

void test_login_logout() {
    std::cout << "  test_login_logout..." << std::flush;

    local_store store;
    offline_auth_cache auth(store);
    mock_remote remote;

    auto refused = auth.login(remote, credentials{"agent@example.org", "wrong"});
    assert(std::holds_alternative<auth_expired>(refused));
    assert(!auth.get_cached_session());

    auth.invalidate("expired");
    assert(auth.requires_reauthentication());

    auto accepted = auth.login(remote, credentials{"agent@example.org", "secret"});
    assert(std::holds_alternative<session>(accepted));
    assert(!auth.requires_reauthentication());
    assert(auth.is_authorized());
    assert(auth.current_user()->email == "agent@example.org");
    assert(remote.token == std::get<session>(accepted).token);

    auth.set_offline_mode(true);
    auth.logout();
    assert(!auth.get_cached_session());
    assert(!auth.is_offline_mode());
    assert(auth.mode() == auth_mode::unauthenticated);

    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing offline auth cache..." << std::endl;
    test_session_expiry();
    test_startup_policy();
    test_sync_with_server_outcomes();
    test_login_logout();
}

} // namespace auth_cache_tests
