#pragma once

#include "TestSupport.hpp"
#include <cassert>
#include <cstdio>
#include <fstream>
#include <iostream>

namespace config_tests {

using namespace test_support;

void test_defaults_and_overlay() {
    std::cout << "  test_defaults_and_overlay..." << std::flush;

    fieldsync_config defaults;
    assert(defaults.debounce == std::chrono::milliseconds(2000));
    assert(defaults.sync.attempt_cap == 5);
    assert(defaults.sync.max_conflict_rounds == 3);
    assert(defaults.session_ttl == std::chrono::hours(24 * 7));
    assert(defaults.level == log_level::warn);

    auto config = config_from_json(json{
        {"databasePath", ":memory:"},
        {"baseUrl", "https://cadastro.example.org"},
        {"debounceMs", 1500},
        {"attemptCap", 8},
        {"logLevel", "debug"},
        {"unknownKey", true}
    });
    assert(config.database_path == ":memory:");
    assert(config.base_url == "https://cadastro.example.org");
    assert(config.debounce == std::chrono::milliseconds(1500));
    assert(config.sync.attempt_cap == 8);
    assert(config.sync.max_conflict_rounds == 3);
    assert(config.level == log_level::debug);

    std::cout << " OK" << std::endl;
}

void test_invalid_values_throw() {
    std::cout << "  test_invalid_values_throw..." << std::flush;

    auto rejects = [](const json& j) {
        try {
            config_from_json(j);
        } catch (const config_error&) {
            return true;
        }
        return false;
    };

    assert(rejects(json::array()));
    assert(rejects(json{{"debounceMs", "2000"}}));
    assert(rejects(json{{"debounceMs", -1}}));
    assert(rejects(json{{"attemptCap", 0}}));
    assert(rejects(json{{"databasePath", ""}}));
    assert(rejects(json{{"logLevel", "verbose"}}));

    std::cout << " OK" << std::endl;
}

void test_load_config_file() {
    std::cout << "  test_load_config_file..." << std::flush;

    const std::string path = "fieldsync_config_test.json";
    std::remove(path.c_str());

    // Missing file: defaults
    auto config = load_config(path);
    assert(config.database_path == "fieldsync.sqlite");

    {
        std::ofstream out(path);
        out << R"({"sessionTtlHours": 48, "maxConflictRounds": 2})";
    }
    config = load_config(path);
    assert(config.session_ttl == std::chrono::hours(48));
    assert(config.sync.max_conflict_rounds == 2);

    {
        std::ofstream out(path);
        out << "{ not json";
    }
    bool threw = false;
    try {
        load_config(path);
    } catch (const config_error&) {
        threw = true;
    }
    assert(threw);

    std::remove(path.c_str());
    std::cout << " OK" << std::endl;
}

void run_all() {
    std::cout << "Testing configuration..." << std::endl;
    test_defaults_and_overlay();
    test_invalid_values_throw();
    test_load_config_file();
}

} // namespace config_tests
