#include "fieldsync/config.hpp"
#include <fstream>

namespace fieldsync {

// Global log level, shared by every LOG_* call site
std::atomic<log_level> g_log_level{log_level::warn};

using json = nlohmann::json;

log_level log_level_from_string(const std::string& s) {
    if (s == "off") return log_level::off;
    if (s == "error") return log_level::error;
    if (s == "warn") return log_level::warn;
    if (s == "info") return log_level::info;
    if (s == "debug") return log_level::debug;
    throw config_error("Unknown log level: " + s);
}

namespace {

int64_t require_int(const json& j, const char* key, int64_t min, int64_t max) {
    const auto& v = j[key];
    if (!v.is_number_integer()) {
        throw config_error(std::string(key) + " must be an integer");
    }
    auto n = v.get<int64_t>();
    if (n < min || n > max) {
        throw config_error(std::string(key) + " out of range: " + std::to_string(n));
    }
    return n;
}

std::string require_string(const json& j, const char* key) {
    const auto& v = j[key];
    if (!v.is_string()) {
        throw config_error(std::string(key) + " must be a string");
    }
    return v.get<std::string>();
}

} // namespace

fieldsync_config config_from_json(const json& j, fieldsync_config config) {
    if (!j.is_object()) {
        throw config_error("Configuration must be a JSON object");
    }

    if (j.contains("databasePath")) {
        config.database_path = require_string(j, "databasePath");
        if (config.database_path.empty()) throw config_error("databasePath must not be empty");
    }
    if (j.contains("baseUrl")) {
        config.base_url = require_string(j, "baseUrl");
    }
    if (j.contains("debounceMs")) {
        config.debounce = std::chrono::milliseconds(require_int(j, "debounceMs", 0, 60000));
    }
    if (j.contains("attemptCap")) {
        config.sync.attempt_cap = require_int(j, "attemptCap", 1, 1000);
    }
    if (j.contains("maxConflictRounds")) {
        config.sync.max_conflict_rounds = static_cast<int>(require_int(j, "maxConflictRounds", 1, 100));
    }
    if (j.contains("sessionTtlHours")) {
        config.session_ttl = std::chrono::hours(require_int(j, "sessionTtlHours", 1, 24 * 365));
    }
    if (j.contains("logLevel")) {
        config.level = log_level_from_string(require_string(j, "logLevel"));
    }
    return config;
}

fieldsync_config load_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        return fieldsync_config{};
    }
    json j;
    try {
        in >> j;
    } catch (const json::parse_error& e) {
        throw config_error("Invalid JSON in " + path + ": " + e.what());
    }
    return config_from_json(j);
}

} // namespace fieldsync
