#pragma once

#include <FieldSyncCore.hpp>
#include <cassert>
#include <chrono>
#include <deque>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <variant>
#include <vector>

namespace test_support {

using namespace fieldsync;
using json = nlohmann::json;

// ============================================================================
// mock_remote - scripted remote authority
// ============================================================================
//
// apply_mutation answers from a per-reference script; an unscripted call is
// accepted (collections at the version the mutation produces).

struct network_failure {
    std::string message = "connection refused";
};

using scripted_outcome = std::variant<apply_result, network_failure>;

class mock_remote : public remote_authority {
public:
    struct call {
        global_id_t reference_id;
        std::string type;
        int64_t expected_version;
        mutation change;
        std::string token;
    };

    std::vector<call> calls;
    std::map<global_id_t, std::deque<scripted_outcome>> script;

    // Runs before each apply_mutation answer (used to flip connectivity mid-drain)
    std::function<void(const call&)> before_apply;

    // validate_session behaviour
    bool validation_unreachable = false;
    bool validation_refused = false;
    int validate_calls = 0;

    // authenticate accepts this password only
    std::string password = "secret";
    int authenticate_calls = 0;

    std::string token;

    void fail_next(const global_id_t& id, std::string message = "connection refused") {
        script[id].push_back(network_failure{std::move(message)});
    }

    void answer_next(const global_id_t& id, apply_result result) {
        script[id].push_back(std::move(result));
    }

    validation_result authenticate(const credentials& creds) override {
        authenticate_calls++;
        if (creds.password != password) {
            return auth_expired{"Invalid credentials"};
        }
        session s;
        s.user.id = "user-1";
        s.user.email = creds.email;
        s.user.first_name = "Ana";
        s.token = "token-" + std::to_string(authenticate_calls);
        validation_refused = false;
        return s;
    }

    validation_result validate_session(const std::string& t) override {
        validate_calls++;
        if (validation_unreachable) {
            throw network_error("validate_session: server unreachable");
        }
        if (validation_refused) {
            return auth_expired{"Unauthorized"};
        }
        session s;
        s.user.id = "user-1";
        s.user.email = "agent@example.org";
        s.token = t;
        return s;
    }

    apply_result apply_mutation(const global_id_t& reference_id,
                                const mutation& change,
                                int64_t expected_version) override {
        calls.push_back({reference_id, mutation_type(change), expected_version, change, token});
        if (before_apply) before_apply(calls.back());

        auto it = script.find(reference_id);
        if (it != script.end() && !it->second.empty()) {
            auto outcome = std::move(it->second.front());
            it->second.pop_front();
            if (auto* failure = std::get_if<network_failure>(&outcome)) {
                throw network_error(failure->message);
            }
            return std::get<apply_result>(outcome);
        }

        mutation_accepted accepted;
        if (target_kind(change) == entity_kind::property_collection) {
            accepted.version = local_version(change);
        }
        return accepted;
    }

    void set_token(const std::string& t) override { token = t; }

    size_t calls_for(const global_id_t& id) const {
        size_t n = 0;
        for (const auto& c : calls) {
            if (c.reference_id == id) n++;
        }
        return n;
    }
};

// ============================================================================
// mock_http_client - canned responses, recorded requests
// ============================================================================

class mock_http_client : public http_client {
public:
    std::vector<http_request> requests;
    std::deque<http_response> responses;

    void respond(int status, const json& body = json::object()) {
        http_response r;
        r.status_code = status;
        auto text = body.dump();
        r.body = std::vector<uint8_t>(text.begin(), text.end());
        responses.push_back(std::move(r));
    }

    http_response send(const http_request& request) override {
        requests.push_back(request);
        if (responses.empty()) {
            return http_response{0, {}, {}};
        }
        auto r = std::move(responses.front());
        responses.pop_front();
        return r;
    }
};

// ============================================================================
// Fixtures
// ============================================================================

inline mission make_mission(const std::string& title = "Rua das Flores 12") {
    mission m;
    m.id = make_global_id();
    m.title = title;
    m.address = title;
    m.assigned_to = "user-1";
    m.property_code = "PC-001";
    return m;
}

inline property_collection make_collection(const global_id_t& mission_id,
                                           json fields = json{{"owner", "Silva"}, {"floors", 2}}) {
    property_collection c;
    c.id = make_global_id();
    c.mission_id = mission_id;
    c.fields = std::move(fields);
    c.collected_by = "user-1";
    return c;
}

inline photo make_photo(const property_collection& c) {
    photo p;
    p.id = make_global_id();
    p.collection_id = c.id;
    p.mission_id = c.mission_id;
    p.kind = "facade";
    p.filename = "facade.jpg";
    p.local_path = "/data/photos/facade.jpg";
    p.width = 1920;
    p.height = 1080;
    p.file_size = 245760;
    return p;
}

/// A collection already known to the remote at the given version.
inline property_collection synced_collection(local_store& store, int64_t version) {
    auto m = make_mission();
    m.sync_state = sync_status::synced;
    store.put(m);
    auto c = make_collection(m.id);
    c.version = version;
    c.sync_state = sync_status::synced;
    store.put(c);
    return c;
}

inline session make_session(const std::string& token = "token-0") {
    session s;
    s.user.id = "user-1";
    s.user.email = "agent@example.org";
    s.user.first_name = "Ana";
    s.user.last_name = "Souza";
    s.token = token;
    return s;
}

// ============================================================================
// scratch_db - a throwaway database file plus a second raw connection
// ============================================================================
//
// The second connection stands in for another process touching the same
// file. Declare it before the store so the store closes first.

class scratch_db {
public:
    scratch_db()
        : path_(std::filesystem::temp_directory_path() /
                ("fieldsync_scratch_" + make_global_id() + ".sqlite")) {}

    ~scratch_db() {
        if (side_) sqlite3_close(side_);
        std::filesystem::remove(path_);
        std::filesystem::remove(path_.string() + "-wal");
        std::filesystem::remove(path_.string() + "-shm");
    }

    scratch_db(const scratch_db&) = delete;
    scratch_db& operator=(const scratch_db&) = delete;

    std::string path() const { return path_.string(); }

    void side_execute(const std::string& sql) {
        if (!side_) {
            int rc = sqlite3_open(path_.string().c_str(), &side_);
            assert(rc == SQLITE_OK);
            sqlite3_busy_timeout(side_, 5000);
        }
        int rc = sqlite3_exec(side_, sql.c_str(), nullptr, nullptr, nullptr);
        assert(rc == SQLITE_OK);
        (void)rc;
    }

private:
    std::filesystem::path path_;
    sqlite3* side_ = nullptr;
};

inline drain_context online_context() {
    drain_context ctx;
    ctx.mode = [] { return connectivity_mode::online; };
    ctx.authorized = [] { return true; };
    return ctx;
}

inline monotonic_t t0() {
    return monotonic_t{} + std::chrono::hours(1);
}

} // namespace test_support
