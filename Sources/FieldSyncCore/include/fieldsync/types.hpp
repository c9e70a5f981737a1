#pragma once

#ifdef __cplusplus

#include <cstdint>
#include <string>
#include <optional>
#include <vector>
#include <variant>
#include <chrono>
#include <array>
#include <random>
#include <sstream>
#include <iomanip>

namespace fieldsync {

// Wall-clock timestamp (persisted as seconds since Unix epoch)
using timestamp_t = std::chrono::system_clock::time_point;

// Monotonic time, used for debounce windows only (never persisted)
using monotonic_t = std::chrono::steady_clock::time_point;

inline timestamp_t now() {
    return std::chrono::system_clock::now();
}

inline int64_t to_millis(timestamp_t t) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch()).count();
}

inline timestamp_t from_millis(int64_t millis) {
    return timestamp_t(std::chrono::milliseconds(millis));
}

// Stable entity / queue item identifier: lowercase hyphenated UUID v4
using global_id_t = std::string;

inline global_id_t make_global_id() {
    static thread_local std::mt19937_64 gen{std::random_device{}()};
    std::uniform_int_distribution<uint64_t> dis;

    std::array<uint8_t, 16> bytes{};
    const uint64_t halves[2] = {dis(gen), dis(gen)};
    for (size_t i = 0; i < 16; ++i) {
        bytes[i] = static_cast<uint8_t>(halves[i / 8] >> (56 - (i % 8) * 8));
    }
    bytes[6] = (bytes[6] & 0x0F) | 0x40;
    bytes[8] = (bytes[8] & 0x3F) | 0x80;

    std::ostringstream out;
    out << std::hex << std::setfill('0');
    for (size_t i = 0; i < bytes.size(); ++i) {
        if (i == 4 || i == 6 || i == 8 || i == 10) out << '-';
        out << std::setw(2) << static_cast<unsigned>(bytes[i]);
    }
    return out.str();
}

// Column values as SQLite stores them (NULL, INTEGER, REAL, TEXT)
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

enum class column_type {
    integer,
    real,
    text
};

struct column_def {
    std::string name;
    column_type type;
    bool nullable = false;
};

// Every table gets "id INTEGER PRIMARY KEY AUTOINCREMENT" (insertion sequence)
// and "globalId TEXT UNIQUE NOT NULL" (the stable identifier) ahead of these columns.
struct table_schema {
    std::string name;
    std::vector<column_def> columns;
    std::vector<std::vector<std::string>> indexes;
};

// ============================================================================
// Column value conversion helpers
// ============================================================================

namespace detail {
    inline column_value_t to_column_value(int64_t v) { return v; }
    inline column_value_t to_column_value(int v) { return static_cast<int64_t>(v); }
    inline column_value_t to_column_value(bool v) { return static_cast<int64_t>(v ? 1 : 0); }
    inline column_value_t to_column_value(double v) { return v; }
    inline column_value_t to_column_value(const std::string& v) { return v; }
    inline column_value_t to_column_value(const char* v) { return std::string(v); }
    // Timestamp stored as double (seconds since epoch)
    inline column_value_t to_column_value(timestamp_t v) {
        return static_cast<double>(to_millis(v)) / 1000.0;
    }

    template<typename T>
    column_value_t to_column_value(const std::optional<T>& v) {
        if (!v.has_value()) return nullptr;
        return to_column_value(*v);
    }

    inline timestamp_t timestamp_from_seconds(double seconds) {
        return from_millis(static_cast<int64_t>(seconds * 1000.0 + (seconds >= 0 ? 0.5 : -0.5)));
    }
} // namespace detail

} // namespace fieldsync

#endif // __cplusplus
