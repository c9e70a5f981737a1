#include "fieldsync/db.hpp"
#include "fieldsync/log.hpp"
#include <sstream>
#include <type_traits>

namespace fieldsync {

namespace {

const char* sql_type(column_type type) {
    switch (type) {
        case column_type::integer: return "INTEGER";
        case column_type::real: return "REAL";
        case column_type::text: return "TEXT";
    }
    return "TEXT";
}

// Owns one prepared statement for the duration of a call.
class statement {
public:
    statement(sqlite3* db, const std::string& sql) : db_(db) {
        if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr) != SQLITE_OK) {
            std::string message = sqlite3_errmsg(db_);
            LOG_ERROR("db", "%s in %s", message.c_str(), sql.c_str());
            throw db_error(message + " (SQL: " + sql + ")");
        }
    }

    ~statement() { sqlite3_finalize(stmt_); }

    statement(const statement&) = delete;
    statement& operator=(const statement&) = delete;

    void bind(int index, const column_value_t& value) {
        int rc = std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                return sqlite3_bind_null(stmt_, index);
            } else if constexpr (std::is_same_v<T, int64_t>) {
                return sqlite3_bind_int64(stmt_, index, v);
            } else if constexpr (std::is_same_v<T, double>) {
                return sqlite3_bind_double(stmt_, index, v);
            } else {
                return sqlite3_bind_text(stmt_, index, v.c_str(), static_cast<int>(v.size()),
                                         SQLITE_TRANSIENT);
            }
        }, value);
        if (rc != SQLITE_OK) {
            throw db_error("bind failed: " + std::string(sqlite3_errmsg(db_)));
        }
    }

    void bind_all(const std::vector<column_value_t>& params) {
        for (size_t i = 0; i < params.size(); ++i) {
            bind(static_cast<int>(i) + 1, params[i]);
        }
    }

    /// True while a row is available; false once the statement is done.
    bool step() {
        int rc = sqlite3_step(stmt_);
        if (rc == SQLITE_ROW) return true;
        if (rc == SQLITE_DONE) return false;
        throw db_error(sqlite3_errmsg(db_));
    }

    database::row_t row() const {
        database::row_t out;
        const int count = sqlite3_column_count(stmt_);
        for (int i = 0; i < count; ++i) {
            column_value_t value = nullptr;
            switch (sqlite3_column_type(stmt_, i)) {
                case SQLITE_INTEGER:
                    value = static_cast<int64_t>(sqlite3_column_int64(stmt_, i));
                    break;
                case SQLITE_FLOAT:
                    value = sqlite3_column_double(stmt_, i);
                    break;
                case SQLITE_TEXT:
                case SQLITE_BLOB: {
                    auto text = reinterpret_cast<const char*>(sqlite3_column_text(stmt_, i));
                    value = std::string(text ? text : "", sqlite3_column_bytes(stmt_, i));
                    break;
                }
                default:
                    break;
            }
            out.emplace(sqlite3_column_name(stmt_, i), std::move(value));
        }
        return out;
    }

private:
    sqlite3* db_;
    sqlite3_stmt* stmt_ = nullptr;
};

} // namespace

// ============================================================================
// Connection
// ============================================================================

database::database(const std::string& path) {
    const int flags = SQLITE_OPEN_FULLMUTEX | SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    if (sqlite3_open_v2(path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string message = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        throw db_error("Cannot open " + path + ": " + message);
    }

    // WAL keeps every committed write atomic across a crash: readers see
    // either the old row or the new one, never a torn record.
    execute("PRAGMA journal_mode = WAL");
    execute("PRAGMA synchronous = FULL");
    execute("PRAGMA foreign_keys = ON");
    sqlite3_busy_timeout(db_, 5000);

    LOG_DEBUG("db", "Opened %s", path.c_str());
}

database::~database() {
    sqlite3_close(db_);
}

// ============================================================================
// Schema
// ============================================================================

void database::ensure_table(const table_schema& schema) {
    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << schema.name
        << " (id INTEGER PRIMARY KEY AUTOINCREMENT, globalId TEXT UNIQUE NOT NULL";
    for (const auto& col : schema.columns) {
        sql << ", " << col.name << " " << sql_type(col.type);
        if (!col.nullable) sql << " NOT NULL";
    }
    sql << ")";
    execute(sql.str());

    for (const auto& columns : schema.indexes) {
        std::string name = "idx_" + schema.name;
        std::string list;
        for (const auto& col : columns) {
            name += "_" + col;
            list += (list.empty() ? "" : ", ") + col;
        }
        execute("CREATE INDEX IF NOT EXISTS " + name + " ON " + schema.name + " (" + list + ")");
    }
}

// ============================================================================
// Rows
// ============================================================================

void database::write_row(const std::string& table, const values_t& values, bool overwrite) {
    std::string columns;
    std::string placeholders;
    std::string assignments;
    std::vector<column_value_t> params;
    params.reserve(values.size());
    for (const auto& [col, value] : values) {
        if (!columns.empty()) {
            columns += ", ";
            placeholders += ", ";
        }
        columns += col;
        placeholders += "?";
        if (col != "globalId") {
            assignments += (assignments.empty() ? "" : ", ") + col + " = excluded." + col;
        }
        params.push_back(value);
    }

    std::string sql = "INSERT INTO " + table + " (" + columns + ") VALUES (" + placeholders + ")";
    if (overwrite && !assignments.empty()) {
        sql += " ON CONFLICT (globalId) DO UPDATE SET " + assignments;
    }
    execute(sql, params);
}

void database::insert(const std::string& table, const values_t& values) {
    write_row(table, values, false);
}

void database::upsert(const std::string& table, const values_t& values) {
    write_row(table, values, true);
}

int database::update(const std::string& table, const global_id_t& global_id, const values_t& values) {
    if (values.empty()) return 0;

    std::string sql = "UPDATE " + table + " SET ";
    std::vector<column_value_t> params;
    for (const auto& [col, value] : values) {
        if (!params.empty()) sql += ", ";
        sql += col + " = ?";
        params.push_back(value);
    }
    sql += " WHERE globalId = ?";
    params.emplace_back(global_id);
    return execute(sql, params);
}

int database::remove(const std::string& table, const global_id_t& global_id) {
    return execute("DELETE FROM " + table + " WHERE globalId = ?", {global_id});
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);

    std::vector<row_t> rows;
    while (stmt.step()) {
        rows.push_back(stmt.row());
    }
    return rows;
}

int database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    statement stmt(db_, sql);
    stmt.bind_all(params);
    while (stmt.step()) {
        // PRAGMA journal_mode answers with a row; nothing to collect
    }
    return sqlite3_changes(db_);
}

// ============================================================================
// Transactions
// ============================================================================

void database::begin_transaction() {
    // IMMEDIATE takes the write lock up front so commit cannot hit SQLITE_BUSY
    execute("BEGIN IMMEDIATE");
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    return sqlite3_get_autocommit(db_) == 0;
}

transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (completed_ || !db_.is_in_transaction()) return;
    try {
        db_.rollback();
    } catch (const db_error& e) {
        LOG_ERROR("db", "Rollback failed: %s", e.what());
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

} // namespace fieldsync
