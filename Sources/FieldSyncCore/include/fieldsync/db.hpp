#pragma once

#ifdef __cplusplus

#include "types.hpp"
#include <sqlite3.h>
#include <stdexcept>
#include <unordered_map>
#include <utility>

namespace fieldsync {

class db_error : public std::runtime_error {
public:
    explicit db_error(const std::string& msg) : std::runtime_error(msg) {}
};

// ============================================================================
// database - one SQLite connection keyed by globalId
// ============================================================================
//
// Tables are created from a table_schema and always carry an autoincrement
// "id" (insertion sequence) plus a unique "globalId". Row writes address
// rows by globalId. Every failure raises db_error with SQLite's message.

class database {
public:
    using values_t = std::vector<std::pair<std::string, column_value_t>>;
    using row_t = std::unordered_map<std::string, column_value_t>;

    /// Open a database file (":memory:" for an in-memory database).
    explicit database(const std::string& path);
    ~database();

    database(const database&) = delete;
    database& operator=(const database&) = delete;

    /// Create the table and its indexes unless they already exist.
    void ensure_table(const table_schema& schema);

    /// Insert a new row. A duplicate globalId is an error.
    void insert(const std::string& table, const values_t& values);

    /// Insert, or overwrite the row that already has this globalId.
    void upsert(const std::string& table, const values_t& values);

    /// Returns the number of rows changed (0 or 1).
    int update(const std::string& table, const global_id_t& global_id, const values_t& values);
    int remove(const std::string& table, const global_id_t& global_id);

    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {});

    /// Run a statement that returns no rows. Returns the number of rows changed.
    int execute(const std::string& sql,
                const std::vector<column_value_t>& params = {});

    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

private:
    sqlite3* db_ = nullptr;

    void write_row(const std::string& table, const values_t& values, bool overwrite);
};

// RAII transaction guard: rolls back unless commit() was reached
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    void commit();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace fieldsync

#endif // __cplusplus
