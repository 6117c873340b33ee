#pragma once

#ifdef __cplusplus

#include "errors.hpp"
#include "types.hpp"
#include <sqlite3.h>
#include <string>
#include <unordered_map>
#include <vector>

namespace strata {

/// Collation registered on every connection. Values that both parse as
/// numbers compare numerically, numbers sort before text, text compares
/// bytewise.
inline constexpr const char* natural_collation = "STRATA_NATURAL";

/// Quote an identifier for interpolation into SQL text.
std::string quote_identifier(const std::string& name);

class database {
public:
    /// Open mode for database connections
    enum class open_mode {
        read_write,  ///< Full read/write access (default)
        read_only    ///< Read-only access (for concurrent readers)
    };

    explicit database(const std::string& path,
                      open_mode mode = open_mode::read_write,
                      int busy_timeout_ms = 5000);
    ~database();

    // Non-copyable
    database(const database&) = delete;
    database& operator=(const database&) = delete;

    // Moveable
    database(database&& other) noexcept;
    database& operator=(database&& other) noexcept;

    // Schema introspection
    bool table_exists(const std::string& name) const;

    // Get existing column names and types from a table
    // Returns map of column_name -> SQL_TYPE (uppercase)
    std::unordered_map<std::string, std::string> get_table_info(const std::string& table) const;

    // Declared primary key columns, in key order (empty if none)
    std::vector<std::string> get_primary_key(const std::string& table) const;

    // Names of the explicitly created indexes on a table
    std::vector<std::string> get_indexes(const std::string& table) const;

    // CRUD operations
    using assignment_t = std::vector<std::pair<std::string, column_value_t>>;

    // conflict_columns: if non-empty, generates ON CONFLICT (...) DO UPDATE SET
    // for every other supplied column. Returns the rowid written.
    primary_key_t insert(const std::string& table,
                         const assignment_t& values,
                         const std::vector<std::string>& conflict_columns = {});

    // UPDATE table SET values WHERE c1 = ? AND c2 = ? ... Returns rows changed.
    size_t update(const std::string& table,
                  const assignment_t& values,
                  const assignment_t& where);

    // DELETE FROM table WHERE c1 = ? AND ... Returns rows removed.
    size_t remove(const std::string& table, const assignment_t& where);

    // Query - returns rows as vector of column maps
    using row_t = std::unordered_map<std::string, column_value_t>;
    std::vector<row_t> query(const std::string& sql,
                             const std::vector<column_value_t>& params = {}) const;

    // Execute SQL with optional params. Returns the number of rows changed.
    size_t execute(const std::string& sql,
                   const std::vector<column_value_t>& params = {});

    // Transaction support
    void begin_transaction();
    void commit();
    void rollback();
    bool is_in_transaction() const;

    const std::string& path() const { return path_; }
    bool is_in_memory() const { return path_.empty() || path_ == ":memory:"; }

    // Raw access (use sparingly)
    sqlite3* handle() const { return db_; }

private:
    sqlite3* db_ = nullptr;
    std::string path_;
    open_mode mode_;

    sqlite3_stmt* prepare(const std::string& sql) const;
    static void bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value);
    static column_value_t extract_column(sqlite3_stmt* stmt, int index);
};

// RAII transaction guard
class transaction {
public:
    explicit transaction(database& db);
    ~transaction();

    transaction(const transaction&) = delete;
    transaction& operator=(const transaction&) = delete;

    void commit();
    void rollback();

private:
    database& db_;
    bool completed_ = false;
};

} // namespace strata

#endif // __cplusplus
