#include "strata/db.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <cstring>
#include <sstream>
#include <thread>

namespace strata {

namespace {

// Parses the whole of [text, text+len) as a plain decimal number.
// Hex, inf/nan and surrounding whitespace are not numbers here.
bool parse_number(const char* text, int len, double& out) {
    if (len <= 0 || len > 64) return false;
    char buf[65];
    for (int i = 0; i < len; ++i) {
        char c = text[i];
        if (!(std::isdigit(static_cast<unsigned char>(c)) ||
              c == '+' || c == '-' || c == '.' || c == 'e' || c == 'E')) {
            return false;
        }
        buf[i] = c;
    }
    buf[len] = '\0';
    char* end = nullptr;
    out = std::strtod(buf, &end);
    return end == buf + len && std::isfinite(out);
}

int natural_compare(void*, int len_a, const void* a, int len_b, const void* b) {
    const char* sa = static_cast<const char*>(a);
    const char* sb = static_cast<const char*>(b);
    double na = 0.0;
    double nb = 0.0;
    bool a_num = parse_number(sa, len_a, na);
    bool b_num = parse_number(sb, len_b, nb);

    if (a_num && b_num) {
        if (na < nb) return -1;
        if (na > nb) return 1;
    } else if (a_num != b_num) {
        return a_num ? -1 : 1;
    }

    int n = std::min(len_a, len_b);
    int rc = n > 0 ? std::memcmp(sa, sb, static_cast<size_t>(n)) : 0;
    if (rc != 0) return rc;
    return len_a - len_b;
}

} // namespace

std::string quote_identifier(const std::string& name) {
    std::string quoted;
    quoted.reserve(name.size() + 2);
    quoted += '"';
    for (char c : name) {
        if (c == '"') quoted += '"';
        quoted += c;
    }
    quoted += '"';
    return quoted;
}

database::database(const std::string& path, open_mode mode, int busy_timeout_ms)
    : path_(path), mode_(mode) {
    int flags = SQLITE_OPEN_FULLMUTEX;  // Always use serialized threading mode
    if (mode == open_mode::read_only) {
        flags |= SQLITE_OPEN_READONLY;
    } else {
        flags |= SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE;
    }

    int rc = sqlite3_open_v2(path.c_str(), &db_, flags, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = db_ ? sqlite3_errmsg(db_) : "out of memory";
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to open database %s: %s", path.c_str(), error.c_str());
        throw db_error("Failed to open database: " + error);
    }

    // Set busy timeout to handle lock contention with other connections
    sqlite3_busy_timeout(db_, busy_timeout_ms);

    // WAL lets the read-only connection see committed data while a write is in flight
    if (mode == open_mode::read_write && !is_in_memory()) {
        execute("PRAGMA journal_mode = WAL");
    }
    execute("PRAGMA temp_store = MEMORY");

    rc = sqlite3_create_collation_v2(db_, natural_collation, SQLITE_UTF8,
                                     nullptr, natural_compare, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        sqlite3_close(db_);
        db_ = nullptr;
        LOG_ERROR("db", "Failed to register collation: %s", error.c_str());
        throw db_error("Failed to register collation: " + error);
    }
}

database::~database() {
    if (db_) {
        sqlite3_close_v2(db_);
    }
}

database::database(database&& other) noexcept
    : db_(other.db_), path_(std::move(other.path_)), mode_(other.mode_) {
    other.db_ = nullptr;
}

database& database::operator=(database&& other) noexcept {
    if (this != &other) {
        if (db_) {
            sqlite3_close_v2(db_);
        }
        db_ = other.db_;
        path_ = std::move(other.path_);
        mode_ = other.mode_;
        other.db_ = nullptr;
    }
    return *this;
}

sqlite3_stmt* database::prepare(const std::string& sql) const {
    sqlite3_stmt* stmt = nullptr;
    int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr);
    if (rc != SQLITE_OK) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Failed to prepare statement: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Failed to prepare statement: " + error + " (SQL: " + sql + ")");
    }
    return stmt;
}

size_t database::execute(const std::string& sql, const std::vector<column_value_t>& params) {
    if (params.empty()) {
        // Fast path for parameterless statements (DDL, PRAGMA, BEGIN/COMMIT)
        char* errmsg = nullptr;
        int rc = sqlite3_exec(db_, sql.c_str(), nullptr, nullptr, &errmsg);
        if (rc != SQLITE_OK) {
            std::string error = errmsg ? errmsg : "Unknown error";
            sqlite3_free(errmsg);
            LOG_ERROR("db", "SQL execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
            throw db_error("SQL execution failed: " + error + " (SQL: " + sql + ")");
        }
        return static_cast<size_t>(sqlite3_changes(db_));
    }

    sqlite3_stmt* stmt = prepare(sql);
    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    int rc = sqlite3_step(stmt);
    int changes = sqlite3_changes(db_);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE && rc != SQLITE_ROW) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "Execution failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Execution failed: " + error);
    }
    return static_cast<size_t>(changes);
}

bool database::table_exists(const std::string& name) const {
    sqlite3_stmt* stmt = prepare("SELECT name FROM sqlite_master WHERE type='table' AND name=?");
    sqlite3_bind_text(stmt, 1, name.c_str(), -1, SQLITE_TRANSIENT);
    int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        std::string error = sqlite3_errmsg(db_);
        LOG_ERROR("db", "table_exists(%s) failed: %s", name.c_str(), error.c_str());
        throw db_error("table_exists failed: " + error);
    }
    return rc == SQLITE_ROW;
}

std::unordered_map<std::string, std::string> database::get_table_info(const std::string& table) const {
    std::unordered_map<std::string, std::string> columns;

    // PRAGMA table_info returns: cid, name, type, notnull, dflt_value, pk
    for (const auto& row : query("PRAGMA table_info(" + quote_identifier(table) + ")")) {
        auto name = row.find("name");
        auto type = row.find("type");
        if (name == row.end() || !std::holds_alternative<std::string>(name->second)) {
            continue;
        }
        std::string type_str;
        if (type != row.end() && std::holds_alternative<std::string>(type->second)) {
            type_str = std::get<std::string>(type->second);
        }
        // Normalize type to uppercase for comparison
        for (char& c : type_str) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        columns[std::get<std::string>(name->second)] = type_str;
    }
    return columns;
}

std::vector<std::string> database::get_primary_key(const std::string& table) const {
    std::vector<std::pair<int64_t, std::string>> keyed;
    for (const auto& row : query("PRAGMA table_info(" + quote_identifier(table) + ")")) {
        auto pk = row.find("pk");
        auto name = row.find("name");
        if (pk == row.end() || name == row.end()) continue;
        if (!std::holds_alternative<int64_t>(pk->second)) continue;
        int64_t position = std::get<int64_t>(pk->second);
        if (position > 0) {
            keyed.emplace_back(position, std::get<std::string>(name->second));
        }
    }
    std::sort(keyed.begin(), keyed.end());

    std::vector<std::string> key;
    key.reserve(keyed.size());
    for (auto& [_, name] : keyed) {
        key.push_back(std::move(name));
    }
    return key;
}

std::vector<std::string> database::get_indexes(const std::string& table) const {
    std::vector<std::string> indexes;
    // PRAGMA index_list returns: seq, name, unique, origin, partial
    // origin 'c' = CREATE INDEX, 'pk'/'u' = implied by constraints
    for (const auto& row : query("PRAGMA index_list(" + quote_identifier(table) + ")")) {
        auto origin = row.find("origin");
        auto name = row.find("name");
        if (origin == row.end() || name == row.end()) continue;
        if (std::holds_alternative<std::string>(origin->second) &&
            std::get<std::string>(origin->second) == "c") {
            indexes.push_back(std::get<std::string>(name->second));
        }
    }
    std::sort(indexes.begin(), indexes.end());
    return indexes;
}

void database::bind_value(sqlite3_stmt* stmt, int index, const column_value_t& value) {
    std::visit([&](auto&& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            sqlite3_bind_null(stmt, index);
        } else if constexpr (std::is_same_v<T, int64_t>) {
            sqlite3_bind_int64(stmt, index, v);
        } else if constexpr (std::is_same_v<T, double>) {
            sqlite3_bind_double(stmt, index, v);
        } else if constexpr (std::is_same_v<T, std::string>) {
            sqlite3_bind_text(stmt, index, v.c_str(), static_cast<int>(v.size()), SQLITE_TRANSIENT);
        }
    }, value);
}

column_value_t database::extract_column(sqlite3_stmt* stmt, int index) {
    int type = sqlite3_column_type(stmt, index);
    switch (type) {
        case SQLITE_INTEGER:
            return static_cast<int64_t>(sqlite3_column_int64(stmt, index));
        case SQLITE_FLOAT:
            return sqlite3_column_double(stmt, index);
        case SQLITE_TEXT:
        case SQLITE_BLOB: {
            const char* text = reinterpret_cast<const char*>(sqlite3_column_text(stmt, index));
            int size = sqlite3_column_bytes(stmt, index);
            return std::string(text ? text : "", text ? static_cast<size_t>(size) : 0);
        }
        case SQLITE_NULL:
        default:
            return nullptr;
    }
}

namespace {

void append_where(std::ostringstream& sql, const database::assignment_t& where) {
    if (where.empty()) return;
    sql << " WHERE ";
    bool first = true;
    for (const auto& [col, _] : where) {
        if (!first) sql << " AND ";
        sql << quote_identifier(col) << " = ?";
        first = false;
    }
}

} // namespace

primary_key_t database::insert(const std::string& table,
                               const assignment_t& values,
                               const std::vector<std::string>& conflict_columns) {
    if (values.empty()) {
        throw db_error("Insert into " + table + " without values");
    }

    std::ostringstream sql;
    sql << "INSERT INTO " << quote_identifier(table) << " (";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << quote_identifier(col);
        first = false;
    }

    sql << ") VALUES (";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) sql << ", ";
        sql << "?";
    }
    sql << ")";

    // Add ON CONFLICT clause for upsert if conflict_columns provided
    if (!conflict_columns.empty()) {
        sql << " ON CONFLICT (";
        first = true;
        for (const auto& col : conflict_columns) {
            if (!first) sql << ", ";
            sql << quote_identifier(col);
            first = false;
        }
        sql << ") DO UPDATE SET ";
        first = true;
        for (const auto& [col, _] : values) {
            if (std::find(conflict_columns.begin(), conflict_columns.end(), col) != conflict_columns.end()) {
                continue;
            }
            if (!first) sql << ", ";
            sql << quote_identifier(col) << " = excluded." << quote_identifier(col);
            first = false;
        }
        if (first) {
            // Only key columns supplied: a no-op assignment keeps RETURNING working
            sql << quote_identifier(conflict_columns.front()) << " = excluded."
                << quote_identifier(conflict_columns.front());
        }
    }
    sql << " RETURNING rowid";

    std::vector<column_value_t> params;
    params.reserve(values.size());
    for (const auto& [_, val] : values) {
        params.push_back(val);
    }

    auto rows = query(sql.str(), params);
    if (rows.empty() || !std::holds_alternative<int64_t>(rows[0]["rowid"])) {
        LOG_ERROR("db", "Insert into %s returned no rowid", table.c_str());
        throw db_error("Insert into " + table + " returned no rowid");
    }
    return std::get<int64_t>(rows[0]["rowid"]);
}

size_t database::update(const std::string& table,
                        const assignment_t& values,
                        const assignment_t& where) {
    if (values.empty()) return 0;

    std::ostringstream sql;
    sql << "UPDATE " << quote_identifier(table) << " SET ";

    bool first = true;
    for (const auto& [col, _] : values) {
        if (!first) sql << ", ";
        sql << quote_identifier(col) << " = ?";
        first = false;
    }
    append_where(sql, where);

    std::vector<column_value_t> params;
    params.reserve(values.size() + where.size());
    for (const auto& [_, val] : values) params.push_back(val);
    for (const auto& [_, val] : where) params.push_back(val);

    return execute(sql.str(), params);
}

size_t database::remove(const std::string& table, const assignment_t& where) {
    std::ostringstream sql;
    sql << "DELETE FROM " << quote_identifier(table);
    append_where(sql, where);

    std::vector<column_value_t> params;
    params.reserve(where.size());
    for (const auto& [_, val] : where) params.push_back(val);

    if (params.empty()) {
        return execute(sql.str());
    }
    return execute(sql.str(), params);
}

std::vector<database::row_t> database::query(const std::string& sql,
                                             const std::vector<column_value_t>& params) const {
    sqlite3_stmt* stmt = prepare(sql);

    int index = 1;
    for (const auto& param : params) {
        bind_value(stmt, index++, param);
    }

    std::vector<row_t> results;
    int col_count = sqlite3_column_count(stmt);

    int rc;
    while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
        row_t row;
        for (int i = 0; i < col_count; ++i) {
            const char* name = sqlite3_column_name(stmt, i);
            row[name] = extract_column(stmt, i);
        }
        results.push_back(std::move(row));
    }

    sqlite3_finalize(stmt);

    if (rc != SQLITE_DONE) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Query failed: %s (SQL: %s)", error.c_str(), sql.c_str());
        throw db_error("Query failed: " + error);
    }

    return results;
}

void database::begin_transaction() {
    // IMMEDIATE: acquires write lock, readers still allowed (WAL mode).
    const char* sql = "BEGIN IMMEDIATE";
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);

    // Retry with exponential backoff for transient errors:
    // - SQLITE_BUSY/SQLITE_LOCKED: another connection holds the write lock
    // - SQLITE_ERROR + already in transaction: another thread on this same serialized
    //   connection started a transaction that will finish shortly
    int backoff_ms = 1;
    const int max_backoff_ms = 1000;
    const int max_total_wait_ms = 30000;
    int total_waited_ms = 0;

    while (rc != SQLITE_OK && total_waited_ms < max_total_wait_ms) {
        bool should_retry = false;
        if (rc == SQLITE_BUSY || rc == SQLITE_LOCKED) {
            should_retry = true;
        } else if (rc == SQLITE_ERROR && is_in_transaction()) {
            should_retry = true;
        }
        if (!should_retry) break;

        LOG_DEBUG("db", "BEGIN contended (rc=%d), retrying in %d ms", rc, backoff_ms);
        std::this_thread::sleep_for(std::chrono::milliseconds(backoff_ms));
        total_waited_ms += backoff_ms;
        backoff_ms = std::min(backoff_ms * 2, max_backoff_ms);
        rc = sqlite3_exec(db_, sql, nullptr, nullptr, nullptr);
    }

    if (rc != SQLITE_OK) {
        auto error = std::string(sqlite3_errmsg(db_));
        LOG_ERROR("db", "Failed to begin transaction: %s", error.c_str());
        throw db_error("Failed to begin transaction: " + error);
    }
}

void database::commit() {
    execute("COMMIT");
}

void database::rollback() {
    execute("ROLLBACK");
}

bool database::is_in_transaction() const {
    // sqlite3_get_autocommit returns 0 if a transaction is active
    return sqlite3_get_autocommit(db_) == 0;
}

// Transaction RAII guard
transaction::transaction(database& db) : db_(db) {
    db_.begin_transaction();
}

transaction::~transaction() {
    if (!completed_ && db_.is_in_transaction()) {
        try {
            db_.rollback();
        } catch (const db_error& e) {
            LOG_ERROR("db", "Rollback failed: %s", e.what());
        }
    }
}

void transaction::commit() {
    db_.commit();
    completed_ = true;
}

void transaction::rollback() {
    db_.rollback();
    completed_ = true;
}

} // namespace strata
