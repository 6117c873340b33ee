#include "strata/schema_manager.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <cctype>
#include <sstream>

namespace strata {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool starts_with(const std::string& s, const std::string& prefix) {
    return s.compare(0, prefix.size(), prefix) == 0;
}

bool contains(const std::vector<std::string>& v, const std::string& s) {
    return std::find(v.begin(), v.end(), s) != v.end();
}

} // namespace

schema_manager::schema_manager(database& db) : db_(db) {
    db_.execute(std::string("CREATE TABLE IF NOT EXISTS ") + catalog_table + " ("
                "table_name TEXT PRIMARY KEY, "
                "path TEXT UNIQUE NOT NULL)");
}

std::string schema_manager::table_name_for(const std::string& path) {
    if (path.empty()) {
        throw invalid_argument_error("Collection path is empty");
    }

    std::string table;
    table.reserve(path.size());
    bool segment_empty = true;
    for (char c : path) {
        if (c == '/') {
            if (segment_empty) {
                throw invalid_argument_error("Collection path '" + path + "' has an empty segment");
            }
            table += '_';
            segment_empty = true;
        } else if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
            table += c;
            segment_empty = false;
        } else {
            throw invalid_argument_error("Collection path '" + path + "' contains invalid character '" +
                                         std::string(1, c) + "'");
        }
    }
    if (segment_empty) {
        throw invalid_argument_error("Collection path '" + path + "' has an empty segment");
    }

    // SQLite table names are case-insensitive: "Users" and "users" share a table
    for (char& c : table) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    if (starts_with(table, "_strata_") || starts_with(table, "sqlite_")) {
        throw invalid_argument_error("Collection path '" + path + "' maps to a reserved table name");
    }
    return table;
}

std::optional<std::string> schema_manager::resolve_table(const std::string& path) const {
    return resolve_table(path, db_);
}

std::optional<std::string> schema_manager::resolve_table(const std::string& path, const database& via) const {
    std::string table = table_name_for(path);
    auto rows = via.query(std::string("SELECT path FROM ") + catalog_table + " WHERE table_name = ?",
                          {table});
    if (rows.empty()) {
        return std::nullopt;
    }
    const auto& owner = std::get<std::string>(rows[0].at("path"));
    if (owner != path) {
        throw invalid_argument_error("Collection path '" + path + "' collides with '" + owner +
                                     "' on table " + table);
    }
    return table;
}

std::string schema_manager::claim_table(const std::string& path) {
    if (auto table = resolve_table(path)) {
        return *table;
    }
    std::string table = table_name_for(path);
    size_t changed = db_.execute(std::string("INSERT INTO ") + catalog_table +
                                 " (table_name, path) VALUES (?, ?) ON CONFLICT DO NOTHING",
                                 {table, path});
    if (changed == 0) {
        // Raced with another writer on the same file; re-check ownership
        if (auto owned = resolve_table(path)) {
            return *owned;
        }
        throw invalid_argument_error("Collection path '" + path + "' could not claim table " + table);
    }
    LOG_DEBUG("schema", "Collection %s claims table %s", path.c_str(), table.c_str());
    return table;
}

bool schema_manager::ensure_table(const std::string& table,
                                  const std::vector<std::string>& column_ids,
                                  const std::vector<std::string>& primary_key_cols,
                                  const std::vector<std::string>& index_cols) {
    if (!db_.table_exists(table)) {
        create_table(table, column_ids, primary_key_cols, index_cols);
        return true;
    }

    // Existing table: only grow. Key and index status of existing columns is fixed.
    auto existing = db_.get_table_info(table);
    for (const auto& col : column_ids) {
        if (existing.count(col)) continue;
        db_.execute("ALTER TABLE " + quote_identifier(table) +
                    " ADD COLUMN " + quote_identifier(col) + " TEXT");
        existing.emplace(col, "TEXT");
        LOG_DEBUG("schema", "Added column %s to %s", col.c_str(), table.c_str());
        if (contains(index_cols, col)) {
            create_index(table, col);
        }
    }
    return false;
}

void schema_manager::create_table(const std::string& table,
                                  const std::vector<std::string>& column_ids,
                                  const std::vector<std::string>& primary_key_cols,
                                  const std::vector<std::string>& index_cols) {
    if (column_ids.empty()) {
        throw invalid_argument_error("Cannot create table " + table + " without columns");
    }

    std::ostringstream sql;
    sql << "CREATE TABLE IF NOT EXISTS " << quote_identifier(table) << " (";
    bool first = true;
    for (const auto& col : column_ids) {
        if (!first) sql << ", ";
        sql << quote_identifier(col) << " TEXT";
        if (contains(primary_key_cols, col)) {
            sql << " NOT NULL";
        }
        first = false;
    }
    if (!primary_key_cols.empty()) {
        sql << ", PRIMARY KEY (";
        first = true;
        for (const auto& col : primary_key_cols) {
            if (!first) sql << ", ";
            sql << quote_identifier(col);
            first = false;
        }
        sql << ")";
    }
    sql << ")";
    db_.execute(sql.str());
    LOG_INFO("schema", "Created table %s with %zu columns (%zu in primary key)",
             table.c_str(), column_ids.size(), primary_key_cols.size());

    // Primary key columns are already covered by the key's own index
    for (const auto& col : index_cols) {
        if (contains(primary_key_cols, col)) continue;
        create_index(table, col);
    }
}

void schema_manager::create_index(const std::string& table, const std::string& column_id) {
    std::string name = index_name(table, column_id);
    db_.execute("CREATE INDEX IF NOT EXISTS " + quote_identifier(name) +
                " ON " + quote_identifier(table) + "(" + quote_identifier(column_id) + ")");
    LOG_INFO("schema", "Created index %s", name.c_str());
}

key_columns schema_manager::derive_keys(const std::map<std::string, std::string>& column_keys) {
    key_columns keys;
    for (const auto& [column_id, flat_key] : column_keys) {
        if (ends_with(flat_key, primary_key_suffix)) {
            keys.primary_key.push_back(column_id);
        } else if (ends_with(flat_key, index_suffix)) {
            keys.indexed.push_back(column_id);
        }
    }
    return keys;
}

std::set<std::string> schema_manager::columns(const std::string& table) const {
    std::set<std::string> result;
    for (const auto& [name, _] : db_.get_table_info(table)) {
        result.insert(name);
    }
    return result;
}

std::vector<std::string> schema_manager::primary_key(const std::string& table) const {
    return db_.get_primary_key(table);
}

std::vector<std::string> schema_manager::indexes(const std::string& table) const {
    return db_.get_indexes(table);
}

std::vector<std::string> schema_manager::collections() const {
    std::vector<std::string> paths;
    for (auto& row : db_.query(std::string("SELECT path FROM ") + catalog_table + " ORDER BY path")) {
        paths.push_back(std::get<std::string>(row["path"]));
    }
    return paths;
}

std::string schema_manager::index_name(const std::string& table, const std::string& column_id) {
    return "idx_" + table + "_" + column_id;
}

} // namespace strata
