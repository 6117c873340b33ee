#include "strata/document_store.hpp"
#include "strata/log.hpp"
#include <algorithm>
#include <limits>
#include <sstream>

namespace strata {

namespace {

const configuration& apply_log_level(const configuration& config) {
    if (config.level) {
        set_log_level(*config.level);
    }
    return config;
}

std::string value_to_text(const column_value_t& value) {
    if (auto s = std::get_if<std::string>(&value)) return *s;
    if (auto i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    if (auto d = std::get_if<double>(&value)) return document(*d).dump();
    return {};
}

std::string select_prefix(const std::string& table) {
    return std::string("SELECT rowid AS ") + row_id_column + ", * FROM " + quote_identifier(table);
}

std::vector<document> bodies(std::vector<stored_document>&& entries) {
    std::vector<document> docs;
    docs.reserve(entries.size());
    for (auto& entry : entries) {
        docs.push_back(std::move(entry.body));
    }
    return docs;
}

} // namespace

document_store::document_store() : document_store(configuration()) {}

document_store::document_store(const std::string& path) : document_store(configuration(path)) {}

document_store::document_store(const configuration& config)
    : config_(apply_log_level(config)),
      db_(std::make_unique<database>(config_.path, database::open_mode::read_write,
                                     config_.busy_timeout_ms)),
      mappings_(*db_),
      codec_(mappings_),
      schema_(*db_),
      flattener_(codec_) {
    // An in-memory database is private to its connection, so it is never split
    if (!config_.is_in_memory() && config_.separate_read_connection) {
        read_db_ = std::make_unique<database>(config_.path, database::open_mode::read_only,
                                              config_.busy_timeout_ms);
    }
    LOG_INFO("store", "Opened %s (%zu known columns)", config_.path.c_str(), codec_.size());
}

document_store::~document_store() = default;

template<typename Fn>
auto document_store::run_write(const char* operation, const std::string& collection, Fn&& fn) {
    std::lock_guard<std::mutex> lock(write_mutex_);
    try {
        transaction txn(*db_);
        auto result = fn();
        txn.commit();
        codec_.commit_pending();
        return result;
    } catch (const db_error& e) {
        LOG_ERROR("store", "%s on %s failed: %s", operation, collection.c_str(), e.what());
        codec_.discard_pending();
        throw;
    } catch (const error& e) {
        LOG_DEBUG("store", "%s on %s rejected: %s", operation, collection.c_str(), e.what());
        codec_.discard_pending();
        throw;
    } catch (...) {
        codec_.discard_pending();
        throw;
    }
}

// MARK: Writes

primary_key_t document_store::insert_or_replace(const std::string& collection, const document& doc) {
    flat_document flat = flattener_.flatten(doc);
    if (flat.keys.empty()) {
        throw invalid_argument_error("Document for " + collection + " has no fields");
    }

    return run_write("insert", collection, [&]() {
        std::string table = schema_.claim_table(collection);

        std::vector<std::string> column_ids;
        column_ids.reserve(flat.keys.size());
        for (const auto& [column_id, flat_key] : flat.keys) {
            codec_.record_mapping(column_id, flat_key);
            column_ids.push_back(column_id);
        }

        key_columns keys = schema_manager::derive_keys(flat.keys);
        schema_.ensure_table(table, column_ids, keys.primary_key, keys.indexed);

        // The key fixed at first write governs, not this document's suffixes
        auto primary_key = schema_.primary_key(table);
        for (const auto& col : primary_key) {
            if (!flat.values.count(col)) {
                auto name = codec_.try_decode(col);
                throw invalid_argument_error("Document for " + collection + " has no value for key field '" +
                                             (name ? *name : col) + "'");
            }
        }

        // Replace semantics: every column is written, absent ones as NULL
        database::assignment_t values;
        for (const auto& col : schema_.columns(table)) {
            auto it = flat.values.find(col);
            if (it != flat.values.end()) {
                values.emplace_back(col, it->second);
            } else {
                values.emplace_back(col, nullptr);
            }
        }

        primary_key_t row_id = db_->insert(table, values, primary_key);
        LOG_DEBUG("store", "Wrote row %lld to %s", static_cast<long long>(row_id), table.c_str());
        return row_id;
    });
}

size_t document_store::update(const std::string& collection, const document& partial,
                              const std::string& where) {
    auto terms = parse_condition(where);
    flat_document flat = flatten_partial(collection, partial);

    return run_write("update", collection, [&]() -> size_t {
        auto table = schema_.resolve_table(collection);
        if (!table || !db_->table_exists(*table)) {
            return 0;
        }

        bool satisfiable = true;
        auto where_values = where_columns(*table, *db_, terms, satisfiable);
        if (!satisfiable) {
            return 0;
        }
        return apply_update(*table, flat, where_values);
    });
}

void document_store::update_by_id(const std::string& collection, const document& partial,
                                  primary_key_t row_id) {
    flat_document flat = flatten_partial(collection, partial);

    run_write("update", collection, [&]() -> size_t {
        auto table = schema_.resolve_table(collection);
        size_t changed = 0;
        if (table && db_->table_exists(*table)) {
            database::assignment_t by_id{{"rowid", row_id}};
            changed = apply_update(*table, flat, by_id);
        }
        if (changed == 0) {
            throw not_found_error("Collection " + collection + " has no row " + std::to_string(row_id));
        }
        return changed;
    });
}

size_t document_store::remove(const std::string& collection, const std::string& where) {
    auto terms = parse_condition(where);

    return run_write("delete", collection, [&]() -> size_t {
        auto table = schema_.resolve_table(collection);
        if (!table || !db_->table_exists(*table)) {
            return 0;
        }

        bool satisfiable = true;
        auto where_values = where_columns(*table, *db_, terms, satisfiable);
        if (!satisfiable) {
            return 0;
        }
        return db_->remove(*table, where_values);
    });
}

void document_store::remove_by_id(const std::string& collection, primary_key_t row_id) {
    run_write("delete", collection, [&]() -> size_t {
        auto table = schema_.resolve_table(collection);
        size_t removed = 0;
        if (table && db_->table_exists(*table)) {
            database::assignment_t by_id{{"rowid", row_id}};
            removed = db_->remove(*table, by_id);
        }
        if (removed == 0) {
            throw not_found_error("Collection " + collection + " has no row " + std::to_string(row_id));
        }
        return removed;
    });
}

flat_document document_store::flatten_partial(const std::string& collection, const document& partial) const {
    flat_document flat = flattener_.flatten(partial);
    if (flat.keys.empty()) {
        throw invalid_argument_error("Update for " + collection + " sets no fields");
    }
    return flat;
}

size_t document_store::apply_update(const std::string& table,
                                    const flat_document& flat,
                                    const database::assignment_t& where_values) {
    check_structure(table, flat, where_values);

    std::vector<std::string> column_ids;
    database::assignment_t values;
    for (const auto& [column_id, flat_key] : flat.keys) {
        codec_.record_mapping(column_id, flat_key);
        column_ids.push_back(column_id);
        auto it = flat.values.find(column_id);
        if (it != flat.values.end()) {
            values.emplace_back(column_id, it->second);
        } else {
            values.emplace_back(column_id, nullptr);
        }
    }
    // A new "_ind" field is indexed; the primary key is fixed at creation
    key_columns keys = schema_manager::derive_keys(flat.keys);
    schema_.ensure_table(table, column_ids, {}, keys.indexed);

    return db_->update(table, values, where_values);
}

// A row may not hold a value at "a" and at "a/b" at once. Rejects the update
// if a matched row has a value in a column whose key is a path prefix of a
// key being set, or the reverse.
void document_store::check_structure(const std::string& table,
                                     const flat_document& flat,
                                     const database::assignment_t& where_values) const {
    auto nests = [](const std::string& parent, const std::string& child) {
        return child.size() > parent.size() &&
               child.compare(0, parent.size(), parent) == 0 &&
               child[parent.size()] == path_separator;
    };

    std::vector<std::pair<std::string, std::string>> clashes;  // existing column, set key
    for (const auto& column_id : schema_.columns(table)) {
        if (flat.keys.count(column_id)) continue;
        auto existing_key = codec_.try_decode(column_id);
        if (!existing_key) continue;
        for (const auto& [set_id, set_key] : flat.keys) {
            if (!flat.values.count(set_id)) continue;  // setting null never nests
            if (nests(*existing_key, set_key) || nests(set_key, *existing_key)) {
                clashes.emplace_back(column_id, set_key);
                break;
            }
        }
    }
    if (clashes.empty()) return;

    std::ostringstream sql;
    std::vector<column_value_t> params;
    sql << "SELECT 1 AS v FROM " << quote_identifier(table) << " WHERE (";
    bool first = true;
    for (const auto& [column_id, _] : clashes) {
        if (!first) sql << " OR ";
        sql << quote_identifier(column_id) << " IS NOT NULL";
        first = false;
    }
    sql << ")";
    for (const auto& [col, value] : where_values) {
        sql << " AND " << quote_identifier(col) << " = ?";
        params.push_back(value);
    }
    sql << " LIMIT 1";

    if (!db_->query(sql.str(), params).empty()) {
        std::string msg = "Update of " + table + " would store a value and a sub-document under one key:";
        for (const auto& [column_id, set_key] : clashes) {
            msg += " '" + set_key + "' vs '" + codec_.decode(column_id) + "'";
        }
        LOG_ERROR("store", "%s", msg.c_str());
        throw schema_conflict_error(msg);
    }
}

database::assignment_t document_store::where_columns(const std::string& table,
                                                     const database& conn,
                                                     const std::vector<condition_term>& terms,
                                                     bool& satisfiable) const {
    auto existing = conn.get_table_info(table);
    database::assignment_t result;
    satisfiable = true;
    for (const auto& term : terms) {
        std::string column_id = name_codec::encode(term.key);
        if (!existing.count(column_id)) {
            // No row can hold a value for a field the table has never seen
            satisfiable = false;
        }
        result.emplace_back(column_id, term.value);
    }
    return result;
}

// MARK: Reads

std::vector<stored_document> document_store::select(const std::string& sql,
                                                    const std::vector<column_value_t>& params) const {
    std::vector<stored_document> entries;
    for (auto& row : reader().query(sql, params)) {
        stored_document entry;
        flat_row flat;
        for (auto& [name, value] : row) {
            if (name == row_id_column) {
                if (auto id = std::get_if<int64_t>(&value)) entry.row_id = *id;
                continue;
            }
            if (std::holds_alternative<std::nullptr_t>(value)) continue;
            flat.emplace(name, value_to_text(value));
        }
        entry.body = flattener_.unflatten_row(flat);
        entries.push_back(std::move(entry));
    }
    return entries;
}

document document_store::get_by_id(const std::string& collection, primary_key_t row_id) const {
    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        throw not_found_error("Collection " + collection + " has no row " + std::to_string(row_id));
    }
    auto entries = select(select_prefix(*table) + " WHERE rowid = ?", {row_id});
    if (entries.empty()) {
        throw not_found_error("Collection " + collection + " has no row " + std::to_string(row_id));
    }
    return std::move(entries.front().body);
}

std::vector<document> document_store::list_all(const std::string& collection) const {
    return bodies(list_entries(collection));
}

std::vector<stored_document> document_store::list_entries(const std::string& collection) const {
    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        return {};
    }
    return select(select_prefix(*table) + " ORDER BY rowid", {});
}

std::vector<document> document_store::find(const std::string& collection, const std::string& where) const {
    auto terms = parse_condition(where);
    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        return {};
    }

    bool satisfiable = true;
    auto where_values = where_columns(*table, reader(), terms, satisfiable);
    if (!satisfiable) {
        return {};
    }

    std::ostringstream sql;
    sql << select_prefix(*table) << " WHERE ";
    std::vector<column_value_t> params;
    bool first = true;
    for (const auto& [col, value] : where_values) {
        if (!first) sql << " AND ";
        sql << quote_identifier(col) << " = ?";
        params.push_back(value);
        first = false;
    }
    sql << " ORDER BY rowid";
    return bodies(select(sql.str(), params));
}

std::vector<document> document_store::query_paginated(const std::string& collection,
                                                      const std::string& order_by_key,
                                                      sort_direction direction,
                                                      int64_t page,
                                                      int64_t page_size) const {
    if (page < 1) {
        throw invalid_argument_error("Page must be at least 1, got " + std::to_string(page));
    }
    if (page_size < 1) {
        throw invalid_argument_error("Page size must be at least 1, got " + std::to_string(page_size));
    }
    if (page - 1 > std::numeric_limits<int64_t>::max() / page_size) {
        throw invalid_argument_error("Page " + std::to_string(page) + " is out of range");
    }
    int64_t offset = (page - 1) * page_size;

    // An empty sort key means insertion order
    std::string column_id;
    if (!order_by_key.empty()) {
        split_flat_key(order_by_key);
        column_id = name_codec::encode(order_by_key);
    }

    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        return {};
    }

    std::ostringstream sql;
    sql << select_prefix(*table) << " ORDER BY ";
    if (!column_id.empty() && reader().get_table_info(*table).count(column_id)) {
        sql << "COALESCE(" << quote_identifier(column_id) << ", '0') COLLATE "
            << natural_collation << " " << to_sql(direction) << ", ";
    }
    sql << "rowid ASC LIMIT ? OFFSET ?";

    return bodies(select(sql.str(), {page_size, offset}));
}

size_t document_store::count(const std::string& collection) const {
    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        return 0;
    }
    auto rows = reader().query("SELECT COUNT(*) AS n FROM " + quote_identifier(*table));
    if (rows.empty() || !std::holds_alternative<int64_t>(rows[0]["n"])) {
        return 0;
    }
    return static_cast<size_t>(std::get<int64_t>(rows[0]["n"]));
}

// MARK: Introspection

std::vector<std::string> document_store::collections() const {
    return schema_.collections();
}

std::vector<std::string> document_store::fields(const std::string& collection) const {
    auto table = schema_.resolve_table(collection, reader());
    if (!table || !reader().table_exists(*table)) {
        return {};
    }
    std::vector<std::string> keys;
    for (const auto& [column_id, _] : reader().get_table_info(*table)) {
        auto key = codec_.try_decode(column_id);
        keys.push_back(key ? *key : column_id);
    }
    std::sort(keys.begin(), keys.end());
    return keys;
}

} // namespace strata
