#pragma once

#ifdef __cplusplus

#include "condition.hpp"
#include "config.hpp"
#include "db.hpp"
#include "flattener.hpp"
#include "name_codec.hpp"
#include "name_mapping_store.hpp"
#include "schema_manager.hpp"
#include "types.hpp"
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace strata {

/// Stores nested documents in relational tables, one table per collection.
///
/// Writes are serialized through a single writer and run in one transaction
/// each (flatten -> record names -> evolve schema -> write). Reads take no
/// lock; on file databases they use a separate read-only connection.
///
/// Usage:
///   strata::document_store store;  // in-memory, or store("path.db")
///   store.insert_or_replace("user_data", {{"user_pri", "U1"}, {"details", {{"age_ind", 25}}}});
///   auto page = store.query_paginated("user_data", "details/age_ind",
///                                     strata::sort_direction::descending, 1, 10);
class document_store {
public:
    // Construct in-memory
    document_store();

    // Construct with path
    explicit document_store(const std::string& path);

    explicit document_store(const configuration& config);

    ~document_store();

    // Non-copyable and non-moveable (owns connections and the writer mutex)
    document_store(const document_store&) = delete;
    document_store& operator=(const document_store&) = delete;
    document_store(document_store&&) = delete;
    document_store& operator=(document_store&&) = delete;

    // MARK: Writes

    /// Upsert keyed on the collection's "_pri" columns; a plain insert when
    /// the collection has none. A replaced row keeps its id and loses every
    /// field the new document does not carry. Returns the row id.
    primary_key_t insert_or_replace(const std::string& collection, const document& doc);

    /// Sets the fields of partial (nested, or "a/b" keys) on every row that
    /// matches where. Returns the number of rows changed. Throws
    /// schema_conflict_error if a matched row would hold both a value and a
    /// sub-document under one key.
    size_t update(const std::string& collection, const document& partial, const std::string& where);

    /// update for the row with this id. Throws not_found_error if there is none.
    void update_by_id(const std::string& collection, const document& partial, primary_key_t row_id);

    /// Deletes every row matching where. Returns the number of rows removed.
    size_t remove(const std::string& collection, const std::string& where);

    /// Throws not_found_error if no row has this id.
    void remove_by_id(const std::string& collection, primary_key_t row_id);

    // MARK: Reads

    /// Throws not_found_error if no row has this id.
    document get_by_id(const std::string& collection, primary_key_t row_id) const;

    std::vector<document> list_all(const std::string& collection) const;

    std::vector<stored_document> list_entries(const std::string& collection) const;

    std::vector<document> find(const std::string& collection, const std::string& where) const;

    /// Page numbers start at 1. Rows without the sort field order as "0";
    /// ties keep insertion order.
    std::vector<document> query_paginated(const std::string& collection,
                                          const std::string& order_by_key,
                                          sort_direction direction,
                                          int64_t page,
                                          int64_t page_size) const;

    size_t count(const std::string& collection) const;

    // MARK: Introspection

    std::vector<std::string> collections() const;

    /// Flat keys currently backed by a column, sorted.
    std::vector<std::string> fields(const std::string& collection) const;

    const configuration& config() const { return config_; }
    const name_codec& codec() const { return codec_; }
    const schema_manager& schema() const { return schema_; }

    // Raw access (use sparingly)
    database& db() { return *db_; }

private:
    configuration config_;
    std::unique_ptr<database> db_;
    name_mapping_store mappings_;
    name_codec codec_;
    schema_manager schema_;
    document_flattener flattener_;
    std::unique_ptr<database> read_db_;
    std::mutex write_mutex_;

    const database& reader() const { return read_db_ ? *read_db_ : *db_; }

    template<typename Fn>
    auto run_write(const char* operation, const std::string& collection, Fn&& fn);

    std::vector<stored_document> select(const std::string& sql,
                                        const std::vector<column_value_t>& params) const;

    flat_document flatten_partial(const std::string& collection, const document& partial) const;

    size_t apply_update(const std::string& table,
                        const flat_document& flat,
                        const database::assignment_t& where_values);

    void check_structure(const std::string& table,
                         const flat_document& flat,
                         const database::assignment_t& where_values) const;

    database::assignment_t where_columns(const std::string& table,
                                         const database& conn,
                                         const std::vector<condition_term>& terms,
                                         bool& satisfiable) const;
};

} // namespace strata

#endif // __cplusplus
