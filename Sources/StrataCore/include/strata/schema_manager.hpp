#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace strata {

/// Primary-key and index candidates among a document's columns.
struct key_columns {
    std::vector<std::string> primary_key;
    std::vector<std::string> indexed;
};

/// Owns the DDL side of the engine: the collection catalog, lazy table
/// creation, column growth and secondary indexes. Callers serialize writes;
/// every operation here is idempotent and safe to repeat before each write.
class schema_manager {
public:
    static constexpr const char* catalog_table = "_strata_collections";

    /// Creates the catalog table if needed.
    explicit schema_manager(database& db);

    /// Validates a collection path and derives its table name ('/' -> '_', lowercased).
    /// Throws invalid_argument_error for empty segments, characters outside
    /// [A-Za-z0-9_] or reserved names.
    static std::string table_name_for(const std::string& path);

    /// Table already claimed by this path, or nullopt if the collection has
    /// never been written. Throws invalid_argument_error if a different path
    /// owns the derived table name.
    std::optional<std::string> resolve_table(const std::string& path) const;

    /// resolve_table against another connection to the same database, so a
    /// reader sees the catalog as of its own snapshot.
    std::optional<std::string> resolve_table(const std::string& path, const database& via) const;

    /// Like resolve_table but records the claim for a new collection.
    std::string claim_table(const std::string& path);

    /// Creates the table with one TEXT column per id, or adds the missing
    /// columns to an existing one. The primary key is only applied at
    /// creation; an index column is indexed when it is first added. Existing
    /// columns never change. Returns true if the table was created.
    bool ensure_table(const std::string& table,
                      const std::vector<std::string>& column_ids,
                      const std::vector<std::string>& primary_key_cols,
                      const std::vector<std::string>& index_cols);

    /// Splits column ids by the "_pri"/"_ind" suffix of their flat key.
    static key_columns derive_keys(const std::map<std::string, std::string>& column_keys);

    std::set<std::string> columns(const std::string& table) const;
    std::vector<std::string> primary_key(const std::string& table) const;
    std::vector<std::string> indexes(const std::string& table) const;

    /// Every collection path ever claimed, sorted.
    std::vector<std::string> collections() const;

    static std::string index_name(const std::string& table, const std::string& column_id);

private:
    database& db_;

    void create_table(const std::string& table,
                      const std::vector<std::string>& column_ids,
                      const std::vector<std::string>& primary_key_cols,
                      const std::vector<std::string>& index_cols);
    void create_index(const std::string& table, const std::string& column_id);
};

} // namespace strata

#endif // __cplusplus
