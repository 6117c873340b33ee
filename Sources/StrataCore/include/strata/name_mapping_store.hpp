#pragma once

#ifdef __cplusplus

#include "db.hpp"
#include <optional>
#include <string>
#include <unordered_map>

namespace strata {

/// Persists column identifier -> flat key bindings in a reserved table so
/// they survive process restarts. Entries are never overwritten or deleted.
class name_mapping_store {
public:
    static constexpr const char* table_name = "_strata_name_mapping";

    /// Creates the reserved table if needed.
    explicit name_mapping_store(database& db);

    /// Entire mapping, hashed_name -> original_name.
    std::unordered_map<std::string, std::string> load() const;

    /// Records the pair unless hashed_name is already present.
    /// Returns true if a row was written. Throws schema_conflict_error if
    /// hashed_name is bound to a different original_name.
    bool insert_if_absent(const std::string& hashed, const std::string& original);

    std::optional<std::string> lookup(const std::string& hashed) const;

    /// True while a write transaction is open on the backing connection;
    /// rows read then may not be committed yet.
    bool in_write_transaction() const { return db_.is_in_transaction(); }

private:
    database& db_;
};

} // namespace strata

#endif // __cplusplus
