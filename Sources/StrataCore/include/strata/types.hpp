#pragma once

#ifdef __cplusplus

#include <nlohmann/json.hpp>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace strata {

// Row identifier (SQLite rowid, exposed as "_id")
using primary_key_t = int64_t;

// A nested document. Only objects and scalars are stored.
using document = nlohmann::json;

// Column identifier -> text value of one stored row, NULLs already dropped
using flat_row = std::map<std::string, std::string>;

// Values that cross the SQLite boundary
using column_value_t = std::variant<
    std::nullptr_t,
    int64_t,
    double,
    std::string
>;

// Name of the implicit row identifier in result sets
inline constexpr const char* row_id_column = "_id";

// Reserved flat-key suffixes
inline constexpr const char* primary_key_suffix = "_pri";
inline constexpr const char* index_suffix = "_ind";

enum class sort_direction {
    ascending,
    descending
};

/// Accepts "ASC"/"DESC" in any case. Throws invalid_argument_error otherwise.
sort_direction sort_direction_from_string(const std::string& s);

inline const char* to_sql(sort_direction dir) {
    return dir == sort_direction::ascending ? "ASC" : "DESC";
}

/// A stored document together with the identifier of its row.
struct stored_document {
    primary_key_t row_id = 0;
    document body;
};

/// Output of the flattener: values to store and the bindings the name
/// codec has to record before they are written.
struct flat_document {
    std::map<std::string, std::string> values;     // column id -> text (absent = NULL)
    std::set<std::string> null_columns;            // column ids explicitly set to null
    std::map<std::string, std::string> keys;       // column id -> flat key
};

} // namespace strata

#endif // __cplusplus
