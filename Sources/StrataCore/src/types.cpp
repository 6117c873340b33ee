#include "strata/types.hpp"
#include "strata/errors.hpp"
#include <cctype>

namespace strata {

const char* to_string(error_code code) {
    switch (code) {
        case error_code::schema_conflict: return "schema_conflict";
        case error_code::not_found: return "not_found";
        case error_code::invalid_condition: return "invalid_condition";
        case error_code::invalid_argument: return "invalid_argument";
        case error_code::unknown_column: return "unknown_column";
        case error_code::storage_failure: return "storage_failure";
    }
    return "unknown";
}

sort_direction sort_direction_from_string(const std::string& s) {
    std::string upper = s;
    for (char& c : upper) {
        c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    }
    if (upper == "ASC") return sort_direction::ascending;
    if (upper == "DESC") return sort_direction::descending;
    throw invalid_argument_error("Unknown sort direction '" + s + "', expected ASC or DESC");
}

} // namespace strata
