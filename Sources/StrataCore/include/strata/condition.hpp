#pragma once

#ifdef __cplusplus

#include <string>
#include <vector>

namespace strata {

/// One "key = value" term of a where-condition. key is a flat key over the
/// original document names ("details/age_ind"), value is compared as text.
struct condition_term {
    std::string key;
    std::string value;
};

/// Parses `key = value [AND key = value ...]`.
///
///   key   : bare token, or a double-quoted string ("" escapes a quote)
///   value : single-quoted string ('' escapes a quote), a number, true or false
///
/// AND is case-insensitive. Throws invalid_condition_error on anything else.
std::vector<condition_term> parse_condition(const std::string& condition);

} // namespace strata

#endif // __cplusplus
