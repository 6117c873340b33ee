#pragma once

#ifdef __cplusplus

#include "name_codec.hpp"
#include "types.hpp"
#include <string>
#include <vector>

namespace strata {

/// Separator between nested keys in a flat key.
inline constexpr char path_separator = '/';

/// Splits a flat key on '/'. Throws invalid_argument_error on an empty segment.
std::vector<std::string> split_flat_key(const std::string& flat_key);

/// Converts nested documents to column id -> text maps and back.
///
/// Scalars are stored as text: strings verbatim, numbers as their JSON
/// rendering, booleans as "true"/"false". JSON null becomes SQL NULL.
/// Arrays are not representable and are rejected.
class document_flattener {
public:
    explicit document_flattener(const name_codec& codec) : codec_(codec) {}

    /// Depth-first walk of an object. A key containing '/' addresses the same
    /// flat key as the equivalent nesting; a later duplicate wins.
    flat_document flatten(const document& doc) const;

    /// Rebuilds one document. Identifiers with no recorded flat key become
    /// top-level leaves named by the identifier.
    document unflatten_row(const flat_row& row) const;

    std::vector<document> unflatten(const std::vector<flat_row>& rows) const;

private:
    const name_codec& codec_;

    void flatten_into(const document& node, const std::string& prefix, flat_document& out) const;
};

} // namespace strata

#endif // __cplusplus
