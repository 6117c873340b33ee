#pragma once

#ifdef __cplusplus

#include "name_mapping_store.hpp"
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace strata {

/// Maps flat keys ("details/address/city") to fixed-form column identifiers
/// and back. The forward direction is a pure digest; the reverse direction is
/// served from an in-memory cache backed by a name_mapping_store.
///
/// Mappings recorded during a write are staged as pending until the owning
/// transaction commits (commit_pending) or rolls back (discard_pending), so
/// the cache only ever holds bindings that are persisted.
class name_codec {
public:
    static constexpr const char* column_prefix = "col_";

    /// Loads every persisted mapping into the cache.
    explicit name_codec(name_mapping_store& store);

    /// "col_" + first 16 bytes of SHA-256(flat_key), lowercase hex.
    static std::string encode(const std::string& flat_key);

    /// True if name has the shape encode() produces.
    static bool is_column_id(const std::string& name);

    /// Binds column_id to flat_key, writing through to the store. Returns true
    /// if the binding is new. Idempotent for an identical pair; throws
    /// schema_conflict_error if column_id is bound to a different key.
    bool record_mapping(const std::string& column_id, const std::string& flat_key);

    /// Publish staged mappings after the enclosing transaction committed.
    void commit_pending();

    /// Forget staged mappings after the enclosing transaction rolled back.
    void discard_pending();

    /// Throws unknown_column_error if column_id was never recorded.
    std::string decode(const std::string& column_id) const;

    std::optional<std::string> try_decode(const std::string& column_id) const;

    size_t size() const;

private:
    name_mapping_store& store_;
    mutable std::mutex mutex_;
    mutable std::unordered_map<std::string, std::string> cache_;
    std::map<std::string, std::string> pending_;
};

} // namespace strata

#endif // __cplusplus
