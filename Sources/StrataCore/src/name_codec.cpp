#include "strata/name_codec.hpp"
#include "strata/log.hpp"
#include <openssl/evp.h>
#include <array>
#include <new>
#include <stdexcept>

namespace strata {

namespace {

constexpr size_t digest_bytes = 16;

} // namespace

name_codec::name_codec(name_mapping_store& store)
    : store_(store), cache_(store.load()) {}

std::string name_codec::encode(const std::string& flat_key) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> hash{};
    unsigned int hash_len = 0;

    EVP_MD_CTX* md_ctx = EVP_MD_CTX_new();
    if (!md_ctx) {
        throw std::bad_alloc();
    }
    bool ok = EVP_DigestInit_ex(md_ctx, EVP_sha256(), nullptr) == 1 &&
              EVP_DigestUpdate(md_ctx, flat_key.data(), flat_key.size()) == 1 &&
              EVP_DigestFinal_ex(md_ctx, hash.data(), &hash_len) == 1;
    EVP_MD_CTX_free(md_ctx);
    if (!ok || hash_len < digest_bytes) {
        throw std::runtime_error("SHA-256 digest failed for key '" + flat_key + "'");
    }

    static const char hex[] = "0123456789abcdef";
    std::string id(column_prefix);
    id.reserve(id.size() + digest_bytes * 2);
    for (size_t i = 0; i < digest_bytes; ++i) {
        id += hex[hash[i] >> 4];
        id += hex[hash[i] & 0x0F];
    }
    return id;
}

bool name_codec::is_column_id(const std::string& name) {
    const std::string prefix(column_prefix);
    if (name.size() != prefix.size() + digest_bytes * 2) return false;
    if (name.compare(0, prefix.size(), prefix) != 0) return false;
    for (size_t i = prefix.size(); i < name.size(); ++i) {
        char c = name[i];
        if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) return false;
    }
    return true;
}

bool name_codec::record_mapping(const std::string& column_id, const std::string& flat_key) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto check = [&](const std::string& bound) {
        if (bound != flat_key) {
            LOG_ERROR("name_codec", "Column identifier collision: %s maps to '%s' and '%s'",
                      column_id.c_str(), bound.c_str(), flat_key.c_str());
            throw schema_conflict_error("Column identifier " + column_id + " already maps to '" +
                                        bound + "', cannot map it to '" + flat_key + "'");
        }
    };

    if (auto it = cache_.find(column_id); it != cache_.end()) {
        check(it->second);
        return false;
    }
    if (auto it = pending_.find(column_id); it != pending_.end()) {
        check(it->second);
        return false;
    }

    // Throws schema_conflict_error on a persisted mismatch
    bool inserted = store_.insert_if_absent(column_id, flat_key);
    pending_.emplace(column_id, flat_key);
    if (inserted) {
        LOG_DEBUG("name_codec", "Recorded mapping %s -> %s", column_id.c_str(), flat_key.c_str());
    }
    return inserted;
}

void name_codec::commit_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [column_id, flat_key] : pending_) {
        cache_.emplace(column_id, std::move(flat_key));
    }
    pending_.clear();
}

void name_codec::discard_pending() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!pending_.empty()) {
        LOG_DEBUG("name_codec", "Discarding %zu staged mappings", pending_.size());
    }
    pending_.clear();
}

std::string name_codec::decode(const std::string& column_id) const {
    auto flat_key = try_decode(column_id);
    if (!flat_key) {
        throw unknown_column_error(column_id);
    }
    return *flat_key;
}

std::optional<std::string> name_codec::try_decode(const std::string& column_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto it = cache_.find(column_id); it != cache_.end()) {
        return it->second;
    }
    if (auto it = pending_.find(column_id); it != pending_.end()) {
        return it->second;
    }

    // Another process may have recorded it since we loaded. Only cache what
    // is known to be committed.
    auto flat_key = store_.lookup(column_id);
    if (flat_key && !store_.in_write_transaction()) {
        cache_.emplace(column_id, *flat_key);
    }
    return flat_key;
}

size_t name_codec::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}

} // namespace strata
