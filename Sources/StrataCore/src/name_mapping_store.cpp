#include "strata/name_mapping_store.hpp"
#include "strata/log.hpp"

namespace strata {

name_mapping_store::name_mapping_store(database& db) : db_(db) {
    db_.execute(std::string("CREATE TABLE IF NOT EXISTS ") + table_name + " ("
                "hashed_name TEXT PRIMARY KEY, "
                "original_name TEXT UNIQUE NOT NULL)");
}

std::unordered_map<std::string, std::string> name_mapping_store::load() const {
    std::unordered_map<std::string, std::string> mapping;
    auto rows = db_.query(std::string("SELECT hashed_name, original_name FROM ") + table_name);
    mapping.reserve(rows.size());
    for (auto& row : rows) {
        mapping.emplace(std::get<std::string>(row["hashed_name"]),
                        std::get<std::string>(row["original_name"]));
    }
    LOG_DEBUG("name_mapping", "Loaded %zu name mappings", mapping.size());
    return mapping;
}

bool name_mapping_store::insert_if_absent(const std::string& hashed, const std::string& original) {
    size_t changed = db_.execute(std::string("INSERT INTO ") + table_name +
                                 " (hashed_name, original_name) VALUES (?, ?) ON CONFLICT DO NOTHING",
                                 {hashed, original});
    if (changed > 0) {
        return true;
    }

    // Nothing written: either the same pair exists, or one side is bound elsewhere
    auto existing = lookup(hashed);
    if (existing && *existing == original) {
        return false;
    }
    std::string msg;
    if (existing) {
        msg = "Column identifier " + hashed + " already maps to '" + *existing +
              "', cannot map it to '" + original + "'";
    } else {
        msg = "Flat key '" + original + "' is already mapped to a different column identifier than " + hashed;
    }
    LOG_ERROR("name_mapping", "%s", msg.c_str());
    throw schema_conflict_error(msg);
}

std::optional<std::string> name_mapping_store::lookup(const std::string& hashed) const {
    auto rows = db_.query(std::string("SELECT original_name FROM ") + table_name + " WHERE hashed_name = ?",
                          {hashed});
    if (rows.empty()) {
        return std::nullopt;
    }
    return std::get<std::string>(rows[0]["original_name"]);
}

} // namespace strata
