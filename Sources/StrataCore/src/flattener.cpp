#include "strata/flattener.hpp"
#include "strata/log.hpp"
#include <algorithm>

namespace strata {

namespace {

std::string scalar_to_text(const document& value) {
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_boolean()) {
        return value.get<bool>() ? "true" : "false";
    }
    return value.dump();
}

// Flat keys that are a strict path prefix of another flat key in the same
// document cannot be rebuilt: one node would be both scalar and object.
void check_prefix_clash(const flat_document& flat) {
    std::vector<std::string> keys;
    keys.reserve(flat.keys.size());
    for (const auto& [_, key] : flat.keys) {
        keys.push_back(key);
    }
    std::sort(keys.begin(), keys.end());
    for (size_t i = 0; i + 1 < keys.size(); ++i) {
        const std::string& a = keys[i];
        for (size_t j = i + 1; j < keys.size(); ++j) {
            const std::string& b = keys[j];
            if (b.compare(0, a.size(), a) != 0) break;
            if (b.size() > a.size() && b[a.size()] == path_separator) {
                throw schema_conflict_error("Flat key '" + a + "' is both a value and a parent of '" + b + "'");
            }
        }
    }
}

} // namespace

std::vector<std::string> split_flat_key(const std::string& flat_key) {
    std::vector<std::string> segments;
    size_t start = 0;
    while (true) {
        size_t pos = flat_key.find(path_separator, start);
        std::string segment = flat_key.substr(start, pos == std::string::npos ? std::string::npos : pos - start);
        if (segment.empty()) {
            throw invalid_argument_error("Key '" + flat_key + "' has an empty path segment");
        }
        segments.push_back(std::move(segment));
        if (pos == std::string::npos) break;
        start = pos + 1;
    }
    return segments;
}

flat_document document_flattener::flatten(const document& doc) const {
    if (!doc.is_object()) {
        throw invalid_argument_error(std::string("Document must be a JSON object, got ") + doc.type_name());
    }
    flat_document out;
    flatten_into(doc, "", out);
    check_prefix_clash(out);
    return out;
}

void document_flattener::flatten_into(const document& node, const std::string& prefix,
                                      flat_document& out) const {
    for (auto it = node.begin(); it != node.end(); ++it) {
        std::string flat_key = prefix.empty() ? it.key() : prefix + path_separator + it.key();
        split_flat_key(flat_key);  // validates segments

        const document& value = it.value();
        if (value.is_object()) {
            flatten_into(value, flat_key, out);
            continue;
        }
        if (value.is_array()) {
            throw invalid_argument_error("Array value at '" + flat_key + "' is not supported");
        }

        std::string column_id = name_codec::encode(flat_key);
        out.keys[column_id] = flat_key;
        if (value.is_null()) {
            out.values.erase(column_id);
            out.null_columns.insert(column_id);
        } else {
            out.null_columns.erase(column_id);
            out.values[column_id] = scalar_to_text(value);
        }
    }
}

document document_flattener::unflatten_row(const flat_row& row) const {
    document root = document::object();

    for (const auto& [column_id, value] : row) {
        auto flat_key = codec_.try_decode(column_id);
        std::vector<std::string> segments;
        if (flat_key) {
            segments = split_flat_key(*flat_key);
        } else {
            LOG_WARN("flattener", "No mapping for column %s, keeping it as a leaf", column_id.c_str());
            segments.push_back(column_id);
        }

        document* node = &root;
        for (size_t i = 0; i + 1 < segments.size(); ++i) {
            auto child = node->find(segments[i]);
            if (child == node->end()) {
                node = &((*node)[segments[i]] = document::object());
            } else if (child->is_object()) {
                node = &(*child);
            } else {
                throw schema_conflict_error("Key '" + segments[i] + "' on path '" + *flat_key +
                                            "' holds a value and a sub-document");
            }
        }

        const std::string& leaf = segments.back();
        if (node->contains(leaf)) {
            throw schema_conflict_error("Key '" + leaf + "' of column " + column_id +
                                        " is assigned twice or holds a sub-document");
        }
        (*node)[leaf] = value;
    }
    return root;
}

std::vector<document> document_flattener::unflatten(const std::vector<flat_row>& rows) const {
    std::vector<document> docs;
    docs.reserve(rows.size());
    for (const auto& row : rows) {
        docs.push_back(unflatten_row(row));
    }
    return docs;
}

} // namespace strata
