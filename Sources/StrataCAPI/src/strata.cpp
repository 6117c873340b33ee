#include "strata.h"
#include <strata/strata.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <cstring>
#include <string>

// Thread-local error message storage
static thread_local std::string g_last_error;

static void set_error(const std::string& msg) {
    g_last_error = msg;
}

struct strata_store {
    explicit strata_store(const strata::configuration& config) : store(config) {}
    strata::document_store store;
};

static strata_status_t status_for(strata::error_code code) {
    switch (code) {
        case strata::error_code::schema_conflict:   return STRATA_ERROR_SCHEMA_CONFLICT;
        case strata::error_code::not_found:         return STRATA_ERROR_NOT_FOUND;
        case strata::error_code::invalid_condition: return STRATA_ERROR_INVALID_CONDITION;
        case strata::error_code::invalid_argument:  return STRATA_ERROR_INVALID_ARGUMENT;
        case strata::error_code::unknown_column:    return STRATA_ERROR_UNKNOWN_COLUMN;
        case strata::error_code::storage_failure:   return STRATA_ERROR_STORAGE;
    }
    return STRATA_ERROR_INTERNAL;
}

static char* copy_string(const std::string& s) {
    char* ret = static_cast<char*>(malloc(s.size() + 1));
    if (ret) {
        std::memcpy(ret, s.c_str(), s.size() + 1);
    }
    return ret;
}

// Runs fn, translating exceptions into a status and the thread's last error
template<typename Fn>
static strata_status_t guarded(Fn&& fn) {
    g_last_error.clear();
    try {
        fn();
        return STRATA_OK;
    } catch (const strata::error& e) {
        set_error(e.what());
        return status_for(e.code());
    } catch (const nlohmann::json::exception& e) {
        set_error(std::string("invalid JSON: ") + e.what());
        return STRATA_ERROR_INVALID_ARGUMENT;
    } catch (const std::exception& e) {
        set_error(e.what());
        return STRATA_ERROR_INTERNAL;
    }
}

static strata_status_t write_json(const nlohmann::json& value, char** out_json) {
    char* str = copy_string(value.dump());
    if (!str) {
        set_error("out of memory");
        return STRATA_ERROR_INTERNAL;
    }
    *out_json = str;
    return STRATA_OK;
}

static nlohmann::json to_array(const std::vector<strata::document>& docs) {
    nlohmann::json array = nlohmann::json::array();
    for (const auto& doc : docs) {
        array.push_back(doc);
    }
    return array;
}

// =============================================================================
// Error Handling
// =============================================================================

extern "C" const char* strata_last_error(void) {
    return g_last_error.empty() ? nullptr : g_last_error.c_str();
}

// =============================================================================
// Store Lifecycle
// =============================================================================

extern "C" strata_store_t* strata_store_open(const char* path) {
    if (!path) {
        set_error("path is null");
        return nullptr;
    }
    try {
        return new strata_store(strata::configuration(std::string(path)));
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

extern "C" strata_store_t* strata_store_open_in_memory(void) {
    try {
        return new strata_store(strata::configuration());
    } catch (const std::exception& e) {
        set_error(e.what());
        return nullptr;
    }
}

extern "C" void strata_store_close(strata_store_t* store) {
    delete store;
}

extern "C" void strata_set_log_level(int level) {
    if (level < static_cast<int>(strata::log_level::off)) {
        level = static_cast<int>(strata::log_level::off);
    } else if (level > static_cast<int>(strata::log_level::debug)) {
        level = static_cast<int>(strata::log_level::debug);
    }
    strata::set_log_level(static_cast<strata::log_level>(level));
}

// =============================================================================
// Documents
// =============================================================================

extern "C" strata_status_t strata_insert(strata_store_t* store, const char* path,
                                         const char* json, int64_t* out_row_id) {
    if (!store || !path || !json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto doc = nlohmann::json::parse(json);
        int64_t row_id = store->store.insert_or_replace(path, doc);
        if (out_row_id) *out_row_id = row_id;
    });
}

extern "C" strata_status_t strata_get_by_id(strata_store_t* store, const char* path,
                                            int64_t row_id, char** out_json) {
    if (!store || !path || !out_json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    nlohmann::json result;
    strata_status_t status = guarded([&] {
        result = store->store.get_by_id(path, row_id);
    });
    return status == STRATA_OK ? write_json(result, out_json) : status;
}

extern "C" strata_status_t strata_list_all(strata_store_t* store, const char* path, char** out_json) {
    if (!store || !path || !out_json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    nlohmann::json result;
    strata_status_t status = guarded([&] {
        result = to_array(store->store.list_all(path));
    });
    return status == STRATA_OK ? write_json(result, out_json) : status;
}

extern "C" strata_status_t strata_list_entries(strata_store_t* store, const char* path, char** out_json) {
    if (!store || !path || !out_json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    nlohmann::json result = nlohmann::json::array();
    strata_status_t status = guarded([&] {
        for (auto& entry : store->store.list_entries(path)) {
            nlohmann::json item = {{strata::row_id_column, entry.row_id}, {"document", std::move(entry.body)}};
            result.push_back(std::move(item));
        }
    });
    return status == STRATA_OK ? write_json(result, out_json) : status;
}

extern "C" strata_status_t strata_find(strata_store_t* store, const char* path,
                                       const char* condition, char** out_json) {
    if (!store || !path || !condition || !out_json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    nlohmann::json result;
    strata_status_t status = guarded([&] {
        result = to_array(store->store.find(path, condition));
    });
    return status == STRATA_OK ? write_json(result, out_json) : status;
}

extern "C" strata_status_t strata_count(strata_store_t* store, const char* path, size_t* out_count) {
    if (!store || !path || !out_count) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        *out_count = store->store.count(path);
    });
}

extern "C" strata_status_t strata_update(strata_store_t* store, const char* path, const char* json,
                                         const char* condition, size_t* out_changed) {
    if (!store || !path || !json || !condition) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto partial = nlohmann::json::parse(json);
        size_t changed = store->store.update(path, partial, condition);
        if (out_changed) *out_changed = changed;
    });
}

extern "C" strata_status_t strata_update_by_id(strata_store_t* store, const char* path,
                                               const char* json, int64_t row_id) {
    if (!store || !path || !json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        auto partial = nlohmann::json::parse(json);
        store->store.update_by_id(path, partial, row_id);
    });
}

extern "C" strata_status_t strata_delete(strata_store_t* store, const char* path,
                                         const char* condition, size_t* out_removed) {
    if (!store || !path || !condition) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        size_t removed = store->store.remove(path, condition);
        if (out_removed) *out_removed = removed;
    });
}

extern "C" strata_status_t strata_delete_by_id(strata_store_t* store, const char* path, int64_t row_id) {
    if (!store || !path) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    return guarded([&] {
        store->store.remove_by_id(path, row_id);
    });
}

extern "C" strata_status_t strata_query_page(strata_store_t* store, const char* path,
                                             const char* order_by, const char* direction,
                                             int64_t page, int64_t page_size, char** out_json) {
    if (!store || !path || !order_by || !out_json) {
        set_error("null argument");
        return STRATA_ERROR_NULL_POINTER;
    }
    *out_json = nullptr;
    nlohmann::json result;
    strata_status_t status = guarded([&] {
        auto dir = direction ? strata::sort_direction_from_string(direction)
                             : strata::sort_direction::ascending;
        result = to_array(store->store.query_paginated(path, order_by, dir, page, page_size));
    });
    return status == STRATA_OK ? write_json(result, out_json) : status;
}

extern "C" void strata_string_free(char* str) {
    if (str) {
        free(str);
    }
}
