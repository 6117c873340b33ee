#ifndef STRATA_C_API_H
#define STRATA_C_API_H

#include <stdint.h>
#include <stddef.h>

#ifdef __cplusplus
extern "C" {
#endif

// =============================================================================
// Opaque Types
// =============================================================================

typedef struct strata_store strata_store_t;

// =============================================================================
// Error Handling
// =============================================================================

typedef enum {
    STRATA_OK = 0,
    STRATA_ERROR_NULL_POINTER = -1,
    STRATA_ERROR_INVALID_ARGUMENT = -2,
    STRATA_ERROR_NOT_FOUND = -3,
    STRATA_ERROR_STORAGE = -4,
    STRATA_ERROR_SCHEMA_CONFLICT = -5,
    STRATA_ERROR_INVALID_CONDITION = -6,
    STRATA_ERROR_UNKNOWN_COLUMN = -7,
    STRATA_ERROR_INTERNAL = -8,
} strata_status_t;

// Get the last error message (thread-local), NULL if none
const char* strata_last_error(void);

// =============================================================================
// Store Lifecycle
// =============================================================================

// Open (or create) a store backed by a database file. Returns NULL on error.
strata_store_t* strata_store_open(const char* path);

// Open a private in-memory store. Returns NULL on error.
strata_store_t* strata_store_open_in_memory(void);

void strata_store_close(strata_store_t* store);

// 0 = off, 1 = error, 2 = warn, 3 = info, 4 = debug
void strata_set_log_level(int level);

// =============================================================================
// Documents
// =============================================================================
//
// Documents and results are JSON text. Strings returned through out_json are
// allocated with malloc and must be released with strata_string_free.

// Insert, or replace the row with the same primary key
strata_status_t strata_insert(
    strata_store_t* store,
    const char* path,
    const char* json,
    int64_t* out_row_id      // optional
);

strata_status_t strata_get_by_id(
    strata_store_t* store,
    const char* path,
    int64_t row_id,
    char** out_json
);

// Returns a JSON array of documents in insertion order
strata_status_t strata_list_all(
    strata_store_t* store,
    const char* path,
    char** out_json
);

// Returns a JSON array of {"_id": <row id>, "document": {...}} in insertion order
strata_status_t strata_list_entries(
    strata_store_t* store,
    const char* path,
    char** out_json
);

// Returns a JSON array of the documents matching condition
strata_status_t strata_find(
    strata_store_t* store,
    const char* path,
    const char* condition,
    char** out_json
);

strata_status_t strata_count(
    strata_store_t* store,
    const char* path,
    size_t* out_count
);

// condition: key = value [AND key = value ...]
strata_status_t strata_update(
    strata_store_t* store,
    const char* path,
    const char* json,
    const char* condition,
    size_t* out_changed      // optional
);

// STRATA_ERROR_NOT_FOUND if no row has this id
strata_status_t strata_update_by_id(
    strata_store_t* store,
    const char* path,
    const char* json,
    int64_t row_id
);

strata_status_t strata_delete(
    strata_store_t* store,
    const char* path,
    const char* condition,
    size_t* out_removed      // optional
);

// STRATA_ERROR_NOT_FOUND if no row has this id
strata_status_t strata_delete_by_id(
    strata_store_t* store,
    const char* path,
    int64_t row_id
);

// direction: "ASC" or "DESC" (NULL means ASC). Pages start at 1.
strata_status_t strata_query_page(
    strata_store_t* store,
    const char* path,
    const char* order_by,
    const char* direction,
    int64_t page,
    int64_t page_size,
    char** out_json
);

// Free a string returned by this API
void strata_string_free(char* str);

#ifdef __cplusplus
}
#endif

#endif // STRATA_C_API_H
