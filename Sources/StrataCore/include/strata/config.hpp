#pragma once

#ifdef __cplusplus

#include "log.hpp"
#include <optional>
#include <string>

namespace strata {

struct configuration {
    /// Database file path. Use ":memory:" for in-memory database.
    std::string path = ":memory:";

    /// Milliseconds SQLite waits on a locked database before failing.
    int busy_timeout_ms = 5000;

    /// File databases only: serve reads from a second, read-only connection
    /// so readers see committed data and never wait for a writer.
    bool separate_read_connection = true;

    /// Applied to the global log level when the store is constructed.
    std::optional<log_level> level;

    // Default constructor - in-memory
    configuration() = default;

    // Path only - file-based
    explicit configuration(const std::string& p) : path(p) {}

    /// Reads STRATA_DATABASE_PATH and STRATA_LOG_LEVEL; unset variables keep
    /// their defaults.
    static configuration from_environment();

    bool is_in_memory() const { return path.empty() || path == ":memory:"; }
};

} // namespace strata

#endif // __cplusplus
