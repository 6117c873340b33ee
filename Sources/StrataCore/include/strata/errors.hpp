#pragma once

#ifdef __cplusplus

#include <stdexcept>
#include <string>

namespace strata {

enum class error_code {
    schema_conflict,
    not_found,
    invalid_condition,
    invalid_argument,
    unknown_column,
    storage_failure
};

const char* to_string(error_code code);

/// Base of every error the engine raises. Each public operation either
/// succeeds or throws exactly one of these.
class error : public std::runtime_error {
public:
    error(error_code code, const std::string& msg)
        : std::runtime_error(msg), code_(code) {}

    error_code code() const noexcept { return code_; }

private:
    error_code code_;
};

/// Two flat keys claim the same column identifier, or a flat key is both
/// a scalar and a sub-document.
class schema_conflict_error : public error {
public:
    explicit schema_conflict_error(const std::string& msg)
        : error(error_code::schema_conflict, msg) {}
};

class not_found_error : public error {
public:
    explicit not_found_error(const std::string& msg)
        : error(error_code::not_found, msg) {}
};

class invalid_condition_error : public error {
public:
    explicit invalid_condition_error(const std::string& msg)
        : error(error_code::invalid_condition, msg) {}
};

class invalid_argument_error : public error {
public:
    explicit invalid_argument_error(const std::string& msg)
        : error(error_code::invalid_argument, msg) {}
};

class unknown_column_error : public error {
public:
    explicit unknown_column_error(const std::string& column_id)
        : error(error_code::unknown_column, "Unknown column: " + column_id) {}
};

/// Failure reported by SQLite (constraint violation, I/O, busy, ...).
class db_error : public error {
public:
    explicit db_error(const std::string& msg)
        : error(error_code::storage_failure, msg) {}
};

} // namespace strata

#endif // __cplusplus
