/**
 * pebble/error.hpp - Status and Result types
 *
 * Part of pebble - a minimal record mapper over SQLite.
 *
 * Every fallible operation returns either a Status or a Result<T>.
 * Nothing in pebble throws; callers check ok() and read the status.
 *
 *   auto users = db.select_all<User>();
 *   if (!users.ok()) {
 *       fprintf(stderr, "%s\n", users.status().message.c_str());
 *       return 1;
 *   }
 */

#pragma once

#include <optional>
#include <string>
#include <utility>

namespace pebble {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok,
    InvalidModel,   // malformed record shape
    InvalidQuery,   // malformed builder state (negative limit, unknown column)
    TypeMismatch,   // a Value cannot be converted to the requested native type
    DecodeError,    // a fetched row cannot be turned back into a record
    EngineError,    // SQLite reported a failure
    InvalidConfig
};

inline const char* error_code_name(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok:            return "Ok";
        case ErrorCode::InvalidModel:  return "InvalidModel";
        case ErrorCode::InvalidQuery:  return "InvalidQuery";
        case ErrorCode::TypeMismatch:  return "TypeMismatch";
        case ErrorCode::DecodeError:   return "DecodeError";
        case ErrorCode::EngineError:   return "EngineError";
        case ErrorCode::InvalidConfig: return "InvalidConfig";
    }
    return "Unknown";
}

// ============================================================================
// Status
// ============================================================================

struct Status {
    ErrorCode code = ErrorCode::Ok;
    std::string message;
    int engine_code = 0;  // SQLite result code, EngineError only

    bool ok() const { return code == ErrorCode::Ok; }

    std::string to_string() const {
        if (ok()) return "Ok";
        return std::string(error_code_name(code)) + ": " + message;
    }

    static Status success() { return Status(); }

    static Status fail(ErrorCode c, std::string msg, int engine_rc = 0) {
        Status s;
        s.code = c;
        s.message = std::move(msg);
        s.engine_code = engine_rc;
        return s;
    }
};

// ============================================================================
// Result<T>
// ============================================================================

/**
 * Either a value or a failed Status.
 *
 * Implicitly constructible from both so that functions can
 * `return value;` or `return Status::fail(...);`.
 */
template<typename T>
class Result {
public:
    Result(const T& value) : value_(value) {}
    Result(T&& value) : value_(std::move(value)) {}

    Result(Status status) : status_(std::move(status)) {
        if (status_.ok()) {
            // A Result without a value must carry an error
            status_ = Status::fail(ErrorCode::EngineError, "empty result");
        }
    }

    bool ok() const { return value_.has_value(); }
    explicit operator bool() const { return ok(); }

    const Status& status() const { return status_; }

    T& value() & { return *value_; }
    const T& value() const& { return *value_; }
    T&& value() && { return std::move(*value_); }

    T& operator*() & { return *value_; }
    const T& operator*() const& { return *value_; }
    T&& operator*() && { return std::move(*value_); }

    T* operator->() { return &*value_; }
    const T* operator->() const { return &*value_; }

private:
    std::optional<T> value_;
    Status status_;
};

} // namespace pebble
