#pragma once

#include <optional>
#include <string>
#include <utility>

namespace nlsql {

/**
 * @brief Closed error taxonomy surfaced by the pool manager, executor and pipeline
 *
 * None of these is process-fatal and none is retried automatically.
 */
enum class ErrorCode {
    NONE,

    // Connection / pool
    CONNECTION_REFUSED,
    HOST_NOT_FOUND,
    AUTHENTICATION_FAILED,
    DATABASE_NOT_FOUND,
    POOL_EXHAUSTED,
    TIMEOUT,

    // Statement
    TABLE_NOT_FOUND,
    SYNTAX_ERROR,
    UNIQUE_CONSTRAINT_VIOLATION,
    FOREIGN_KEY_VIOLATION,
    RESULT_TOO_LARGE,
    DATABASE_ERROR,

    // Pipeline
    INVALID_REQUEST,
    GENERATION_FAILED,
    VALIDATION_FAILED
};

[[nodiscard]] inline const char* error_code_to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::NONE:                        return "NONE";
        case ErrorCode::CONNECTION_REFUSED:          return "CONNECTION_REFUSED";
        case ErrorCode::HOST_NOT_FOUND:              return "HOST_NOT_FOUND";
        case ErrorCode::AUTHENTICATION_FAILED:       return "AUTHENTICATION_FAILED";
        case ErrorCode::DATABASE_NOT_FOUND:          return "DATABASE_NOT_FOUND";
        case ErrorCode::POOL_EXHAUSTED:              return "POOL_EXHAUSTED";
        case ErrorCode::TIMEOUT:                     return "TIMEOUT";
        case ErrorCode::TABLE_NOT_FOUND:             return "TABLE_NOT_FOUND";
        case ErrorCode::SYNTAX_ERROR:                return "SYNTAX_ERROR";
        case ErrorCode::UNIQUE_CONSTRAINT_VIOLATION: return "UNIQUE_CONSTRAINT_VIOLATION";
        case ErrorCode::FOREIGN_KEY_VIOLATION:       return "FOREIGN_KEY_VIOLATION";
        case ErrorCode::RESULT_TOO_LARGE:            return "RESULT_TOO_LARGE";
        case ErrorCode::DATABASE_ERROR:              return "DATABASE_ERROR";
        case ErrorCode::INVALID_REQUEST:             return "INVALID_REQUEST";
        case ErrorCode::GENERATION_FAILED:           return "GENERATION_FAILED";
        case ErrorCode::VALIDATION_FAILED:           return "VALIDATION_FAILED";
        default:                                     return "UNKNOWN";
    }
}

/**
 * @brief Result type for operations that can fail
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.success_ = true;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCode code, std::string message) {
        Result r;
        r.success_ = false;
        r.error_code_ = code;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCode error_code() const { return error_code_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCode error_code_ = ErrorCode::NONE;
    std::string error_message_;
};

} // namespace nlsql
