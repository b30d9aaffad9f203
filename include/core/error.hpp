#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlmcp {

/**
 * @brief Error categories surfaced to callers
 *
 * VALIDATION_ERROR: query rejected by the read-only policy (database never contacted)
 * CONNECTION_ERROR: driver/network/authentication failure opening the session
 * EXECUTION_ERROR:  engine rejected the statement, or it timed out
 */
enum class ErrorCategory {
    NONE,
    VALIDATION_ERROR,
    CONNECTION_ERROR,
    EXECUTION_ERROR,
    INVALID_REQUEST,
    INTERNAL_ERROR
};

inline const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE: return "none";
        case ErrorCategory::VALIDATION_ERROR: return "validation_error";
        case ErrorCategory::CONNECTION_ERROR: return "connection_error";
        case ErrorCategory::EXECUTION_ERROR: return "execution_error";
        case ErrorCategory::INVALID_REQUEST: return "invalid_request";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
        default: return "unknown";
    }
}

/**
 * @brief Result type for operations that can fail
 *
 * Carries a category, a machine-readable reason (e.g. "timeout",
 * "multiple-statements") and a human-readable message.
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

    static Result error(ErrorCategory category, std::string message, std::string reason = {}) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        r.error_reason_ = std::move(reason);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }
    const std::string& error_reason() const { return error_reason_; }

    // Re-wrap an error of another Result<U> without touching the value
    template<typename U>
    static Result from_error(const Result<U>& other) {
        return error(other.error_category(), other.error_message(), other.error_reason());
    }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
    std::string error_reason_;
};

} // namespace sqlmcp
