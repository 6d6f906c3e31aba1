#pragma once

#include <string>
#include <optional>
#include <string_view>

namespace sqlaudit {

/**
 * @brief Error categories for the audit layer
 *
 * Only EXECUTION_ERROR ever reaches application code; everything else is
 * absorbed by the interceptor and surfaced through logging.
 */
enum class ErrorCategory {
    NONE,
    PARSE_ERROR,
    CAPTURE_ERROR,
    EXECUTION_ERROR,
    DISPATCH_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr std::string_view error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:            return "none";
        case ErrorCategory::PARSE_ERROR:     return "parse_error";
        case ErrorCategory::CAPTURE_ERROR:   return "capture_error";
        case ErrorCategory::EXECUTION_ERROR: return "execution_error";
        case ErrorCategory::DISPATCH_ERROR:  return "dispatch_error";
        case ErrorCategory::CONFIG_ERROR:    return "config_error";
        case ErrorCategory::INTERNAL_ERROR:  return "internal_error";
    }
    return "unknown";
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

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.success_ = false;
        r.error_category_ = category;
        r.error_message_ = std::move(message);
        return r;
    }

    bool is_ok() const { return success_; }
    bool is_error() const { return !success_; }

    const T& value() const { return *value_; }
    T& value() { return *value_; }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    bool success_ = false;
    std::optional<T> value_;
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

/**
 * @brief Outcome of an operation with no value
 */
class Status {
public:
    Status() = default;

    static Status ok() { return Status{}; }

    static Status error(ErrorCategory category, std::string message) {
        Status s;
        s.error_category_ = category;
        s.error_message_ = std::move(message);
        return s;
    }

    bool is_ok() const { return error_category_ == ErrorCategory::NONE; }
    bool is_error() const { return !is_ok(); }

    ErrorCategory error_category() const { return error_category_; }
    const std::string& error_message() const { return error_message_; }

private:
    ErrorCategory error_category_ = ErrorCategory::NONE;
    std::string error_message_;
};

} // namespace sqlaudit
