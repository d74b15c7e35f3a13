#pragma once

#include <optional>
#include <string>
#include <utility>

namespace promptsan {

/**
 * @brief Error categories for the command-line layer
 *
 * The sanitization core never fails; these cover everything around it.
 */
enum class ErrorCategory {
    NONE,
    USAGE_ERROR,
    INPUT_MISSING,
    OUTPUT_EXISTS,
    IO_ERROR,
    CONFIG_ERROR,
    INTERNAL_ERROR
};

inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:           return "none";
        case ErrorCategory::USAGE_ERROR:    return "usage_error";
        case ErrorCategory::INPUT_MISSING:  return "input_missing";
        case ErrorCategory::OUTPUT_EXISTS:  return "output_exists";
        case ErrorCategory::IO_ERROR:       return "io_error";
        case ErrorCategory::CONFIG_ERROR:   return "config_error";
        case ErrorCategory::INTERNAL_ERROR: return "internal_error";
        default:                            return "unknown";
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

} // namespace promptsan
