#pragma once

#include <optional>
#include <string>
#include <utility>

namespace sqlmigrator {

/**
 * @brief What went wrong at the batch boundary (config, input files, report)
 */
enum class ErrorCategory {
    NONE,
    IO_ERROR,           // File missing, unreadable, unwritable
    PARSE_ERROR,        // Malformed JSON
    VALIDATION_ERROR,   // Well-formed but wrong shape
    INTERNAL_ERROR
};

[[nodiscard]] inline constexpr const char* error_category_name(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:             return "none";
        case ErrorCategory::IO_ERROR:         return "io";
        case ErrorCategory::PARSE_ERROR:      return "parse";
        case ErrorCategory::VALIDATION_ERROR: return "validation";
        case ErrorCategory::INTERNAL_ERROR:   return "internal";
    }
    return "unknown";
}

/**
 * @brief Value or categorized error message
 */
template<typename T>
class Result {
public:
    static Result ok(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result error(ErrorCategory category, std::string message) {
        Result r;
        r.category_ = category;
        r.message_ = std::move(message);
        return r;
    }

    [[nodiscard]] bool is_ok() const { return value_.has_value(); }
    [[nodiscard]] bool is_error() const { return !value_.has_value(); }

    const T& value() const { return *value_; }
    T& value() { return *value_; }
    T take() { return std::move(*value_); }

    [[nodiscard]] ErrorCategory error_category() const { return category_; }
    [[nodiscard]] const std::string& error_message() const { return message_; }

private:
    std::optional<T> value_;
    ErrorCategory category_ = ErrorCategory::NONE;
    std::string message_;
};

} // namespace sqlmigrator
