#pragma once

#include <string>
#include <string_view>
#include <optional>

namespace errorengine {

/**
 * @brief Error categories for the engine
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,
    SOURCE_ERROR,
    ROUTING_ERROR,
    DISPATCH_ERROR,
    STORE_ERROR,
    INTERNAL_ERROR
};

[[nodiscard]] constexpr std::string_view error_category_to_string(ErrorCategory c) {
    switch (c) {
        case ErrorCategory::NONE:                return "none";
        case ErrorCategory::CONFIGURATION_ERROR: return "configuration_error";
        case ErrorCategory::SOURCE_ERROR:        return "source_error";
        case ErrorCategory::ROUTING_ERROR:       return "routing_error";
        case ErrorCategory::DISPATCH_ERROR:      return "dispatch_error";
        case ErrorCategory::STORE_ERROR:         return "store_error";
        case ErrorCategory::INTERNAL_ERROR:      return "internal_error";
        default: return "unknown";
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

} // namespace errorengine
