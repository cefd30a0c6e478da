#pragma once

#include <optional>
#include <string>

namespace apidocs {

/**
 * @brief Error categories reported by the explorer collaborators
 */
enum class ErrorCategory {
    NONE,
    DOCUMENT_NOT_FOUND,
    DOCUMENT_GENERATION_ERROR,
    RENDER_ERROR,
    ASSET_NOT_FOUND,
    ASSET_FORBIDDEN
};

[[nodiscard]] inline constexpr const char* error_category_to_string(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::NONE:                      return "none";
        case ErrorCategory::DOCUMENT_NOT_FOUND:        return "document_not_found";
        case ErrorCategory::DOCUMENT_GENERATION_ERROR: return "document_generation_error";
        case ErrorCategory::RENDER_ERROR:              return "render_error";
        case ErrorCategory::ASSET_NOT_FOUND:           return "asset_not_found";
        case ErrorCategory::ASSET_FORBIDDEN:           return "asset_forbidden";
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

} // namespace apidocs
