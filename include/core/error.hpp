#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace piiguard {

/**
 * @brief Error categories for the guardian
 */
enum class ErrorCategory {
    NONE,
    CONFIGURATION_ERROR,
    PATTERN_ERROR,
    PROTECTION_ERROR
};

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

// ============================================================================
// Exceptions surfaced to direct callers
// ============================================================================

class GuardianError : public std::runtime_error {
public:
    GuardianError(ErrorCategory category, const std::string& message)
        : std::runtime_error(message), category_(category) {}

    [[nodiscard]] ErrorCategory category() const { return category_; }

private:
    ErrorCategory category_;
};

/**
 * @brief Invalid configuration at construction time. Never retried.
 */
class ConfigurationError : public GuardianError {
public:
    explicit ConfigurationError(const std::string& message)
        : GuardianError(ErrorCategory::CONFIGURATION_ERROR, message) {}
};

/**
 * @brief Unexpected failure inside the protect pipeline, wraps the cause
 */
class ProtectionError : public GuardianError {
public:
    explicit ProtectionError(const std::string& message)
        : GuardianError(ErrorCategory::PROTECTION_ERROR, message) {}
};

} // namespace piiguard
