#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace llmdlp {

/**
 * @brief Error categories for non-throwing parse paths
 */
enum class ErrorCategory {
    NONE,
    INVALID_ARGUMENT
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
// Exceptions
// ============================================================================

/**
 * @brief Base class for all scanner errors
 */
class DlpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Detection pattern is empty or fails to compile.
class InvalidPatternError : public DlpError {
public:
    using DlpError::DlpError;
};

/// Base confidence is NaN or outside [0, 1].
class InvalidConfidenceError : public DlpError {
public:
    using DlpError::DlpError;
};

/// Custom category name is not a valid identifier.
class InvalidCategoryError : public DlpError {
public:
    using DlpError::DlpError;
};

/// Redaction mode string is not one of mask / remove / tokenize.
class UnsupportedModeError : public DlpError {
public:
    using DlpError::DlpError;
};

/// Scan input exceeds the configured byte bound.
class InputTooLargeError : public DlpError {
public:
    using DlpError::DlpError;
};

} // namespace llmdlp
