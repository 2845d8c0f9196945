#ifndef FILE_COMMANDER_ERROR_H
#define FILE_COMMANDER_ERROR_H

#include <string>
#include <exception>
#include <optional>
#include <system_error>
#include <utility>

namespace FileCommander {

/**
 * Error categories for FileCommander operations
 */
enum class ErrorCategory {
    None = 0,          // No error
    FileSystem,        // Local file and folder errors
    Search,            // Search and media lookup outcomes
    Plan,              // Plan shape and operation kind errors
    Validation,        // Input validation errors
    Configuration,     // Config file errors
    Interpreter,       // Natural language interpreter errors
    Internal,          // Internal/unexpected errors
};

/**
 * Common error codes across FileCommander
 */
enum class ErrorCode {
    // Success
    OK = 0,

    // File System (300-399)
    FS_SOURCE_MISSING = 300,
    FS_DESTINATION_EXISTS = 301,
    FS_NOT_A_DIRECTORY = 302,
    FS_ALREADY_EXISTS = 303,
    FS_IO_FAILURE = 304,
    FS_DESTINATION_MISSING = 305,

    // Search (400-499)
    SEARCH_NO_MATCH = 400,
    SEARCH_NO_FILES = 401,

    // Plan (500-599)
    PLAN_UNRECOGNIZED_OPERATION = 500,
    PLAN_NO_OPERATIONS = 501,
    PLAN_PARSE_ERROR = 502,

    // Validation (600-699)
    VALIDATION_INVALID_INPUT = 600,
    VALIDATION_MISSING_FIELD = 601,

    // Configuration (700-799)
    CONFIG_FILE_NOT_FOUND = 700,
    CONFIG_PARSE_ERROR = 701,
    CONFIG_INVALID_VALUE = 702,

    // Interpreter (800-899)
    INTERPRETER_NOT_CONFIGURED = 800,
    INTERPRETER_REQUEST_FAILED = 801,
    INTERPRETER_BAD_RESPONSE = 802,

    // Other (900-999)
    UNKNOWN_ERROR = 999,
};

/**
 * Get human-readable category name
 */
inline const char* getCategoryName(ErrorCategory category) {
    switch (category) {
        case ErrorCategory::None: return "None";
        case ErrorCategory::FileSystem: return "FileSystem";
        case ErrorCategory::Search: return "Search";
        case ErrorCategory::Plan: return "Plan";
        case ErrorCategory::Validation: return "Validation";
        case ErrorCategory::Configuration: return "Configuration";
        case ErrorCategory::Interpreter: return "Interpreter";
        case ErrorCategory::Internal: return "Internal";
        default: return "Unknown";
    }
}

/**
 * Get category for an error code
 */
inline ErrorCategory getCategoryForCode(ErrorCode code) {
    int c = static_cast<int>(code);
    if (c == 0) return ErrorCategory::None;
    if (c >= 300 && c < 400) return ErrorCategory::FileSystem;
    if (c >= 400 && c < 500) return ErrorCategory::Search;
    if (c >= 500 && c < 600) return ErrorCategory::Plan;
    if (c >= 600 && c < 700) return ErrorCategory::Validation;
    if (c >= 700 && c < 800) return ErrorCategory::Configuration;
    if (c >= 800 && c < 900) return ErrorCategory::Interpreter;
    return ErrorCategory::Internal;
}

/**
 * Short symbolic name of an error code, used in log lines
 */
const char* getCodeName(ErrorCode code);

/**
 * Detailed error information
 *
 * Can be used as return type or with exceptions.
 * Supports conversion to bool for easy checking.
 */
class Error {
public:
    /**
     * Create success (no error)
     */
    Error() : m_code(ErrorCode::OK) {}

    /**
     * Create error with code and message
     */
    Error(ErrorCode code, const std::string& message)
        : m_code(code), m_message(message) {}

    /**
     * Create error with code, message, and details
     */
    Error(ErrorCode code, const std::string& message, const std::string& details)
        : m_code(code), m_message(message), m_details(details) {}

    bool isOk() const { return m_code == ErrorCode::OK; }
    bool isError() const { return m_code != ErrorCode::OK; }

    /**
     * Boolean conversion - true if no error
     */
    explicit operator bool() const { return isOk(); }

    // Accessors
    ErrorCode code() const { return m_code; }
    ErrorCategory category() const { return getCategoryForCode(m_code); }
    const std::string& message() const { return m_message; }
    const std::string& details() const { return m_details; }

    Error& withDetails(const std::string& details) {
        m_details = details;
        return *this;
    }

    /**
     * Attach the underlying system error value (errno / std::error_code)
     */
    Error& withSystemError(int systemErrorCode) {
        m_systemErrorCode = systemErrorCode;
        return *this;
    }

    int systemErrorCode() const { return m_systemErrorCode.value_or(0); }
    bool hasSystemError() const { return m_systemErrorCode.has_value(); }

    /**
     * Format full error string
     */
    std::string toString() const {
        if (isOk()) return "OK";

        std::string result = "[" + std::string(getCategoryName(category())) + "] ";
        result += m_message;
        if (!m_details.empty()) {
            result += " (" + m_details + ")";
        }
        return result;
    }

    // Factory methods for common errors
    static Error ok() { return Error(); }

    static Error sourceMissing(const std::string& path) {
        return Error(ErrorCode::FS_SOURCE_MISSING, "Source does not exist", path);
    }

    static Error parseError(const std::string& reason) {
        return Error(ErrorCode::PLAN_PARSE_ERROR, "Could not parse plan", reason);
    }

    /**
     * Map a std::error_code from a filesystem call into the taxonomy
     * @param ec Error reported by the filesystem call
     * @param context What was being attempted, e.g. "Error moving item"
     */
    static Error fromErrorCode(const std::error_code& ec, const std::string& context);

private:
    ErrorCode m_code;
    std::string m_message;
    std::string m_details;
    std::optional<int> m_systemErrorCode;
};

/**
 * Exception wrapper for Error
 *
 * Use when exceptions are preferred over return codes.
 */
class ErrorException : public std::exception {
public:
    explicit ErrorException(const Error& error) : m_error(error) {
        m_what = m_error.toString();
    }

    ErrorException(ErrorCode code, const std::string& message)
        : m_error(code, message) {
        m_what = m_error.toString();
    }

    const char* what() const noexcept override {
        return m_what.c_str();
    }

    const Error& error() const { return m_error; }
    ErrorCode code() const { return m_error.code(); }

private:
    Error m_error;
    std::string m_what;
};

/**
 * Result type combining success value with possible error
 *
 * Example:
 *   Result<Plan> parsePlan(const std::string& text) {
 *       if (bad) return Error::parseError("not an object");
 *       return plan;  // Success
 *   }
 */
template<typename T>
class Result {
public:
    Result(const T& value) : m_value(value), m_error() {}
    Result(T&& value) : m_value(std::move(value)), m_error() {}

    Result(const Error& error) : m_value(std::nullopt), m_error(error) {}
    Result(Error&& error) : m_value(std::nullopt), m_error(std::move(error)) {}

    bool isOk() const { return m_value.has_value(); }
    bool isError() const { return !m_value.has_value(); }
    explicit operator bool() const { return isOk(); }

    /**
     * Get the value (throws if error)
     */
    const T& value() const {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T& value() {
        if (!m_value.has_value()) {
            throw ErrorException(m_error);
        }
        return m_value.value();
    }

    T valueOr(const T& defaultValue) const {
        return m_value.value_or(defaultValue);
    }

    const Error& error() const { return m_error; }

private:
    std::optional<T> m_value;
    Error m_error;
};

/**
 * Specialization for void (operation without return value)
 */
template<>
class Result<void> {
public:
    Result() : m_error() {}
    Result(const Error& error) : m_error(error) {}

    bool isOk() const { return m_error.isOk(); }
    bool isError() const { return m_error.isError(); }
    explicit operator bool() const { return isOk(); }

    const Error& error() const { return m_error; }

private:
    Error m_error;
};

} // namespace FileCommander

#endif // FILE_COMMANDER_ERROR_H
