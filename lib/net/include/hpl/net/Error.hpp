#pragma once

#include <optional>
#include <string>
#include <utility>
#include <variant>

namespace HPL::Net {

/**
 * @brief Error information structure for all library operations
 *
 * Contains error code, descriptive message, timestamp, and the operation and
 * key (or subject) the failure belongs to. Substrate diagnostics are kept
 * verbatim in the message so the caller can see what the server reported.
 */
struct Error {
    /**
     * @brief Error codes for all possible error conditions
     */
    enum Code {
        SUCCESS = 0,            // Operation successful
        CONFIGURATION_ERROR,    // Invalid ttl, bucket name, client id, ...
        CONNECTION_ERROR,       // Transport unreachable, auth failure, closed
        CONTEXT_ERROR,          // Could not acquire a KV capable context
        BUCKET_ERROR,           // Could not create or attach to a bucket
        HEARTBEAT_ERROR,        // Presence write failed
        PRESENCE_CHECK_ERROR,   // Presence read failed (not a not-found)
        WRITE_ERROR,            // Substrate put failed
        READ_ERROR,             // Substrate get or watch failed
        NOT_FOUND,              // Key never written or already expired
        TIMEOUT,                // No response within the caller's timeout
        INVALID_KEY,            // Key or subject rejected by naming rules
        PUBLISH_ERROR,          // Publish failed
        SUBSCRIBE_ERROR,        // Subscribe failed
        REQUEST_ERROR,          // Request/reply failed
        SYSTEM_ERROR,           // Library or platform failure
    };

    Code code;                  // Error code
    std::string message;        // Human-readable error description
    std::string timestamp;      // Human-readable timestamp (e.g., "2025-07-25 14:30:21")
    std::string operation;      // Operation that failed (e.g., "SendHeartbeat")
    std::string key;            // Key or subject involved, empty if none

    /**
     * @brief Construct error with current timestamp
     * @param c Error code
     * @param msg Error message
     */
    Error(Code c, const std::string& msg);

    /**
     * @brief Construct error with operation context
     * @param c Error code
     * @param op Operation name
     * @param k Key or subject the operation was applied to
     * @param msg Underlying diagnostic text
     */
    Error(Code c, const std::string& op, const std::string& k, const std::string& msg);

    /**
     * @brief Re-classify a lower level error, keeping its diagnostic text
     *
     * The resulting message reads "<op>(<key>): <cause message>".
     */
    static Error Wrap(Code c, const std::string& op, const std::string& k, const Error& cause);

    /**
     * @brief One line description: "[CODE] op(key): message"
     */
    std::string ToString() const;

    /**
     * @brief Get current timestamp in human-readable format
     * @return Formatted timestamp string (YYYY-MM-DD HH:MM:SS)
     */
    static std::string getCurrentTimestamp();
};

/**
 * @brief Convert an error code to its symbolic name
 */
const char* ErrorCodeToString(Error::Code code);

/**
 * @brief Result type for error handling without exceptions
 *
 * Contains either a successful result of type T or an Error.
 */
template<typename T>
using Result = std::variant<T, Error>;

/**
 * @brief Helper type for void returns that can fail
 */
using Status = Result<std::monostate>;

/**
 * @brief Check if Result contains a successful value
 */
template<typename T>
bool isOk(const Result<T>& result) {
    return std::holds_alternative<T>(result);
}

/**
 * @brief Extract successful value from Result
 * @warning Only call if isOk(result) returns true
 */
template<typename T>
const T& getValue(const Result<T>& result) {
    return std::get<T>(result);
}

/**
 * @brief Move the successful value out of a Result
 * @warning Only call if isOk(result) returns true
 */
template<typename T>
T takeValue(Result<T>& result) {
    return std::move(std::get<T>(result));
}

/**
 * @brief Extract error from Result
 * @warning Only call if isOk(result) returns false
 */
template<typename T>
const Error& getError(const Result<T>& result) {
    return std::get<Error>(result);
}

/**
 * @brief Create successful Result
 */
template<typename T>
Result<T> Ok(T&& value) {
    return Result<T>{std::forward<T>(value)};
}

/**
 * @brief Successful Status
 */
inline Status Ok() {
    return Status{std::monostate{}};
}

/**
 * @brief Create error Result
 */
template<typename T>
Result<T> Err(Error&& error) {
    return Result<T>{std::forward<Error>(error)};
}

} // namespace HPL::Net
