/**
 * @file Error.cpp
 * @brief Implementation of Error handling and Result pattern
 */

#include "hpl/net/Error.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace HPL::Net {

Error::Error(Code c, const std::string& msg)
    : code(c), message(msg), timestamp(getCurrentTimestamp()) {
}

Error::Error(Code c, const std::string& op, const std::string& k, const std::string& msg)
    : code(c), message(msg), timestamp(getCurrentTimestamp()), operation(op), key(k) {
}

Error Error::Wrap(Code c, const std::string& op, const std::string& k, const Error& cause) {
    std::string text = op;
    if (!k.empty()) {
        text += "(" + k + ")";
    }
    text += ": " + cause.message;
    return Error(c, op, k, text);
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << "[" << ErrorCodeToString(code) << "] ";
    // Wrapped messages already start with the operation
    if (!operation.empty() && message.rfind(operation, 0) != 0) {
        oss << operation;
        if (!key.empty()) {
            oss << "(" << key << ")";
        }
        oss << ": ";
    }
    oss << message;
    return oss.str();
}

std::string Error::getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t_now = std::chrono::system_clock::to_time_t(now);
    std::tm tm_now{};
    localtime_r(&time_t_now, &tm_now);

    // Format: "YYYY-MM-DD HH:MM:SS"
    std::ostringstream oss;
    oss << std::put_time(&tm_now, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

const char* ErrorCodeToString(Error::Code code) {
    switch (code) {
    case Error::SUCCESS:
        return "SUCCESS";
    case Error::CONFIGURATION_ERROR:
        return "CONFIGURATION_ERROR";
    case Error::CONNECTION_ERROR:
        return "CONNECTION_ERROR";
    case Error::CONTEXT_ERROR:
        return "CONTEXT_ERROR";
    case Error::BUCKET_ERROR:
        return "BUCKET_ERROR";
    case Error::HEARTBEAT_ERROR:
        return "HEARTBEAT_ERROR";
    case Error::PRESENCE_CHECK_ERROR:
        return "PRESENCE_CHECK_ERROR";
    case Error::WRITE_ERROR:
        return "WRITE_ERROR";
    case Error::READ_ERROR:
        return "READ_ERROR";
    case Error::NOT_FOUND:
        return "NOT_FOUND";
    case Error::TIMEOUT:
        return "TIMEOUT";
    case Error::INVALID_KEY:
        return "INVALID_KEY";
    case Error::PUBLISH_ERROR:
        return "PUBLISH_ERROR";
    case Error::SUBSCRIBE_ERROR:
        return "SUBSCRIBE_ERROR";
    case Error::REQUEST_ERROR:
        return "REQUEST_ERROR";
    case Error::SYSTEM_ERROR:
        return "SYSTEM_ERROR";
    }
    return "UNKNOWN";
}

} // namespace HPL::Net
