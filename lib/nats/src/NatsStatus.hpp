#pragma once

#include <nats/nats.h>

#include <chrono>
#include <string>

#include "hpl/net/Error.hpp"

namespace HPL::Nats {

/**
 * @brief Status text plus the thread's last detailed error, if any
 */
inline std::string StatusText(natsStatus s)
{
    std::string text = natsStatus_GetText(s);
    natsStatus last = NATS_OK;
    const char* detail = nats_GetLastError(&last);
    if (detail != nullptr && detail[0] != '\0' && text != detail) {
        text += ": ";
        text += detail;
    }
    return text;
}

/**
 * @brief Map a failed status to an error, keeping timeouts distinct
 */
inline Net::Error ToError(natsStatus s, Net::Error::Code code, const std::string& op,
                          const std::string& key)
{
    if (s == NATS_TIMEOUT) {
        return Net::Error(Net::Error::TIMEOUT, op, key, StatusText(s));
    }
    return Net::Error(code, op, key, StatusText(s));
}

inline int64_t ToMillis(std::chrono::milliseconds timeout)
{
    return static_cast<int64_t>(timeout.count());
}

}  // namespace HPL::Nats
