#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace HPL::Net {

/**
 * @brief A decoded copy of one message received on a subject
 *
 * Owned by the consumer; nothing in it refers back to substrate memory.
 */
struct Message {
    std::string subject;        ///< Subject the message was published on
    std::string reply;          ///< Reply subject, empty if no reply expected
    std::vector<uint8_t> data;  ///< Payload bytes

    std::string DataAsString() const
    {
        return std::string(data.begin(), data.end());
    }
};

/**
 * @brief Copy text into a byte payload
 */
inline std::vector<uint8_t> ToBytes(const std::string& text)
{
    return std::vector<uint8_t>(text.begin(), text.end());
}

}  // namespace HPL::Net
