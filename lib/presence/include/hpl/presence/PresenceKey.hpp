#pragma once

#include <optional>
#include <string>

namespace HPL::Presence {

/// Prefix of every presence key in a bucket
constexpr const char* kPresencePrefix = "presence.";

/**
 * @brief Key a client heartbeats to: "presence.<clientId>"
 */
std::string MakePresenceKey(const std::string& client_id);

/**
 * @brief Client id of a presence key
 * @return nullopt if key is not a presence key or has an empty id
 */
std::optional<std::string> ParsePresenceKey(const std::string& key);

/**
 * @brief Whether client_id yields a valid key when prefixed
 */
bool IsValidClientId(const std::string& client_id);

}  // namespace HPL::Presence
