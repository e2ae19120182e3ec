#ifndef HPL_PRESENCE_PRESENCE_CONFIG_HPP
#define HPL_PRESENCE_PRESENCE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

#include "hpl/net/Error.hpp"

namespace HPL::Presence {

/**
 * @brief Settings of one presence tracker
 *
 * Example JSON:
 *   {
 *     "url": "nats://localhost:4222",
 *     "bucket": "hpl_presence",
 *     "client_id": "worker_01",
 *     "ttl_seconds": 10,
 *     "max_value_size": 256,
 *     "heartbeat_interval_ms": 3000,
 *     "operation_timeout_ms": 2000,
 *     "list_idle_timeout_ms": 100,
 *     "log_level": "info"
 *   }
 */
struct PresenceConfig {
    static constexpr int32_t kDefaultMaxValueSize = 256;

    std::string url = "nats://localhost:4222";   ///< Server URL
    std::string bucket_name;                     ///< Presence domain
    std::string client_id;                       ///< This participant
    std::chrono::seconds ttl{10};                ///< Bucket-wide key TTL

    /// Heartbeat payload bound, sized for a decimal Unix timestamp
    int32_t max_value_size = kDefaultMaxValueSize;

    /// Caller's heartbeat cadence; 0 means ttl / 3
    std::chrono::milliseconds heartbeat_interval{0};

    std::chrono::milliseconds operation_timeout{2000};  ///< Connect, put, get, flush
    std::chrono::milliseconds list_idle_timeout{100};   ///< Enumeration idle bound
    std::string log_level = "info";

    /**
     * @brief Check every field
     * @return CONFIGURATION_ERROR naming the first invalid field
     */
    Net::Status Validate() const;

    /**
     * @brief Heartbeat interval after applying the ttl / 3 default
     */
    std::chrono::milliseconds EffectiveHeartbeatInterval() const;

    /**
     * @brief Build from JSON; missing keys keep their defaults
     * @return The validated config or CONFIGURATION_ERROR
     */
    static Net::Result<PresenceConfig> FromJSON(const nlohmann::json& json);

    /**
     * @brief Parse a JSON file without validating it
     *
     * Lets callers merge further settings over the file before FromJSON.
     * @return The top-level JSON object or CONFIGURATION_ERROR
     */
    static Net::Result<nlohmann::json> LoadJSON(const std::string& filename);

    /**
     * @brief Load a JSON file
     */
    static Net::Result<PresenceConfig> FromFile(const std::string& filename);

    nlohmann::json ToJSON() const;
};

}  // namespace HPL::Presence

#endif  // HPL_PRESENCE_PRESENCE_CONFIG_HPP
