/**
 * @file NatsPresence.hpp
 * @brief Presence trackers connected to a NATS server
 *
 * Usage:
 *   auto result = HPL::Nats::InitPresenceTracker("nats://localhost:4222",
 *                                                "hpl_presence", "worker_01", 10);
 *   if (!isOk(result)) {
 *       std::cerr << getError(result).ToString() << std::endl;
 *       return 1;
 *   }
 *   auto tracker = takeValue(result);
 */

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "hpl/nats/NatsConnection.hpp"
#include "hpl/presence/PresenceConfig.hpp"
#include "hpl/presence/PresenceTracker.hpp"

namespace HPL::Nats {

/**
 * @brief Initialize a tracker against a JetStream enabled server
 * @param ttl_seconds Bucket TTL, used only when the bucket is created
 * @return CONFIGURATION_ERROR, CONNECTION_ERROR or BUCKET_ERROR
 */
Net::Result<std::unique_ptr<Presence::PresenceTracker>> InitPresenceTracker(
    const std::string& url, const std::string& bucket_name, const std::string& client_id,
    int64_t ttl_seconds);

/**
 * @brief Initialize a tracker from a full configuration
 */
Net::Result<std::unique_ptr<Presence::PresenceTracker>> InitPresenceTracker(
    const Presence::PresenceConfig& config,
    const NatsConnectOptions& options = NatsConnectOptions{});

}  // namespace HPL::Nats
