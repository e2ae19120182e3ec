#include "hpl/nats/NatsPresence.hpp"

namespace HPL::Nats {

Net::Result<std::unique_ptr<Presence::PresenceTracker>> InitPresenceTracker(
    const std::string& url, const std::string& bucket_name, const std::string& client_id,
    int64_t ttl_seconds)
{
    return Presence::PresenceTracker::Initialize(url, bucket_name, client_id, ttl_seconds,
                                                 NatsConnection::GetConnector());
}

Net::Result<std::unique_ptr<Presence::PresenceTracker>> InitPresenceTracker(
    const Presence::PresenceConfig& config, const NatsConnectOptions& options)
{
    return Presence::PresenceTracker::Initialize(config, NatsConnection::GetConnector(options));
}

}  // namespace HPL::Nats
