#ifndef HPL_PRESENCE_PRESENCE_TRACKER_HPP
#define HPL_PRESENCE_PRESENCE_TRACKER_HPP

#include <chrono>
#include <cstdint>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "hpl/kv/IKeyValueBucket.hpp"
#include "hpl/net/Error.hpp"
#include "hpl/net/IConnection.hpp"
#include "hpl/presence/PresenceConfig.hpp"

namespace HPL::Presence {

/**
 * @brief One live participant as seen by an enumeration
 */
struct PresenceRecord {
    std::string client_id;
    int64_t last_heartbeat_unix = 0;   ///< 0 if the stored value is not a timestamp
    uint64_t revision = 0;
};

/**
 * @brief Liveness of participants derived from key expiry in a TTL bucket
 *
 * Each participant writes "presence.<clientId>" with a bucket-wide TTL.
 * A participant is present while its key exists; the bucket is the only
 * source of truth and the TTL is the only eviction policy. The tracker keeps
 * no cache and starts no threads. The caller owns the heartbeat loop.
 *
 * Not internally synchronized: one tracker per thread, or external locking.
 *
 * Usage:
 *   auto result = PresenceTracker::Initialize(config, connector);
 *   if (!isOk(result)) { ... }
 *   auto tracker = takeValue(result);
 *
 *   HeartbeatScheduler schedule(config.EffectiveHeartbeatInterval());
 *   while (running) {
 *       if (schedule.IsDue()) {
 *           tracker->SendHeartbeat();
 *           schedule.MarkSent();
 *       }
 *       auto alive = tracker->ListPresent();
 *   }
 *   tracker->Close();
 */
class PresenceTracker {
public:
    /**
     * @brief Connect, acquire a KV context and create or attach the bucket
     *
     * Handles opened before a failing step are released before returning.
     * @return CONFIGURATION_ERROR, CONNECTION_ERROR or BUCKET_ERROR
     */
    static Net::Result<std::unique_ptr<PresenceTracker>> Initialize(
        const PresenceConfig& config, const Net::Connector& connector);

    /**
     * @brief Initialize with defaults for everything but the four essentials
     */
    static Net::Result<std::unique_ptr<PresenceTracker>> Initialize(
        const std::string& url, const std::string& bucket_name, const std::string& client_id,
        int64_t ttl_seconds, const Net::Connector& connector);

    /**
     * @brief Take ownership of already opened handles
     *
     * Initialize() is the normal entry point; this constructor lets tests
     * supply substitute substrates.
     */
    PresenceTracker(PresenceConfig config, std::unique_ptr<Net::IConnection> connection,
                    std::unique_ptr<KV::IKVContext> context,
                    std::unique_ptr<KV::IKeyValueBucket> bucket);
    ~PresenceTracker();

    PresenceTracker(const PresenceTracker&) = delete;
    PresenceTracker& operator=(const PresenceTracker&) = delete;

    // === Write path ===

    /**
     * @brief Write presence.<clientId> = current Unix seconds
     *
     * Unconditional overwrite; resets the key's expiry to now + ttl.
     * @return HEARTBEAT_ERROR or TIMEOUT; CONFIGURATION_ERROR for a
     *         timeout that is not positive
     */
    Net::Status SendHeartbeat();
    Net::Status SendHeartbeat(std::chrono::milliseconds timeout);

    // === Read path ===

    /**
     * @brief Whether clientId's key currently exists
     * @return false if never written or expired; PRESENCE_CHECK_ERROR,
     *         TIMEOUT or CONFIGURATION_ERROR if it could not be determined
     */
    Net::Result<bool> IsPresent(const std::string& client_id);
    Net::Result<bool> IsPresent(const std::string& client_id, std::chrono::milliseconds timeout);

    Net::Result<bool> IsSelfPresent();
    Net::Result<bool> IsSelfPresent(std::chrono::milliseconds timeout);

    /**
     * @brief Snapshot of every present client id
     * @param idle_timeout Enumeration ends after this long without a new entry;
     *        must be positive
     * @return PRESENCE_CHECK_ERROR, TIMEOUT or CONFIGURATION_ERROR
     */
    Net::Result<std::set<std::string>> ListPresent();
    Net::Result<std::set<std::string>> ListPresent(std::chrono::milliseconds idle_timeout);

    /**
     * @brief Like ListPresent(), with heartbeat timestamp and revision per client
     *
     * Records are ordered by client id.
     */
    Net::Result<std::vector<PresenceRecord>> ListPresenceEntries();
    Net::Result<std::vector<PresenceRecord>> ListPresenceEntries(
        std::chrono::milliseconds idle_timeout);

    // === Lifecycle ===

    /**
     * @brief Release bucket, context and connection, in that order
     *
     * Idempotent and never fails. Keys and the bucket persist. A timeout
     * that is not positive falls back to the configured operation timeout.
     */
    void Close();
    void Close(std::chrono::milliseconds timeout);

    bool IsClosed() const { return closed_; }

    // === Accessors ===
    const std::string& GetClientId() const { return config_.client_id; }
    const std::string& GetBucketName() const { return config_.bucket_name; }
    const PresenceConfig& GetConfig() const { return config_; }

    /**
     * @brief TTL the bucket actually has (may differ from the requested one
     *        when attaching to an existing bucket)
     */
    std::chrono::milliseconds GetBucketTtl() const;

    uint64_t GetHeartbeatCount() const { return heartbeats_sent_; }
    uint64_t GetLastRevision() const { return last_revision_; }

private:
    Net::Result<std::vector<PresenceRecord>> Enumerate(const std::string& op,
                                                       std::chrono::milliseconds idle_timeout);

    PresenceConfig config_;
    std::unique_ptr<Net::IConnection> connection_;
    std::unique_ptr<KV::IKVContext> context_;
    std::unique_ptr<KV::IKeyValueBucket> bucket_;
    std::chrono::milliseconds bucket_ttl_{0};
    bool closed_ = false;

    // Statistics
    uint64_t heartbeats_sent_ = 0;
    uint64_t last_revision_ = 0;
};

}  // namespace HPL::Presence

#endif  // HPL_PRESENCE_PRESENCE_TRACKER_HPP
