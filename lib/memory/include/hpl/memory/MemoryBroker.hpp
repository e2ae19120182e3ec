/**
 * @file MemoryBroker.hpp
 * @brief In-process messaging and KV substrate
 *
 * Stands in for a messaging server inside one process: buckets with a
 * bucket-wide TTL and per-bucket monotonic revisions, plus a subject router
 * for publish/subscribe and request/reply. Expired keys are dropped on
 * access, which gives the same visibility guarantee as a server-side sweep.
 *
 * Every connection opened from one broker sees the same buckets, so several
 * trackers in one process (or one test) can share a presence domain.
 *
 * Usage:
 *   auto broker = MemoryBroker::Create();
 *   auto tracker = PresenceTracker::Initialize(config, broker->GetConnector());
 */

#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "hpl/kv/KVEntry.hpp"
#include "hpl/net/Error.hpp"
#include "hpl/net/IConnection.hpp"
#include "hpl/net/Message.hpp"
#include "hpl/net/Subscription.hpp"

namespace HPL::Memory {

class MemoryBroker : public std::enable_shared_from_this<MemoryBroker> {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    static constexpr const char* kUrlScheme = "mem://";

    /**
     * @brief Create a broker
     * @param clock Time source for key expiry (steady_clock when empty)
     */
    static std::shared_ptr<MemoryBroker> Create(Clock clock = {});

    /**
     * @brief Open a connection; the URL must use the mem:// scheme
     * @return CONNECTION_ERROR for other schemes or while shut down
     */
    Net::Result<std::unique_ptr<Net::IConnection>> Connect(const std::string& url);

    /**
     * @brief Connector bound to this broker, for PresenceTracker::Initialize
     */
    Net::Connector GetConnector();

    /**
     * @brief Simulate the server going away
     *
     * Open connections report not connected and every operation fails until
     * Restart(). Stored keys are kept.
     */
    void Shutdown();
    void Restart();
    bool IsRunning() const { return running_.load(); }

    // --- KV operations used by MemoryKVContext / MemoryKeyValueBucket ---

    /**
     * @return BUCKET_ERROR "bucket already exists" if the name is taken
     */
    Net::Status CreateBucket(const KV::BucketConfig& config);

    /**
     * @return Stored config, or BUCKET_ERROR if the bucket does not exist
     */
    Net::Result<KV::BucketConfig> LookupBucket(const std::string& name);

    Net::Result<uint64_t> Put(const std::string& bucket, const std::string& key,
                              const std::vector<uint8_t>& value);
    Net::Result<KV::KVEntry> Get(const std::string& bucket, const std::string& key);

    /**
     * @brief Latest live entry of every key, in revision order
     */
    Net::Result<std::vector<KV::KVEntry>> Snapshot(const std::string& bucket);

    /**
     * @brief Remove a bucket and its keys (administrative, tests)
     */
    bool DeleteBucket(const std::string& name);
    size_t GetBucketCount() const;

    // --- Messaging operations used by MemoryConnection ---

    /**
     * @brief Route a message to every matching subscription
     * @return Number of subscriptions the message was delivered to
     */
    Net::Result<size_t> Route(const Net::Message& msg);

    Net::Result<uint64_t> AddSubscription(const std::string& pattern,
                                          std::shared_ptr<Net::MessageQueue> queue);
    void RemoveSubscription(uint64_t id);
    size_t GetSubscriptionCount() const;

    /**
     * @brief Unique reply subject for one request
     */
    std::string NewInbox();

    TimePoint Now() const;

private:
    explicit MemoryBroker(Clock clock);

    struct StoredValue {
        std::vector<uint8_t> value;
        uint64_t revision = 0;
        int64_t created_unix_ns = 0;
        TimePoint expires_at;
        bool expires = false;
    };

    struct BucketState {
        KV::BucketConfig config;
        std::map<std::string, StoredValue> values;
        uint64_t last_revision = 0;
    };

    struct SubscriptionEntry {
        std::string pattern;
        std::shared_ptr<Net::MessageQueue> queue;
    };

    void PurgeExpired(BucketState& state, TimePoint now);

    Clock clock_;
    std::atomic<bool> running_{true};

    mutable std::mutex mutex_;
    std::map<std::string, BucketState> buckets_;
    std::map<uint64_t, SubscriptionEntry> subscriptions_;
    uint64_t next_subscription_id_ = 1;
    uint64_t next_inbox_id_ = 1;
};

}  // namespace HPL::Memory
