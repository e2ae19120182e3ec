/**
 * @file NatsKeyValueBucket.hpp
 * @brief KV substrate adapter over JetStream key-value buckets
 *
 * nats.c binds the request timeout of KV calls to the JetStream context a
 * kvStore was opened from. To honor per-call timeouts the bucket keeps one
 * attached kvStore per distinct timeout, opened lazily.
 */

#pragma once

#include <nats/nats.h>

#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hpl/kv/IKeyValueBucket.hpp"
#include "hpl/nats/NatsConnection.hpp"

namespace HPL::Nats {

/**
 * @brief Create a JetStream context whose requests wait at most timeout
 * @return CONTEXT_ERROR (TIMEOUT is never produced here)
 */
Net::Result<jsCtx*> OpenJetStream(const NatsConnectionPtr& conn,
                                  std::chrono::milliseconds timeout);

class NatsKVContext : public KV::IKVContext {
public:
    /**
     * @param js Context created by OpenJetStream; ownership is taken
     */
    NatsKVContext(NatsConnectionPtr conn, jsCtx* js, std::chrono::milliseconds timeout);
    ~NatsKVContext() override;

    NatsKVContext(const NatsKVContext&) = delete;
    NatsKVContext& operator=(const NatsKVContext&) = delete;

    Net::Result<std::unique_ptr<KV::IKeyValueBucket>> CreateOrAttachBucket(
        const KV::BucketConfig& config) override;
    void Close() override;

private:
    NatsConnectionPtr conn_;
    jsCtx* js_ = nullptr;
    std::chrono::milliseconds timeout_;
};

class NatsKeyValueBucket : public KV::IKeyValueBucket {
public:
    /**
     * @param kv Store attached with a context waiting default_timeout; ownership is taken
     */
    NatsKeyValueBucket(NatsConnectionPtr conn, KV::BucketConfig config, kvStore* kv,
                       std::chrono::milliseconds default_timeout);
    ~NatsKeyValueBucket() override;

    NatsKeyValueBucket(const NatsKeyValueBucket&) = delete;
    NatsKeyValueBucket& operator=(const NatsKeyValueBucket&) = delete;

    Net::Result<uint64_t> Put(const std::string& key, const std::vector<uint8_t>& value,
                              std::chrono::milliseconds timeout) override;
    Net::Result<KV::KVEntry> Get(const std::string& key,
                                 std::chrono::milliseconds timeout) override;
    Net::Result<std::unique_ptr<KV::IEntryStream>> WatchAll(
        std::chrono::milliseconds idle_timeout) override;
    void Close() override;
    const KV::BucketConfig& GetConfig() const override { return config_; }

private:
    struct Handle {
        jsCtx* js = nullptr;     ///< Owned, null for the handle passed at construction
        kvStore* kv = nullptr;   ///< Owned
    };

    /**
     * @brief Store whose requests wait exactly timeout
     *
     * Opens one context per distinct timeout. The number kept open is
     * bounded; past it the extra handles are released and reopened on demand.
     */
    Net::Result<kvStore*> StoreFor(std::chrono::milliseconds timeout, Net::Error::Code code,
                                   const std::string& op, const std::string& key);

    NatsConnectionPtr conn_;
    KV::BucketConfig config_;
    std::chrono::milliseconds default_timeout_;
    std::map<int64_t, Handle> handles_;
    bool closed_ = false;
};

/**
 * @brief Entry stream over kvWatcher_Next
 *
 * Ends on the first idle timeout or on the watcher's "all current values
 * delivered" marker. Delete and purge markers are skipped.
 */
class NatsEntryStream : public KV::IEntryStream {
public:
    NatsEntryStream(NatsConnectionPtr conn, kvWatcher* watcher, std::string bucket,
                    std::chrono::milliseconds idle_timeout);
    ~NatsEntryStream() override;

    NatsEntryStream(const NatsEntryStream&) = delete;
    NatsEntryStream& operator=(const NatsEntryStream&) = delete;

    Net::Result<std::optional<KV::KVEntry>> Next() override;
    void Stop() override;

private:
    NatsConnectionPtr conn_;
    kvWatcher* watcher_ = nullptr;
    std::string bucket_;
    std::chrono::milliseconds idle_timeout_;
    bool done_ = false;
};

}  // namespace HPL::Nats
