#pragma once

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "hpl/kv/IKeyValueBucket.hpp"
#include "hpl/memory/MemoryBroker.hpp"
#include "hpl/net/IConnection.hpp"

namespace HPL::Memory {

/**
 * @brief Liveness flag shared by a connection and everything opened from it
 */
using OpenFlag = std::shared_ptr<std::atomic<bool>>;

class MemoryConnection : public Net::IConnection {
public:
    MemoryConnection(std::shared_ptr<MemoryBroker> broker, std::string url);
    ~MemoryConnection() override;

    MemoryConnection(const MemoryConnection&) = delete;
    MemoryConnection& operator=(const MemoryConnection&) = delete;

    Net::Status Publish(const std::string& subject, const std::vector<uint8_t>& data) override;
    Net::Result<std::unique_ptr<Net::Subscription>> Subscribe(const std::string& subject) override;
    Net::Result<Net::Message> Request(const std::string& subject,
                                      const std::vector<uint8_t>& data,
                                      std::chrono::milliseconds timeout) override;
    Net::Status Flush(std::chrono::milliseconds timeout) override;
    Net::Result<std::unique_ptr<KV::IKVContext>> GetKVContext(
        std::chrono::milliseconds timeout) override;
    bool IsConnected() const override;
    void Close() override;
    const std::string& GetUrl() const override { return url_; }

    /**
     * @brief Subscriptions opened here and not yet cancelled
     */
    size_t GetSubscriptionCount() const;

private:
    // Shared with each subscription's cancel hook, which may outlive the connection
    struct SubscriptionIds {
        std::mutex mutex;
        std::set<uint64_t> ids;
    };

    std::shared_ptr<MemoryBroker> broker_;
    std::string url_;
    OpenFlag open_;
    std::shared_ptr<SubscriptionIds> subscriptions_;
};

class MemoryKVContext : public KV::IKVContext {
public:
    MemoryKVContext(std::shared_ptr<MemoryBroker> broker, OpenFlag connection_open);

    Net::Result<std::unique_ptr<KV::IKeyValueBucket>> CreateOrAttachBucket(
        const KV::BucketConfig& config) override;
    void Close() override;

private:
    std::shared_ptr<MemoryBroker> broker_;
    OpenFlag connection_open_;
    bool closed_ = false;
};

class MemoryKeyValueBucket : public KV::IKeyValueBucket {
public:
    MemoryKeyValueBucket(std::shared_ptr<MemoryBroker> broker, KV::BucketConfig config,
                         OpenFlag connection_open);

    Net::Result<uint64_t> Put(const std::string& key, const std::vector<uint8_t>& value,
                              std::chrono::milliseconds timeout) override;
    Net::Result<KV::KVEntry> Get(const std::string& key,
                                 std::chrono::milliseconds timeout) override;
    Net::Result<std::unique_ptr<KV::IEntryStream>> WatchAll(
        std::chrono::milliseconds idle_timeout) override;
    void Close() override;
    const KV::BucketConfig& GetConfig() const override { return config_; }

private:
    /**
     * @brief Error message if the handle can no longer be used
     */
    std::optional<std::string> Unusable() const;

    std::shared_ptr<MemoryBroker> broker_;
    KV::BucketConfig config_;
    OpenFlag connection_open_;
    bool closed_ = false;
};

/**
 * @brief Entry stream over a snapshot taken when the watch started
 */
class MemoryEntryStream : public KV::IEntryStream {
public:
    explicit MemoryEntryStream(std::vector<KV::KVEntry> entries);

    Net::Result<std::optional<KV::KVEntry>> Next() override;
    void Stop() override;

private:
    std::vector<KV::KVEntry> entries_;
    size_t position_ = 0;
    bool stopped_ = false;
};

}  // namespace HPL::Memory
