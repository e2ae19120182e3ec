/**
 * @file NatsConnection.hpp
 * @brief Messaging connection backed by the NATS C client
 *
 * Thin pass-through: no reconnect policy, pooling or retries beyond what
 * nats.c does by itself.
 */

#pragma once

#include <nats/nats.h>

#include <chrono>
#include <memory>
#include <string>
#include <vector>

#include "hpl/nats/NatsLibrary.hpp"
#include "hpl/net/IConnection.hpp"

namespace HPL::Nats {

/**
 * @brief Native connection handle shared with contexts and buckets
 *
 * The deleter destroys the native connection and then drops its library
 * guard, so nats_Close() can only run after the last handle is gone.
 */
using NatsConnectionPtr = std::shared_ptr<natsConnection>;

struct NatsConnectOptions {
    std::string name = "hpl";                               ///< Client name shown by the server
    std::chrono::milliseconds connect_timeout{2000};        ///< Per-server connect timeout
};

class NatsConnection : public Net::IConnection {
public:
    /**
     * @brief Connect to a server (or comma separated list of servers)
     * @return CONNECTION_ERROR with the client's diagnostic text
     */
    static Net::Result<std::unique_ptr<Net::IConnection>> Connect(
        const std::string& url, const NatsConnectOptions& options = NatsConnectOptions{});

    /**
     * @brief Connector for PresenceTracker::Initialize
     */
    static Net::Connector GetConnector(const NatsConnectOptions& options = NatsConnectOptions{});

    ~NatsConnection() override;

    NatsConnection(const NatsConnection&) = delete;
    NatsConnection& operator=(const NatsConnection&) = delete;

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

private:
    NatsConnection(NatsConnectionPtr conn, std::string url);

    NatsConnectionPtr conn_;
    std::string url_;
    bool closed_ = false;
};

}  // namespace HPL::Nats
