/**
 * @file IConnection.hpp
 * @brief Messaging substrate connection interface
 *
 * A connection carries publish/subscribe and request/reply traffic and hands
 * out KV contexts. Implementations are thin pass-throughs onto a real
 * client library (hpl/nats) or an in-process broker (hpl/memory).
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "hpl/net/Error.hpp"
#include "hpl/net/Message.hpp"
#include "hpl/net/Subscription.hpp"

namespace HPL::KV {
class IKVContext;
}

namespace HPL::Net {

class IConnection {
public:
    virtual ~IConnection() = default;

    /**
     * @brief Publish a payload on a concrete (wildcard free) subject
     * @return PUBLISH_ERROR, INVALID_KEY for a bad subject, CONNECTION_ERROR if closed
     */
    virtual Status Publish(const std::string& subject, const std::vector<uint8_t>& data) = 0;

    /**
     * @brief Subscribe to a subject pattern
     * @return SUBSCRIBE_ERROR, INVALID_KEY for a bad pattern, CONNECTION_ERROR if closed
     */
    virtual Result<std::unique_ptr<Subscription>> Subscribe(const std::string& subject) = 0;

    /**
     * @brief Publish with a private reply subject and wait for the first reply
     * @return TIMEOUT if no reply arrived in time, REQUEST_ERROR otherwise
     */
    virtual Result<Message> Request(const std::string& subject,
                                    const std::vector<uint8_t>& data,
                                    std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Wait until everything published so far reached the server
     */
    virtual Status Flush(std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Acquire a context capable of KV operations
     * @return CONTEXT_ERROR, CONNECTION_ERROR if closed
     */
    virtual Result<std::unique_ptr<KV::IKVContext>> GetKVContext(
        std::chrono::milliseconds timeout) = 0;

    virtual bool IsConnected() const = 0;

    /**
     * @brief Close the connection; idempotent and never fails
     */
    virtual void Close() = 0;

    virtual const std::string& GetUrl() const = 0;
};

/**
 * @brief Opens a connection for a URL
 */
using Connector = std::function<Result<std::unique_ptr<IConnection>>(const std::string& url)>;

}  // namespace HPL::Net
