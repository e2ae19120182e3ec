/**
 * @file Subscription.hpp
 * @brief Message-passing handoff between a substrate and its consumer
 *
 * Substrates deliver decoded message copies into a MessageQueue from their
 * own threads (for the native client, from inside its C callback). The
 * consumer either pulls with NextMessage() or starts a dispatch thread that
 * runs a handler. Handler exceptions stop at the dispatch thread.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <queue>
#include <string>
#include <thread>

#include "hpl/net/Error.hpp"
#include "hpl/net/Message.hpp"

namespace HPL::Net {

/**
 * @brief Thread-safe bounded FIFO of received messages
 *
 * Once closed, Push() is refused and Pop() drains what is left, then
 * reports end of stream.
 */
class MessageQueue {
public:
    static constexpr size_t kDefaultMaxPending = 65536;

    explicit MessageQueue(size_t max_pending = kDefaultMaxPending)
        : max_pending_(max_pending)
    {
    }

    /**
     * @brief Enqueue a message
     * @return false if the queue is closed or full (the message is dropped)
     */
    bool Push(Message msg);

    /**
     * @brief Wait up to timeout for a message
     * @return The message, or nullopt on timeout or when closed and drained
     */
    std::optional<Message> Pop(std::chrono::milliseconds timeout);

    void Close();
    bool IsClosed() const;
    size_t Size() const;

    /**
     * @brief Number of messages refused because the queue was full
     */
    uint64_t GetDroppedCount() const { return dropped_.load(); }

private:
    size_t max_pending_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::queue<Message> queue_;
    bool closed_ = false;
    std::atomic<uint64_t> dropped_{0};
};

/**
 * @brief Consumer side of one subscription
 *
 * Usage:
 *   auto sub = getValue(conn->Subscribe("events.>"));
 *   auto msg = sub->NextMessage(1000ms);
 *
 *   // or push-style
 *   sub->Start([](const Message& m) { ... });
 */
class Subscription {
public:
    using Handler = std::function<void(const Message&)>;
    using CancelFn = std::function<void()>;

    /**
     * @param subject Subscription pattern
     * @param queue Queue the substrate delivers into
     * @param cancel Detaches the queue from the substrate; called once
     */
    Subscription(std::string subject, std::shared_ptr<MessageQueue> queue, CancelFn cancel);
    ~Subscription();

    Subscription(const Subscription&) = delete;
    Subscription& operator=(const Subscription&) = delete;

    /**
     * @brief Pull the next message
     * @return TIMEOUT if nothing arrived in time, SUBSCRIBE_ERROR if the
     *         subscription is closed and drained or a handler is running
     */
    Result<Message> NextMessage(std::chrono::milliseconds timeout);

    /**
     * @brief Dispatch every message to handler on a dedicated thread
     */
    Status Start(Handler handler);

    /**
     * @brief Stop delivery; idempotent
     *
     * Joins the dispatch thread, so it must not be called from the handler.
     */
    void Unsubscribe();

    const std::string& GetSubject() const { return subject_; }
    bool IsActive() const { return !queue_->IsClosed(); }
    size_t GetPendingCount() const { return queue_->Size(); }
    uint64_t GetDroppedCount() const { return queue_->GetDroppedCount(); }
    uint64_t GetHandlerErrorCount() const { return handler_errors_.load(); }

private:
    void DispatchLoop();

    std::string subject_;
    std::shared_ptr<MessageQueue> queue_;
    CancelFn cancel_;
    std::once_flag cancel_once_;

    Handler handler_;
    std::unique_ptr<std::thread> dispatch_thread_;
    std::atomic<uint64_t> handler_errors_{0};
};

}  // namespace HPL::Net
