#include "hpl/net/Subscription.hpp"

#include <exception>

#include "hpl/net/Logging.hpp"

namespace HPL::Net {

bool MessageQueue::Push(Message msg)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        if (queue_.size() >= max_pending_) {
            dropped_++;
            return false;
        }
        queue_.push(std::move(msg));
    }
    cond_.notify_one();
    return true;
}

std::optional<Message> MessageQueue::Pop(std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cond_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    Message msg = std::move(queue_.front());
    queue_.pop();
    return msg;
}

void MessageQueue::Close()
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cond_.notify_all();
}

bool MessageQueue::IsClosed() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t MessageQueue::Size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

Subscription::Subscription(std::string subject, std::shared_ptr<MessageQueue> queue,
                           CancelFn cancel)
    : subject_(std::move(subject)), queue_(std::move(queue)), cancel_(std::move(cancel))
{
}

Subscription::~Subscription() { Unsubscribe(); }

Result<Message> Subscription::NextMessage(std::chrono::milliseconds timeout)
{
    if (dispatch_thread_) {
        return Err<Message>(Error(Error::SUBSCRIBE_ERROR, "NextMessage", subject_,
                                  "messages are dispatched to a handler"));
    }

    auto msg = queue_->Pop(timeout);
    if (msg) {
        return Ok(std::move(*msg));
    }
    if (queue_->IsClosed()) {
        return Err<Message>(Error(Error::SUBSCRIBE_ERROR, "NextMessage", subject_,
                                  "subscription is closed"));
    }
    return Err<Message>(Error(Error::TIMEOUT, "NextMessage", subject_,
                              "no message within " + std::to_string(timeout.count()) + " ms"));
}

Status Subscription::Start(Handler handler)
{
    if (!handler) {
        return Err<std::monostate>(Error(Error::SUBSCRIBE_ERROR, "Start", subject_,
                                         "handler is empty"));
    }
    if (dispatch_thread_) {
        return Err<std::monostate>(Error(Error::SUBSCRIBE_ERROR, "Start", subject_,
                                         "handler already started"));
    }
    if (queue_->IsClosed()) {
        return Err<std::monostate>(Error(Error::SUBSCRIBE_ERROR, "Start", subject_,
                                         "subscription is closed"));
    }

    handler_ = std::move(handler);
    dispatch_thread_ = std::make_unique<std::thread>(&Subscription::DispatchLoop, this);
    return Ok();
}

void Subscription::Unsubscribe()
{
    std::call_once(cancel_once_, [this] {
        if (cancel_) {
            cancel_();
        }
    });
    queue_->Close();

    if (dispatch_thread_ && dispatch_thread_->joinable()) {
        dispatch_thread_->join();
    }
}

void Subscription::DispatchLoop()
{
    while (true) {
        auto msg = queue_->Pop(std::chrono::milliseconds(100));
        if (!msg) {
            if (queue_->IsClosed()) {
                break;
            }
            continue;
        }

        try {
            handler_(*msg);
        } catch (const std::exception& e) {
            handler_errors_++;
            GetLogger("hpl.net")->warn("handler for '{}' threw: {}", subject_, e.what());
        } catch (...) {
            handler_errors_++;
            GetLogger("hpl.net")->warn("handler for '{}' threw a non-standard exception",
                                       subject_);
        }
    }
}

}  // namespace HPL::Net
