#include "hpl/memory/MemoryConnection.hpp"

#include "hpl/kv/KeyRules.hpp"
#include "hpl/net/Logging.hpp"
#include "hpl/net/Subject.hpp"

namespace HPL::Memory {

// === MemoryConnection ===

MemoryConnection::MemoryConnection(std::shared_ptr<MemoryBroker> broker, std::string url)
    : broker_(std::move(broker)),
      url_(std::move(url)),
      open_(std::make_shared<std::atomic<bool>>(true)),
      subscriptions_(std::make_shared<SubscriptionIds>())
{
}

MemoryConnection::~MemoryConnection() { Close(); }

bool MemoryConnection::IsConnected() const { return open_->load() && broker_->IsRunning(); }

Net::Status MemoryConnection::Publish(const std::string& subject,
                                      const std::vector<uint8_t>& data)
{
    if (!IsConnected()) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Publish", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, false)) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::INVALID_KEY, "Publish", subject, "invalid subject"));
    }

    Net::Message msg;
    msg.subject = subject;
    msg.data = data;
    auto routed = broker_->Route(msg);
    if (!Net::isOk(routed)) {
        return Net::Err<std::monostate>(
            Net::Error::Wrap(Net::Error::PUBLISH_ERROR, "Publish", subject, Net::getError(routed)));
    }
    return Net::Ok();
}

Net::Result<std::unique_ptr<Net::Subscription>> MemoryConnection::Subscribe(
    const std::string& subject)
{
    using SubResult = std::unique_ptr<Net::Subscription>;
    if (!IsConnected()) {
        return Net::Err<SubResult>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Subscribe", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, true)) {
        return Net::Err<SubResult>(
            Net::Error(Net::Error::INVALID_KEY, "Subscribe", subject, "invalid subject"));
    }

    auto queue = std::make_shared<Net::MessageQueue>();
    auto added = broker_->AddSubscription(subject, queue);
    if (!Net::isOk(added)) {
        return Net::Err<SubResult>(Net::Error::Wrap(Net::Error::SUBSCRIBE_ERROR, "Subscribe",
                                                    subject, Net::getError(added)));
    }
    uint64_t id = Net::getValue(added);
    {
        std::lock_guard<std::mutex> lock(subscriptions_->mutex);
        subscriptions_->ids.insert(id);
    }

    std::weak_ptr<MemoryBroker> weak_broker = broker_;
    std::weak_ptr<SubscriptionIds> weak_ids = subscriptions_;
    auto cancel = [weak_broker, weak_ids, id] {
        if (auto tracked = weak_ids.lock()) {
            std::lock_guard<std::mutex> lock(tracked->mutex);
            tracked->ids.erase(id);
        }
        if (auto broker = weak_broker.lock()) {
            broker->RemoveSubscription(id);
        }
    };
    return Net::Ok(std::make_unique<Net::Subscription>(subject, queue, cancel));
}

Net::Result<Net::Message> MemoryConnection::Request(const std::string& subject,
                                                    const std::vector<uint8_t>& data,
                                                    std::chrono::milliseconds timeout)
{
    if (!IsConnected()) {
        return Net::Err<Net::Message>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Request", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, false)) {
        return Net::Err<Net::Message>(
            Net::Error(Net::Error::INVALID_KEY, "Request", subject, "invalid subject"));
    }

    auto inbox = broker_->NewInbox();
    auto queue = std::make_shared<Net::MessageQueue>(1);
    auto added = broker_->AddSubscription(inbox, queue);
    if (!Net::isOk(added)) {
        return Net::Err<Net::Message>(Net::Error::Wrap(Net::Error::REQUEST_ERROR, "Request",
                                                       subject, Net::getError(added)));
    }
    uint64_t inbox_id = Net::getValue(added);

    Net::Message msg;
    msg.subject = subject;
    msg.reply = inbox;
    msg.data = data;
    auto routed = broker_->Route(msg);

    Net::Result<Net::Message> result = Net::Err<Net::Message>(
        Net::Error(Net::Error::TIMEOUT, "Request", subject,
                   "no reply within " + std::to_string(timeout.count()) + " ms"));
    if (!Net::isOk(routed)) {
        result = Net::Err<Net::Message>(Net::Error::Wrap(Net::Error::REQUEST_ERROR, "Request",
                                                         subject, Net::getError(routed)));
    } else if (Net::getValue(routed) == 0) {
        result = Net::Err<Net::Message>(
            Net::Error(Net::Error::REQUEST_ERROR, "Request", subject, "no responders"));
    } else if (auto reply = queue->Pop(timeout)) {
        result = Net::Ok(std::move(*reply));
    }

    broker_->RemoveSubscription(inbox_id);
    return result;
}

Net::Status MemoryConnection::Flush(std::chrono::milliseconds)
{
    // Routing is synchronous, nothing is ever pending
    if (!IsConnected()) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Flush", url_, "connection closed"));
    }
    return Net::Ok();
}

Net::Result<std::unique_ptr<KV::IKVContext>> MemoryConnection::GetKVContext(
    std::chrono::milliseconds)
{
    if (!IsConnected()) {
        return Net::Err<std::unique_ptr<KV::IKVContext>>(
            Net::Error(Net::Error::CONTEXT_ERROR, "GetKVContext", url_, "connection closed"));
    }
    std::unique_ptr<KV::IKVContext> ctx = std::make_unique<MemoryKVContext>(broker_, open_);
    return Net::Ok(std::move(ctx));
}

void MemoryConnection::Close()
{
    if (!open_->exchange(false)) {
        return;
    }

    std::set<uint64_t> ids;
    {
        std::lock_guard<std::mutex> lock(subscriptions_->mutex);
        ids.swap(subscriptions_->ids);
    }
    for (auto id : ids) {
        broker_->RemoveSubscription(id);
    }
    Net::GetLogger("hpl.memory")->debug("connection to {} closed", url_);
}

size_t MemoryConnection::GetSubscriptionCount() const
{
    std::lock_guard<std::mutex> lock(subscriptions_->mutex);
    return subscriptions_->ids.size();
}

// === MemoryKVContext ===

MemoryKVContext::MemoryKVContext(std::shared_ptr<MemoryBroker> broker, OpenFlag connection_open)
    : broker_(std::move(broker)), connection_open_(std::move(connection_open))
{
}

Net::Result<std::unique_ptr<KV::IKeyValueBucket>> MemoryKVContext::CreateOrAttachBucket(
    const KV::BucketConfig& config)
{
    using BucketResult = std::unique_ptr<KV::IKeyValueBucket>;
    if (closed_ || !connection_open_->load() || !broker_->IsRunning()) {
        return Net::Err<BucketResult>(Net::Error(Net::Error::BUCKET_ERROR,
                                                 "CreateOrAttachBucket", config.name,
                                                 "connection closed"));
    }

    auto logger = Net::GetLogger("hpl.memory");
    auto created = broker_->CreateBucket(config);
    if (Net::isOk(created)) {
        logger->debug("created bucket '{}'", config.name);
        return Net::Ok<BucketResult>(
            std::make_unique<MemoryKeyValueBucket>(broker_, config, connection_open_));
    }

    // Someone else created it first: attach to what is there
    auto existing = broker_->LookupBucket(config.name);
    if (!Net::isOk(existing)) {
        return Net::Err<BucketResult>(Net::Error(
            Net::Error::BUCKET_ERROR, "CreateOrAttachBucket", config.name,
            Net::getError(created).message + "; attach failed: " + Net::getError(existing).message));
    }

    logger->debug("attached to existing bucket '{}'", config.name);
    return Net::Ok<BucketResult>(std::make_unique<MemoryKeyValueBucket>(
        broker_, Net::getValue(existing), connection_open_));
}

void MemoryKVContext::Close() { closed_ = true; }

// === MemoryKeyValueBucket ===

MemoryKeyValueBucket::MemoryKeyValueBucket(std::shared_ptr<MemoryBroker> broker,
                                           KV::BucketConfig config, OpenFlag connection_open)
    : broker_(std::move(broker)),
      config_(std::move(config)),
      connection_open_(std::move(connection_open))
{
}

std::optional<std::string> MemoryKeyValueBucket::Unusable() const
{
    if (closed_) {
        return std::string("bucket handle is closed");
    }
    if (!connection_open_->load() || !broker_->IsRunning()) {
        return std::string("connection closed");
    }
    return std::nullopt;
}

Net::Result<uint64_t> MemoryKeyValueBucket::Put(const std::string& key,
                                                const std::vector<uint8_t>& value,
                                                std::chrono::milliseconds)
{
    if (auto reason = Unusable()) {
        return Net::Err<uint64_t>(Net::Error(Net::Error::WRITE_ERROR, "Put", key, *reason));
    }
    return broker_->Put(config_.name, key, value);
}

Net::Result<KV::KVEntry> MemoryKeyValueBucket::Get(const std::string& key,
                                                   std::chrono::milliseconds)
{
    if (auto reason = Unusable()) {
        return Net::Err<KV::KVEntry>(Net::Error(Net::Error::READ_ERROR, "Get", key, *reason));
    }
    return broker_->Get(config_.name, key);
}

Net::Result<std::unique_ptr<KV::IEntryStream>> MemoryKeyValueBucket::WatchAll(
    std::chrono::milliseconds)
{
    using StreamResult = std::unique_ptr<KV::IEntryStream>;
    if (auto reason = Unusable()) {
        return Net::Err<StreamResult>(
            Net::Error(Net::Error::READ_ERROR, "WatchAll", config_.name, *reason));
    }

    auto snapshot = broker_->Snapshot(config_.name);
    if (!Net::isOk(snapshot)) {
        return Net::Err<StreamResult>(Net::Error(Net::getError(snapshot)));
    }
    return Net::Ok<StreamResult>(
        std::make_unique<MemoryEntryStream>(Net::takeValue(snapshot)));
}

void MemoryKeyValueBucket::Close() { closed_ = true; }

// === MemoryEntryStream ===

MemoryEntryStream::MemoryEntryStream(std::vector<KV::KVEntry> entries)
    : entries_(std::move(entries))
{
}

Net::Result<std::optional<KV::KVEntry>> MemoryEntryStream::Next()
{
    if (stopped_ || position_ >= entries_.size()) {
        return Net::Ok(std::optional<KV::KVEntry>{});
    }
    return Net::Ok(std::optional<KV::KVEntry>{entries_[position_++]});
}

void MemoryEntryStream::Stop() { stopped_ = true; }

}  // namespace HPL::Memory
