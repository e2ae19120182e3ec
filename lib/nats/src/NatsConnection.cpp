#include "hpl/nats/NatsConnection.hpp"

#include <exception>

#include "NatsStatus.hpp"
#include "hpl/nats/NatsKeyValueBucket.hpp"
#include "hpl/net/Logging.hpp"
#include "hpl/net/Subject.hpp"

namespace HPL::Nats {

namespace {

using QueueHandle = std::shared_ptr<Net::MessageQueue>;

Net::Message CopyMessage(natsMsg* msg)
{
    Net::Message copy;
    copy.subject = natsMsg_GetSubject(msg);
    const char* reply = natsMsg_GetReply(msg);
    if (reply != nullptr) {
        copy.reply = reply;
    }
    const char* data = natsMsg_GetData(msg);
    int length = natsMsg_GetDataLength(msg);
    if (data != nullptr && length > 0) {
        copy.data.assign(reinterpret_cast<const uint8_t*>(data),
                         reinterpret_cast<const uint8_t*>(data) + length);
    }
    return copy;
}

// Runs on a nats.c delivery thread. Nothing may propagate back into C.
void OnMessage(natsConnection*, natsSubscription*, natsMsg* msg, void* closure)
{
    auto* queue = static_cast<QueueHandle*>(closure);
    try {
        Net::Message copy = CopyMessage(msg);
        natsMsg_Destroy(msg);
        msg = nullptr;
        if (!(*queue)->Push(std::move(copy))) {
            Net::GetLogger("hpl.nats")->debug("dropped message: subscription queue closed or full");
        }
    } catch (const std::exception& e) {
        if (msg != nullptr) {
            natsMsg_Destroy(msg);
        }
        Net::GetLogger("hpl.nats")->warn("failed to hand off message: {}", e.what());
    }
}

// Called once nats.c guarantees no further OnMessage for this closure
void OnComplete(void* closure) { delete static_cast<QueueHandle*>(closure); }

}  // namespace

Net::Result<std::unique_ptr<Net::IConnection>> NatsConnection::Connect(
    const std::string& url, const NatsConnectOptions& options)
{
    using ConnResult = std::unique_ptr<Net::IConnection>;
    if (url.empty()) {
        return Net::Err<ConnResult>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Connect", url, "empty URL"));
    }

    auto library = NatsLibrary::Acquire();
    if (!Net::isOk(library)) {
        return Net::Err<ConnResult>(Net::Error::Wrap(Net::Error::CONNECTION_ERROR, "Connect",
                                                     url, Net::getError(library)));
    }

    natsOptions* opts = nullptr;
    natsConnection* raw = nullptr;
    natsStatus s = natsOptions_Create(&opts);
    if (s == NATS_OK) s = natsOptions_SetURL(opts, url.c_str());
    if (s == NATS_OK) s = natsOptions_SetName(opts, options.name.c_str());
    if (s == NATS_OK) s = natsOptions_SetTimeout(opts, ToMillis(options.connect_timeout));
    if (s == NATS_OK) s = natsConnection_Connect(&raw, opts);
    if (opts != nullptr) {
        natsOptions_Destroy(opts);
    }
    if (s != NATS_OK) {
        return Net::Err<ConnResult>(
            ToError(s, Net::Error::CONNECTION_ERROR, "Connect", url));
    }

    auto guard = Net::takeValue(library);
    NatsConnectionPtr conn(raw, [guard](natsConnection* nc) { natsConnection_Destroy(nc); });

    Net::GetLogger("hpl.nats")->info("connected to {}", url);
    return Net::Ok<ConnResult>(std::unique_ptr<NatsConnection>(new NatsConnection(conn, url)));
}

Net::Connector NatsConnection::GetConnector(const NatsConnectOptions& options)
{
    return [options](const std::string& url) { return Connect(url, options); };
}

NatsConnection::NatsConnection(NatsConnectionPtr conn, std::string url)
    : conn_(std::move(conn)), url_(std::move(url))
{
}

NatsConnection::~NatsConnection() { Close(); }

bool NatsConnection::IsConnected() const
{
    return !closed_ && natsConnection_Status(conn_.get()) == NATS_CONN_STATUS_CONNECTED;
}

Net::Status NatsConnection::Publish(const std::string& subject, const std::vector<uint8_t>& data)
{
    if (closed_) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Publish", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, false)) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::INVALID_KEY, "Publish", subject, "invalid subject"));
    }

    natsStatus s = natsConnection_Publish(conn_.get(), subject.c_str(), data.data(),
                                          static_cast<int>(data.size()));
    if (s != NATS_OK) {
        return Net::Err<std::monostate>(ToError(s, Net::Error::PUBLISH_ERROR, "Publish", subject));
    }
    return Net::Ok();
}

Net::Result<std::unique_ptr<Net::Subscription>> NatsConnection::Subscribe(
    const std::string& subject)
{
    using SubResult = std::unique_ptr<Net::Subscription>;
    if (closed_) {
        return Net::Err<SubResult>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Subscribe", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, true)) {
        return Net::Err<SubResult>(
            Net::Error(Net::Error::INVALID_KEY, "Subscribe", subject, "invalid subject"));
    }

    auto queue = std::make_shared<Net::MessageQueue>();
    auto* closure = new QueueHandle(queue);

    natsSubscription* sub = nullptr;
    natsStatus s = natsConnection_Subscribe(&sub, conn_.get(), subject.c_str(), OnMessage, closure);
    if (s == NATS_OK) {
        s = natsSubscription_SetOnCompleteCB(sub, OnComplete, closure);
    }
    if (s != NATS_OK) {
        if (sub != nullptr) {
            natsSubscription_Destroy(sub);
        }
        delete closure;
        return Net::Err<SubResult>(ToError(s, Net::Error::SUBSCRIBE_ERROR, "Subscribe", subject));
    }

    NatsConnectionPtr conn = conn_;
    auto cancel = [conn, sub, subject] {
        natsStatus us = natsSubscription_Unsubscribe(sub);
        if (us != NATS_OK) {
            Net::GetLogger("hpl.nats")->debug("unsubscribe '{}': {}", subject, StatusText(us));
        }
        natsSubscription_Destroy(sub);
    };
    return Net::Ok(std::make_unique<Net::Subscription>(subject, queue, cancel));
}

Net::Result<Net::Message> NatsConnection::Request(const std::string& subject,
                                                  const std::vector<uint8_t>& data,
                                                  std::chrono::milliseconds timeout)
{
    if (closed_) {
        return Net::Err<Net::Message>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Request", subject, "connection closed"));
    }
    if (!Net::IsValidSubject(subject, false)) {
        return Net::Err<Net::Message>(
            Net::Error(Net::Error::INVALID_KEY, "Request", subject, "invalid subject"));
    }

    natsMsg* reply = nullptr;
    natsStatus s = natsConnection_Request(&reply, conn_.get(), subject.c_str(), data.data(),
                                          static_cast<int>(data.size()), ToMillis(timeout));
    if (s != NATS_OK) {
        return Net::Err<Net::Message>(ToError(s, Net::Error::REQUEST_ERROR, "Request", subject));
    }

    Net::Message copy = CopyMessage(reply);
    natsMsg_Destroy(reply);
    return Net::Ok(std::move(copy));
}

Net::Status NatsConnection::Flush(std::chrono::milliseconds timeout)
{
    if (closed_) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Flush", url_, "connection closed"));
    }
    natsStatus s = natsConnection_FlushTimeout(conn_.get(), ToMillis(timeout));
    if (s != NATS_OK) {
        return Net::Err<std::monostate>(ToError(s, Net::Error::CONNECTION_ERROR, "Flush", url_));
    }
    return Net::Ok();
}

Net::Result<std::unique_ptr<KV::IKVContext>> NatsConnection::GetKVContext(
    std::chrono::milliseconds timeout)
{
    using CtxResult = std::unique_ptr<KV::IKVContext>;
    if (closed_) {
        return Net::Err<CtxResult>(
            Net::Error(Net::Error::CONTEXT_ERROR, "GetKVContext", url_, "connection closed"));
    }

    auto js = OpenJetStream(conn_, timeout);
    if (!Net::isOk(js)) {
        return Net::Err<CtxResult>(Net::Error(Net::getError(js)));
    }
    return Net::Ok<CtxResult>(
        std::make_unique<NatsKVContext>(conn_, Net::getValue(js), timeout));
}

void NatsConnection::Close()
{
    if (closed_) {
        return;
    }
    closed_ = true;
    natsConnection_Close(conn_.get());
    conn_.reset();
    Net::GetLogger("hpl.nats")->info("connection to {} closed", url_);
}

}  // namespace HPL::Nats
