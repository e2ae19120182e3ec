#include "hpl/presence/PresenceTracker.hpp"

#include <cerrno>
#include <cstdlib>
#include <map>
#include <utility>

#include "hpl/net/Logging.hpp"
#include "hpl/net/Message.hpp"
#include "hpl/presence/PresenceKey.hpp"

namespace HPL::Presence {

namespace {

constexpr const char* kClosedMessage = "tracker is closed";

int64_t CurrentUnixSeconds()
{
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

int64_t ParseUnixSeconds(const std::string& text)
{
    if (text.empty()) {
        return 0;
    }
    errno = 0;
    char* end = nullptr;
    long long value = std::strtoll(text.c_str(), &end, 10);
    if (errno != 0 || end == nullptr || *end != '\0') {
        return 0;
    }
    return static_cast<int64_t>(value);
}

// TIMEOUT passes through unchanged; anything else becomes `code`
Net::Error Classify(Net::Error::Code code, const std::string& op, const std::string& key,
                    const Net::Error& cause)
{
    if (cause.code == Net::Error::TIMEOUT) {
        return Net::Error::Wrap(Net::Error::TIMEOUT, op, key, cause);
    }
    return Net::Error::Wrap(code, op, key, cause);
}

Net::Error NonPositiveTimeout(const std::string& op, const std::string& key)
{
    return Net::Error(Net::Error::CONFIGURATION_ERROR, op, key, "timeout must be positive");
}

}  // namespace

// === Construction ===

Net::Result<std::unique_ptr<PresenceTracker>> PresenceTracker::Initialize(
    const PresenceConfig& config, const Net::Connector& connector)
{
    using TrackerResult = std::unique_ptr<PresenceTracker>;

    auto valid = config.Validate();
    if (!Net::isOk(valid)) {
        return Net::Err<TrackerResult>(Net::Error(Net::getError(valid)));
    }
    if (!connector) {
        return Net::Err<TrackerResult>(Net::Error(Net::Error::CONFIGURATION_ERROR, "Initialize",
                                                  config.url, "no connector supplied"));
    }

    auto logger = Net::GetLogger("hpl.presence");

    auto connected = connector(config.url);
    if (!Net::isOk(connected)) {
        return Net::Err<TrackerResult>(Net::Error::Wrap(Net::Error::CONNECTION_ERROR, "Initialize",
                                                        config.url, Net::getError(connected)));
    }
    auto connection = Net::takeValue(connected);

    auto context_result = connection->GetKVContext(config.operation_timeout);
    if (!Net::isOk(context_result)) {
        connection->Close();
        return Net::Err<TrackerResult>(Net::Error::Wrap(Net::Error::CONNECTION_ERROR, "Initialize",
                                                        config.url,
                                                        Net::getError(context_result)));
    }
    auto context = Net::takeValue(context_result);

    KV::BucketConfig bucket_config;
    bucket_config.name = config.bucket_name;
    bucket_config.description = "presence domain";
    bucket_config.ttl = std::chrono::duration_cast<std::chrono::milliseconds>(config.ttl);
    bucket_config.max_value_size = config.max_value_size;
    bucket_config.history = 1;

    auto bucket_result = context->CreateOrAttachBucket(bucket_config);
    if (!Net::isOk(bucket_result)) {
        context->Close();
        connection->Close();
        return Net::Err<TrackerResult>(Net::Error::Wrap(Net::Error::BUCKET_ERROR, "Initialize",
                                                        config.bucket_name,
                                                        Net::getError(bucket_result)));
    }

    auto tracker = std::make_unique<PresenceTracker>(config, std::move(connection),
                                                     std::move(context),
                                                     Net::takeValue(bucket_result));
    logger->info("client '{}' tracking presence in bucket '{}' (ttl {} ms) at {}",
                 config.client_id, config.bucket_name, tracker->GetBucketTtl().count(),
                 config.url);
    return Net::Ok(std::move(tracker));
}

Net::Result<std::unique_ptr<PresenceTracker>> PresenceTracker::Initialize(
    const std::string& url, const std::string& bucket_name, const std::string& client_id,
    int64_t ttl_seconds, const Net::Connector& connector)
{
    PresenceConfig config;
    config.url = url;
    config.bucket_name = bucket_name;
    config.client_id = client_id;
    config.ttl = std::chrono::seconds(ttl_seconds);
    return Initialize(config, connector);
}

PresenceTracker::PresenceTracker(PresenceConfig config,
                                 std::unique_ptr<Net::IConnection> connection,
                                 std::unique_ptr<KV::IKVContext> context,
                                 std::unique_ptr<KV::IKeyValueBucket> bucket)
    : config_(std::move(config)),
      connection_(std::move(connection)),
      context_(std::move(context)),
      bucket_(std::move(bucket))
{
    bucket_ttl_ = bucket_ ? bucket_->GetConfig().ttl
                          : std::chrono::duration_cast<std::chrono::milliseconds>(config_.ttl);
}

PresenceTracker::~PresenceTracker() { Close(); }

// === Write path ===

Net::Status PresenceTracker::SendHeartbeat()
{
    return SendHeartbeat(config_.operation_timeout);
}

Net::Status PresenceTracker::SendHeartbeat(std::chrono::milliseconds timeout)
{
    const std::string key = MakePresenceKey(config_.client_id);
    if (timeout.count() <= 0) {
        return Net::Err<std::monostate>(NonPositiveTimeout("SendHeartbeat", key));
    }
    if (closed_ || !bucket_) {
        return Net::Err<std::monostate>(
            Net::Error(Net::Error::HEARTBEAT_ERROR, "SendHeartbeat", key, kClosedMessage));
    }

    auto written = bucket_->Put(key, Net::ToBytes(std::to_string(CurrentUnixSeconds())), timeout);
    if (!Net::isOk(written)) {
        return Net::Err<std::monostate>(
            Classify(Net::Error::HEARTBEAT_ERROR, "SendHeartbeat", key, Net::getError(written)));
    }

    last_revision_ = Net::getValue(written);
    ++heartbeats_sent_;
    Net::GetLogger("hpl.presence")->trace("heartbeat {} revision {}", key, last_revision_);
    return Net::Ok();
}

// === Read path ===

Net::Result<bool> PresenceTracker::IsPresent(const std::string& client_id)
{
    return IsPresent(client_id, config_.operation_timeout);
}

Net::Result<bool> PresenceTracker::IsPresent(const std::string& client_id,
                                             std::chrono::milliseconds timeout)
{
    if (!IsValidClientId(client_id)) {
        return Net::Err<bool>(Net::Error(Net::Error::CONFIGURATION_ERROR, "IsPresent", client_id,
                                         "invalid client id"));
    }
    const std::string key = MakePresenceKey(client_id);
    if (timeout.count() <= 0) {
        return Net::Err<bool>(NonPositiveTimeout("IsPresent", key));
    }
    if (closed_ || !bucket_) {
        return Net::Err<bool>(
            Net::Error(Net::Error::PRESENCE_CHECK_ERROR, "IsPresent", key, kClosedMessage));
    }

    auto entry = bucket_->Get(key, timeout);
    if (Net::isOk(entry)) {
        return Net::Ok(true);
    }
    const auto& error = Net::getError(entry);
    if (error.code == Net::Error::NOT_FOUND) {
        return Net::Ok(false);
    }
    return Net::Err<bool>(Classify(Net::Error::PRESENCE_CHECK_ERROR, "IsPresent", key, error));
}

Net::Result<bool> PresenceTracker::IsSelfPresent()
{
    return IsPresent(config_.client_id, config_.operation_timeout);
}

Net::Result<bool> PresenceTracker::IsSelfPresent(std::chrono::milliseconds timeout)
{
    return IsPresent(config_.client_id, timeout);
}

Net::Result<std::set<std::string>> PresenceTracker::ListPresent()
{
    return ListPresent(config_.list_idle_timeout);
}

Net::Result<std::set<std::string>> PresenceTracker::ListPresent(
    std::chrono::milliseconds idle_timeout)
{
    auto records = Enumerate("ListPresent", idle_timeout);
    if (!Net::isOk(records)) {
        return Net::Err<std::set<std::string>>(Net::Error(Net::getError(records)));
    }

    std::set<std::string> present;
    for (const auto& record : Net::getValue(records)) {
        present.insert(record.client_id);
    }
    return Net::Ok(std::move(present));
}

Net::Result<std::vector<PresenceRecord>> PresenceTracker::ListPresenceEntries()
{
    return ListPresenceEntries(config_.list_idle_timeout);
}

Net::Result<std::vector<PresenceRecord>> PresenceTracker::ListPresenceEntries(
    std::chrono::milliseconds idle_timeout)
{
    return Enumerate("ListPresenceEntries", idle_timeout);
}

Net::Result<std::vector<PresenceRecord>> PresenceTracker::Enumerate(
    const std::string& op, std::chrono::milliseconds idle_timeout)
{
    using Records = std::vector<PresenceRecord>;
    if (idle_timeout.count() <= 0) {
        return Net::Err<Records>(NonPositiveTimeout(op, config_.bucket_name));
    }
    if (closed_ || !bucket_) {
        return Net::Err<Records>(Net::Error(Net::Error::PRESENCE_CHECK_ERROR, op,
                                            config_.bucket_name, kClosedMessage));
    }

    auto watch = bucket_->WatchAll(idle_timeout);
    if (!Net::isOk(watch)) {
        return Net::Err<Records>(Classify(Net::Error::PRESENCE_CHECK_ERROR, op,
                                          config_.bucket_name, Net::getError(watch)));
    }
    auto stream = Net::takeValue(watch);

    // Latest revision per client; a watch may replay older revisions first,
    // and a delete or purge marker hides every earlier put
    std::map<std::string, std::pair<PresenceRecord, bool>> latest;
    size_t scanned = 0;
    while (true) {
        auto next = stream->Next();
        if (!Net::isOk(next)) {
            stream->Stop();
            return Net::Err<Records>(Classify(Net::Error::PRESENCE_CHECK_ERROR, op,
                                              config_.bucket_name, Net::getError(next)));
        }
        const auto& entry = Net::getValue(next);
        if (!entry) {
            break;
        }
        ++scanned;
        auto client_id = ParsePresenceKey(entry->key);
        if (!client_id) {
            continue;
        }

        auto it = latest.find(*client_id);
        if (it != latest.end() && it->second.first.revision > entry->revision) {
            continue;
        }
        PresenceRecord record;
        record.client_id = *client_id;
        record.last_heartbeat_unix = ParseUnixSeconds(entry->ValueAsString());
        record.revision = entry->revision;
        latest[*client_id] = {std::move(record), entry->operation == KV::KVOperation::Put};
    }
    stream->Stop();

    Records records;
    records.reserve(latest.size());
    for (auto& [client_id, state] : latest) {
        if (state.second) {
            records.push_back(std::move(state.first));
        }
    }
    Net::GetLogger("hpl.presence")
        ->debug("{} on '{}': {} present of {} entries", op, config_.bucket_name, records.size(),
                scanned);
    return Net::Ok(std::move(records));
}

// === Lifecycle ===

void PresenceTracker::Close()
{
    Close(config_.operation_timeout);
}

void PresenceTracker::Close(std::chrono::milliseconds timeout)
{
    if (closed_) {
        return;
    }
    closed_ = true;

    auto logger = Net::GetLogger("hpl.presence");

    if (bucket_) {
        bucket_->Close();
        bucket_.reset();
    }
    if (context_) {
        context_->Close();
        context_.reset();
    }
    if (connection_) {
        if (connection_->IsConnected()) {
            auto flushed =
                connection_->Flush(timeout.count() > 0 ? timeout : config_.operation_timeout);
            if (!Net::isOk(flushed)) {
                logger->warn("close of '{}': {}", config_.client_id,
                             Net::getError(flushed).ToString());
            }
        }
        connection_->Close();
        connection_.reset();
    }
    logger->info("client '{}' closed tracker on bucket '{}'", config_.client_id,
                 config_.bucket_name);
}

std::chrono::milliseconds PresenceTracker::GetBucketTtl() const
{
    return bucket_ttl_;
}

}  // namespace HPL::Presence
