#include "hpl/memory/MemoryBroker.hpp"

#include <algorithm>

#include "hpl/kv/KeyRules.hpp"
#include "hpl/memory/MemoryConnection.hpp"
#include "hpl/net/Logging.hpp"
#include "hpl/net/Subject.hpp"

namespace HPL::Memory {

namespace {

int64_t UnixNowNs()
{
    return std::chrono::duration_cast<std::chrono::nanoseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

}  // namespace

std::shared_ptr<MemoryBroker> MemoryBroker::Create(Clock clock)
{
    return std::shared_ptr<MemoryBroker>(new MemoryBroker(std::move(clock)));
}

MemoryBroker::MemoryBroker(Clock clock) : clock_(std::move(clock))
{
    if (!clock_) {
        clock_ = [] { return std::chrono::steady_clock::now(); };
    }
}

MemoryBroker::TimePoint MemoryBroker::Now() const { return clock_(); }

Net::Result<std::unique_ptr<Net::IConnection>> MemoryBroker::Connect(const std::string& url)
{
    if (url.rfind(kUrlScheme, 0) != 0) {
        return Net::Err<std::unique_ptr<Net::IConnection>>(Net::Error(
            Net::Error::CONNECTION_ERROR, "Connect", url,
            std::string("unsupported URL scheme, expected ") + kUrlScheme));
    }
    if (!running_) {
        return Net::Err<std::unique_ptr<Net::IConnection>>(
            Net::Error(Net::Error::CONNECTION_ERROR, "Connect", url, "no server available"));
    }

    std::unique_ptr<Net::IConnection> conn =
        std::make_unique<MemoryConnection>(shared_from_this(), url);
    return Net::Ok(std::move(conn));
}

Net::Connector MemoryBroker::GetConnector()
{
    auto self = shared_from_this();
    return [self](const std::string& url) { return self->Connect(url); };
}

void MemoryBroker::Shutdown()
{
    running_ = false;
    Net::GetLogger("hpl.memory")->info("broker shut down");
}

void MemoryBroker::Restart()
{
    running_ = true;
    Net::GetLogger("hpl.memory")->info("broker restarted");
}

Net::Status MemoryBroker::CreateBucket(const KV::BucketConfig& config)
{
    if (!KV::IsValidBucketName(config.name)) {
        return Net::Err<std::monostate>(Net::Error(Net::Error::BUCKET_ERROR, "CreateBucket",
                                                   config.name, "invalid bucket name"));
    }
    if (config.ttl.count() < 0) {
        return Net::Err<std::monostate>(Net::Error(Net::Error::BUCKET_ERROR, "CreateBucket",
                                                   config.name, "negative ttl"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (buckets_.count(config.name) != 0) {
        return Net::Err<std::monostate>(Net::Error(Net::Error::BUCKET_ERROR, "CreateBucket",
                                                   config.name, "bucket already exists"));
    }
    BucketState state;
    state.config = config;
    buckets_.emplace(config.name, std::move(state));
    return Net::Ok();
}

Net::Result<KV::BucketConfig> MemoryBroker::LookupBucket(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(name);
    if (it == buckets_.end()) {
        return Net::Err<KV::BucketConfig>(
            Net::Error(Net::Error::BUCKET_ERROR, "LookupBucket", name, "bucket not found"));
    }
    KV::BucketConfig config = it->second.config;
    return Net::Ok(std::move(config));
}

Net::Result<uint64_t> MemoryBroker::Put(const std::string& bucket, const std::string& key,
                                        const std::vector<uint8_t>& value)
{
    if (!KV::IsValidKey(key)) {
        return Net::Err<uint64_t>(
            Net::Error(Net::Error::INVALID_KEY, "Put", key, "invalid key"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return Net::Err<uint64_t>(
            Net::Error(Net::Error::WRITE_ERROR, "Put", key, "bucket '" + bucket + "' not found"));
    }

    BucketState& state = it->second;
    if (state.config.max_value_size >= 0 &&
        value.size() > static_cast<size_t>(state.config.max_value_size)) {
        return Net::Err<uint64_t>(Net::Error(
            Net::Error::WRITE_ERROR, "Put", key,
            "maximum value size exceeded (" + std::to_string(value.size()) + " > " +
                std::to_string(state.config.max_value_size) + ")"));
    }

    auto now = Now();
    PurgeExpired(state, now);

    StoredValue stored;
    stored.value = value;
    stored.revision = ++state.last_revision;
    stored.created_unix_ns = UnixNowNs();
    stored.expires = state.config.ttl.count() > 0;
    // Saturate rather than wrap for ttls reaching past the clock's range
    auto headroom = std::chrono::duration_cast<std::chrono::milliseconds>(
        TimePoint::max() - now);
    stored.expires_at = state.config.ttl < headroom ? now + state.config.ttl : TimePoint::max();
    state.values[key] = std::move(stored);

    return Net::Ok(uint64_t{state.last_revision});
}

Net::Result<KV::KVEntry> MemoryBroker::Get(const std::string& bucket, const std::string& key)
{
    if (!KV::IsValidKey(key)) {
        return Net::Err<KV::KVEntry>(
            Net::Error(Net::Error::INVALID_KEY, "Get", key, "invalid key"));
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return Net::Err<KV::KVEntry>(
            Net::Error(Net::Error::READ_ERROR, "Get", key, "bucket '" + bucket + "' not found"));
    }

    BucketState& state = it->second;
    PurgeExpired(state, Now());

    auto value_it = state.values.find(key);
    if (value_it == state.values.end()) {
        return Net::Err<KV::KVEntry>(Net::Error(Net::Error::NOT_FOUND, "Get", key, "key not found"));
    }

    KV::KVEntry entry;
    entry.bucket = bucket;
    entry.key = key;
    entry.value = value_it->second.value;
    entry.revision = value_it->second.revision;
    entry.created_unix_ns = value_it->second.created_unix_ns;
    return Net::Ok(std::move(entry));
}

Net::Result<std::vector<KV::KVEntry>> MemoryBroker::Snapshot(const std::string& bucket)
{
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = buckets_.find(bucket);
    if (it == buckets_.end()) {
        return Net::Err<std::vector<KV::KVEntry>>(Net::Error(
            Net::Error::READ_ERROR, "WatchAll", bucket, "bucket '" + bucket + "' not found"));
    }

    BucketState& state = it->second;
    PurgeExpired(state, Now());

    std::vector<KV::KVEntry> entries;
    entries.reserve(state.values.size());
    for (const auto& [key, stored] : state.values) {
        KV::KVEntry entry;
        entry.bucket = bucket;
        entry.key = key;
        entry.value = stored.value;
        entry.revision = stored.revision;
        entry.created_unix_ns = stored.created_unix_ns;
        entries.push_back(std::move(entry));
    }

    std::sort(entries.begin(), entries.end(),
              [](const KV::KVEntry& a, const KV::KVEntry& b) { return a.revision < b.revision; });
    return Net::Ok(std::move(entries));
}

bool MemoryBroker::DeleteBucket(const std::string& name)
{
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.erase(name) > 0;
}

size_t MemoryBroker::GetBucketCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return buckets_.size();
}

void MemoryBroker::PurgeExpired(BucketState& state, TimePoint now)
{
    for (auto it = state.values.begin(); it != state.values.end();) {
        if (it->second.expires && it->second.expires_at <= now) {
            it = state.values.erase(it);
        } else {
            ++it;
        }
    }
}

Net::Result<size_t> MemoryBroker::Route(const Net::Message& msg)
{
    std::lock_guard<std::mutex> lock(mutex_);
    size_t delivered = 0;
    for (auto& [id, sub] : subscriptions_) {
        if (!Net::SubjectMatches(sub.pattern, msg.subject)) {
            continue;
        }
        if (sub.queue->Push(msg)) {
            delivered++;
        }
    }
    return Net::Ok(size_t{delivered});
}

Net::Result<uint64_t> MemoryBroker::AddSubscription(const std::string& pattern,
                                                    std::shared_ptr<Net::MessageQueue> queue)
{
    std::lock_guard<std::mutex> lock(mutex_);
    uint64_t id = next_subscription_id_++;
    subscriptions_.emplace(id, SubscriptionEntry{pattern, std::move(queue)});
    return Net::Ok(uint64_t{id});
}

void MemoryBroker::RemoveSubscription(uint64_t id)
{
    std::shared_ptr<Net::MessageQueue> queue;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscriptions_.find(id);
        if (it == subscriptions_.end()) {
            return;
        }
        queue = it->second.queue;
        subscriptions_.erase(it);
    }
    queue->Close();
}

size_t MemoryBroker::GetSubscriptionCount() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return subscriptions_.size();
}

std::string MemoryBroker::NewInbox()
{
    std::lock_guard<std::mutex> lock(mutex_);
    return "_INBOX." + std::to_string(next_inbox_id_++);
}

}  // namespace HPL::Memory
