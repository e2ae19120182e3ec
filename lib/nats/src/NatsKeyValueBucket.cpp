#include "hpl/nats/NatsKeyValueBucket.hpp"

#include "NatsStatus.hpp"
#include "hpl/kv/KeyRules.hpp"
#include "hpl/net/Logging.hpp"

namespace HPL::Nats {

namespace {

// Distinct per-call timeouts kept open beside the default one
constexpr size_t kMaxExtraHandles = 8;

KV::KVEntry CopyEntry(kvEntry* e)
{
    KV::KVEntry entry;
    const char* bucket = kvEntry_Bucket(e);
    if (bucket != nullptr) {
        entry.bucket = bucket;
    }
    entry.key = kvEntry_Key(e);
    const auto* value = static_cast<const uint8_t*>(kvEntry_Value(e));
    int length = kvEntry_ValueLen(e);
    if (value != nullptr && length > 0) {
        entry.value.assign(value, value + length);
    }
    entry.revision = kvEntry_Revision(e);
    entry.created_unix_ns = kvEntry_Created(e);

    switch (kvEntry_Operation(e)) {
    case kvOp_Delete:
        entry.operation = KV::KVOperation::Delete;
        break;
    case kvOp_Purge:
        entry.operation = KV::KVOperation::Purge;
        break;
    default:
        entry.operation = KV::KVOperation::Put;
        break;
    }
    return entry;
}

}  // namespace

Net::Result<jsCtx*> OpenJetStream(const NatsConnectionPtr& conn,
                                  std::chrono::milliseconds timeout)
{
    jsOptions options;
    natsStatus s = jsOptions_Init(&options);
    if (s != NATS_OK) {
        return Net::Err<jsCtx*>(Net::Error(Net::Error::CONTEXT_ERROR, "GetKVContext", "",
                                           StatusText(s)));
    }
    options.Wait = ToMillis(timeout);

    jsCtx* js = nullptr;
    s = natsConnection_JetStream(&js, conn.get(), &options);
    if (s != NATS_OK) {
        return Net::Err<jsCtx*>(Net::Error(Net::Error::CONTEXT_ERROR, "GetKVContext", "",
                                           StatusText(s)));
    }
    return Net::Ok(std::move(js));
}

// === NatsKVContext ===

NatsKVContext::NatsKVContext(NatsConnectionPtr conn, jsCtx* js, std::chrono::milliseconds timeout)
    : conn_(std::move(conn)), js_(js), timeout_(timeout)
{
}

NatsKVContext::~NatsKVContext() { Close(); }

Net::Result<std::unique_ptr<KV::IKeyValueBucket>> NatsKVContext::CreateOrAttachBucket(
    const KV::BucketConfig& config)
{
    using BucketResult = std::unique_ptr<KV::IKeyValueBucket>;
    if (js_ == nullptr) {
        return Net::Err<BucketResult>(Net::Error(Net::Error::BUCKET_ERROR, "CreateOrAttachBucket",
                                                 config.name, "context is closed"));
    }

    auto logger = Net::GetLogger("hpl.nats");

    kvConfig cfg;
    natsStatus s = kvConfig_Init(&cfg);
    if (s != NATS_OK) {
        return Net::Err<BucketResult>(Net::Error(Net::Error::BUCKET_ERROR, "CreateOrAttachBucket",
                                                 config.name, StatusText(s)));
    }
    cfg.Bucket = config.name.c_str();
    if (!config.description.empty()) {
        cfg.Description = config.description.c_str();
    }
    cfg.TTL = std::chrono::duration_cast<std::chrono::nanoseconds>(config.ttl).count();
    cfg.MaxValueSize = config.max_value_size;
    cfg.History = config.history;

    kvStore* kv = nullptr;
    s = js_CreateKeyValue(&kv, js_, &cfg);
    if (s == NATS_OK) {
        logger->debug("created bucket '{}'", config.name);
        return Net::Ok<BucketResult>(
            std::make_unique<NatsKeyValueBucket>(conn_, config, kv, timeout_));
    }

    // Typically "already in use": attach to the existing bucket instead
    std::string create_text = StatusText(s);
    s = js_KeyValue(&kv, js_, config.name.c_str());
    if (s != NATS_OK) {
        return Net::Err<BucketResult>(Net::Error(
            Net::Error::BUCKET_ERROR, "CreateOrAttachBucket", config.name,
            "create failed: " + create_text + "; attach failed: " + StatusText(s)));
    }
    logger->debug("attached to existing bucket '{}' ({})", config.name, create_text);

    KV::BucketConfig actual = config;
    kvStatus* status = nullptr;
    if (kvStore_Status(&status, kv) == NATS_OK) {
        actual.ttl = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::nanoseconds(kvStatus_TTL(status)));
        kvStatus_Destroy(status);
        if (actual.ttl != config.ttl) {
            logger->warn("bucket '{}' exists with ttl {} ms, requested {} ms", config.name,
                         actual.ttl.count(), config.ttl.count());
        }
    }
    return Net::Ok<BucketResult>(
        std::make_unique<NatsKeyValueBucket>(conn_, actual, kv, timeout_));
}

void NatsKVContext::Close()
{
    if (js_ != nullptr) {
        jsCtx_Destroy(js_);
        js_ = nullptr;
    }
}

// === NatsKeyValueBucket ===

NatsKeyValueBucket::NatsKeyValueBucket(NatsConnectionPtr conn, KV::BucketConfig config,
                                       kvStore* kv, std::chrono::milliseconds default_timeout)
    : conn_(std::move(conn)), config_(std::move(config)), default_timeout_(default_timeout)
{
    handles_[ToMillis(default_timeout_)] = Handle{nullptr, kv};
}

NatsKeyValueBucket::~NatsKeyValueBucket() { Close(); }

Net::Result<kvStore*> NatsKeyValueBucket::StoreFor(std::chrono::milliseconds timeout,
                                                   Net::Error::Code code, const std::string& op,
                                                   const std::string& key)
{
    if (closed_) {
        return Net::Err<kvStore*>(Net::Error(code, op, key, "bucket handle is closed"));
    }
    if (timeout.count() <= 0) {
        return Net::Err<kvStore*>(Net::Error(code, op, key, "timeout must be positive"));
    }

    auto it = handles_.find(ToMillis(timeout));
    if (it != handles_.end()) {
        return Net::Ok(std::move(it->second.kv));
    }

    // Too many distinct timeouts: drop every extra handle and start over.
    // Watchers only ever use the default handle, so nothing still refers to these.
    if (handles_.size() > kMaxExtraHandles) {
        for (auto extra = handles_.begin(); extra != handles_.end();) {
            if (extra->second.js == nullptr) {
                ++extra;
                continue;
            }
            kvStore_Destroy(extra->second.kv);
            jsCtx_Destroy(extra->second.js);
            extra = handles_.erase(extra);
        }
        Net::GetLogger("hpl.nats")->debug("bucket '{}': released per-timeout handles",
                                          config_.name);
    }

    auto js = OpenJetStream(conn_, timeout);
    if (!Net::isOk(js)) {
        return Net::Err<kvStore*>(Net::Error::Wrap(code, op, key, Net::getError(js)));
    }

    Handle handle;
    handle.js = Net::getValue(js);
    natsStatus s = js_KeyValue(&handle.kv, handle.js, config_.name.c_str());
    if (s != NATS_OK) {
        jsCtx_Destroy(handle.js);
        return Net::Err<kvStore*>(ToError(s, code, op, key));
    }
    handles_[ToMillis(timeout)] = handle;
    return Net::Ok(std::move(handle.kv));
}

Net::Result<uint64_t> NatsKeyValueBucket::Put(const std::string& key,
                                              const std::vector<uint8_t>& value,
                                              std::chrono::milliseconds timeout)
{
    if (!KV::IsValidKey(key)) {
        return Net::Err<uint64_t>(Net::Error(Net::Error::INVALID_KEY, "Put", key, "invalid key"));
    }
    auto store = StoreFor(timeout, Net::Error::WRITE_ERROR, "Put", key);
    if (!Net::isOk(store)) {
        return Net::Err<uint64_t>(Net::Error(Net::getError(store)));
    }

    uint64_t revision = 0;
    natsStatus s = kvStore_Put(&revision, Net::getValue(store), key.c_str(), value.data(),
                               static_cast<int>(value.size()));
    if (s != NATS_OK) {
        return Net::Err<uint64_t>(ToError(s, Net::Error::WRITE_ERROR, "Put", key));
    }
    return Net::Ok(std::move(revision));
}

Net::Result<KV::KVEntry> NatsKeyValueBucket::Get(const std::string& key,
                                                 std::chrono::milliseconds timeout)
{
    if (!KV::IsValidKey(key)) {
        return Net::Err<KV::KVEntry>(Net::Error(Net::Error::INVALID_KEY, "Get", key, "invalid key"));
    }
    auto store = StoreFor(timeout, Net::Error::READ_ERROR, "Get", key);
    if (!Net::isOk(store)) {
        return Net::Err<KV::KVEntry>(Net::Error(Net::getError(store)));
    }

    kvEntry* e = nullptr;
    natsStatus s = kvStore_Get(&e, Net::getValue(store), key.c_str());
    if (s == NATS_NOT_FOUND) {
        return Net::Err<KV::KVEntry>(Net::Error(Net::Error::NOT_FOUND, "Get", key, "key not found"));
    }
    if (s != NATS_OK) {
        return Net::Err<KV::KVEntry>(ToError(s, Net::Error::READ_ERROR, "Get", key));
    }

    KV::KVEntry entry = CopyEntry(e);
    kvEntry_Destroy(e);
    return Net::Ok(std::move(entry));
}

Net::Result<std::unique_ptr<KV::IEntryStream>> NatsKeyValueBucket::WatchAll(
    std::chrono::milliseconds idle_timeout)
{
    using StreamResult = std::unique_ptr<KV::IEntryStream>;
    if (idle_timeout.count() <= 0) {
        return Net::Err<StreamResult>(Net::Error(Net::Error::READ_ERROR, "WatchAll", config_.name,
                                                 "idle timeout must be positive"));
    }
    auto store = StoreFor(default_timeout_, Net::Error::READ_ERROR, "WatchAll", config_.name);
    if (!Net::isOk(store)) {
        return Net::Err<StreamResult>(Net::Error(Net::getError(store)));
    }

    kvWatchOptions options;
    natsStatus s = kvWatchOptions_Init(&options);
    if (s == NATS_OK) {
        options.IgnoreDeletes = true;
    }

    kvWatcher* watcher = nullptr;
    if (s == NATS_OK) {
        s = kvStore_WatchAll(&watcher, Net::getValue(store), &options);
    }
    if (s != NATS_OK) {
        return Net::Err<StreamResult>(
            ToError(s, Net::Error::READ_ERROR, "WatchAll", config_.name));
    }
    return Net::Ok<StreamResult>(
        std::make_unique<NatsEntryStream>(conn_, watcher, config_.name, idle_timeout));
}

void NatsKeyValueBucket::Close()
{
    if (closed_) {
        return;
    }
    closed_ = true;

    // Stores first: each one references the context it was opened from
    for (auto& [timeout, handle] : handles_) {
        if (handle.kv != nullptr) {
            kvStore_Destroy(handle.kv);
        }
    }
    for (auto& [timeout, handle] : handles_) {
        if (handle.js != nullptr) {
            jsCtx_Destroy(handle.js);
        }
    }
    handles_.clear();
}

// === NatsEntryStream ===

NatsEntryStream::NatsEntryStream(NatsConnectionPtr conn, kvWatcher* watcher, std::string bucket,
                                 std::chrono::milliseconds idle_timeout)
    : conn_(std::move(conn)),
      watcher_(watcher),
      bucket_(std::move(bucket)),
      idle_timeout_(idle_timeout)
{
}

NatsEntryStream::~NatsEntryStream() { Stop(); }

Net::Result<std::optional<KV::KVEntry>> NatsEntryStream::Next()
{
    while (!done_ && watcher_ != nullptr) {
        kvEntry* e = nullptr;
        natsStatus s = kvWatcher_Next(&e, watcher_, ToMillis(idle_timeout_));
        if (s == NATS_TIMEOUT) {
            done_ = true;
            break;
        }
        if (s != NATS_OK) {
            done_ = true;
            return Net::Err<std::optional<KV::KVEntry>>(
                Net::Error(Net::Error::READ_ERROR, "WatchAll", bucket_, StatusText(s)));
        }
        if (e == nullptr) {
            // All values present when the watch started have been delivered
            done_ = true;
            break;
        }

        KV::KVEntry entry = CopyEntry(e);
        kvEntry_Destroy(e);
        if (entry.operation != KV::KVOperation::Put) {
            continue;
        }
        return Net::Ok(std::optional<KV::KVEntry>{std::move(entry)});
    }
    return Net::Ok(std::optional<KV::KVEntry>{});
}

void NatsEntryStream::Stop()
{
    done_ = true;
    if (watcher_ == nullptr) {
        return;
    }
    natsStatus s = kvWatcher_Stop(watcher_);
    if (s != NATS_OK) {
        Net::GetLogger("hpl.nats")->debug("stopping watcher on '{}': {}", bucket_, StatusText(s));
    }
    kvWatcher_Destroy(watcher_);
    watcher_ = nullptr;
}

}  // namespace HPL::Nats
