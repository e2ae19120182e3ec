#include "hpl/presence/PresenceConfig.hpp"

#include <fstream>
#include <iterator>
#include <limits>

#include "hpl/kv/KeyRules.hpp"
#include "hpl/net/Logging.hpp"
#include "hpl/presence/PresenceKey.hpp"

namespace HPL::Presence {

namespace {

// Decimal int64 Unix timestamp
constexpr int32_t kMinValueSize = 19;

// Largest ttl whose nanosecond count still fits an int64
constexpr int64_t kMaxTtlSeconds = std::numeric_limits<int64_t>::max() / 1000000000;

Net::Status Invalid(const std::string& field, const std::string& reason)
{
    return Net::Err<std::monostate>(
        Net::Error(Net::Error::CONFIGURATION_ERROR, "PresenceConfig", field, reason));
}

}  // namespace

Net::Status PresenceConfig::Validate() const
{
    if (url.empty()) {
        return Invalid("url", "must not be empty");
    }
    if (!KV::IsValidBucketName(bucket_name)) {
        return Invalid("bucket", "'" + bucket_name +
                                     "' is not a valid bucket name (letters, digits, '_' and '-')");
    }
    if (!IsValidClientId(client_id)) {
        return Invalid("client_id", "'" + client_id + "' is not a valid client id");
    }
    if (ttl.count() <= 0) {
        return Invalid("ttl_seconds", "must be positive");
    }
    if (ttl.count() > kMaxTtlSeconds) {
        return Invalid("ttl_seconds", "must not exceed " + std::to_string(kMaxTtlSeconds));
    }
    if (max_value_size < kMinValueSize) {
        return Invalid("max_value_size",
                       "must be at least " + std::to_string(kMinValueSize) + " bytes");
    }
    if (heartbeat_interval.count() < 0) {
        return Invalid("heartbeat_interval_ms", "must not be negative");
    }
    if (heartbeat_interval.count() > 0 && heartbeat_interval >= ttl) {
        return Invalid("heartbeat_interval_ms", "must be shorter than the ttl");
    }
    if (operation_timeout.count() <= 0) {
        return Invalid("operation_timeout_ms", "must be positive");
    }
    if (list_idle_timeout.count() <= 0) {
        return Invalid("list_idle_timeout_ms", "must be positive");
    }
    if (!Net::ParseLogLevel(log_level)) {
        return Invalid("log_level", "unknown level '" + log_level + "'");
    }
    return Net::Ok();
}

std::chrono::milliseconds PresenceConfig::EffectiveHeartbeatInterval() const
{
    if (heartbeat_interval.count() > 0) {
        return heartbeat_interval;
    }
    auto derived = std::chrono::duration_cast<std::chrono::milliseconds>(ttl) / 3;
    return derived.count() > 0 ? derived : std::chrono::milliseconds(1);
}

Net::Result<PresenceConfig> PresenceConfig::FromJSON(const nlohmann::json& json)
{
    if (!json.is_object()) {
        return Net::Err<PresenceConfig>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", "",
                                                   "configuration must be a JSON object"));
    }

    PresenceConfig config;
    std::string field;
    try {
        field = "url";
        if (json.contains(field)) config.url = json.at(field).get<std::string>();
        field = "bucket";
        if (json.contains(field)) config.bucket_name = json.at(field).get<std::string>();
        field = "client_id";
        if (json.contains(field)) config.client_id = json.at(field).get<std::string>();
        field = "ttl_seconds";
        if (json.contains(field)) config.ttl = std::chrono::seconds(json.at(field).get<int64_t>());
        field = "max_value_size";
        if (json.contains(field)) config.max_value_size = json.at(field).get<int32_t>();
        field = "heartbeat_interval_ms";
        if (json.contains(field)) {
            config.heartbeat_interval = std::chrono::milliseconds(json.at(field).get<int64_t>());
        }
        field = "operation_timeout_ms";
        if (json.contains(field)) {
            config.operation_timeout = std::chrono::milliseconds(json.at(field).get<int64_t>());
        }
        field = "list_idle_timeout_ms";
        if (json.contains(field)) {
            config.list_idle_timeout = std::chrono::milliseconds(json.at(field).get<int64_t>());
        }
        field = "log_level";
        if (json.contains(field)) config.log_level = json.at(field).get<std::string>();
    } catch (const nlohmann::json::exception& e) {
        return Net::Err<PresenceConfig>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", field, e.what()));
    }

    auto valid = config.Validate();
    if (!Net::isOk(valid)) {
        return Net::Err<PresenceConfig>(Net::Error(Net::getError(valid)));
    }
    return Net::Ok(std::move(config));
}

Net::Result<nlohmann::json> PresenceConfig::LoadJSON(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        return Net::Err<nlohmann::json>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", filename,
                                                   "cannot open configuration file"));
    }

    std::string content((std::istreambuf_iterator<char>(file)),
                        std::istreambuf_iterator<char>());
    if (content.empty()) {
        return Net::Err<nlohmann::json>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", filename,
                                                   "configuration file is empty"));
    }

    nlohmann::json json;
    try {
        json = nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        return Net::Err<nlohmann::json>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", filename, e.what()));
    }
    if (!json.is_object()) {
        return Net::Err<nlohmann::json>(Net::Error(Net::Error::CONFIGURATION_ERROR,
                                                   "PresenceConfig", filename,
                                                   "configuration must be a JSON object"));
    }
    return Net::Ok(std::move(json));
}

Net::Result<PresenceConfig> PresenceConfig::FromFile(const std::string& filename)
{
    auto json = LoadJSON(filename);
    if (!Net::isOk(json)) {
        return Net::Err<PresenceConfig>(Net::Error(Net::getError(json)));
    }
    return FromJSON(Net::getValue(json));
}

nlohmann::json PresenceConfig::ToJSON() const
{
    return nlohmann::json{
        {"url", url},
        {"bucket", bucket_name},
        {"client_id", client_id},
        {"ttl_seconds", ttl.count()},
        {"max_value_size", max_value_size},
        {"heartbeat_interval_ms", heartbeat_interval.count()},
        {"operation_timeout_ms", operation_timeout.count()},
        {"list_idle_timeout_ms", list_idle_timeout.count()},
        {"log_level", log_level},
    };
}

}  // namespace HPL::Presence
