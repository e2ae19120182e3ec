/**
 * @file IKeyValueBucket.hpp
 * @brief KV substrate adapter contract
 *
 * The presence layer depends only on these interfaces. Any store with
 * bucket-wide TTL, per-key monotonic revisions and live-key enumeration can
 * implement them; the in-process MemoryKeyValueBucket is a local TTL map.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hpl/kv/KVEntry.hpp"
#include "hpl/net/Error.hpp"

namespace HPL::KV {

/**
 * @brief Bounded lazy sequence of entries
 *
 * Produced by IKeyValueBucket::WatchAll. The sequence is finite: it ends on
 * the first idle interval without a new entry, or earlier if the substrate
 * signals that all current values have been delivered.
 *
 * Usage:
 *   auto stream = takeValue(watch_result);
 *   while (true) {
 *       auto next = stream->Next();
 *       if (!isOk(next)) { ... error ... }
 *       if (!getValue(next)) break;   // end of stream
 *       use(*getValue(next));
 *   }
 */
class IEntryStream {
public:
    virtual ~IEntryStream() = default;

    /**
     * @brief Produce the next entry
     * @return An entry, nullopt at end of stream, or READ_ERROR
     */
    virtual Net::Result<std::optional<KVEntry>> Next() = 0;

    /**
     * @brief Release the underlying watcher; idempotent
     */
    virtual void Stop() = 0;
};

class IKeyValueBucket {
public:
    virtual ~IKeyValueBucket() = default;

    /**
     * @brief Unconditionally write a value
     * @return New revision, or WRITE_ERROR / INVALID_KEY / TIMEOUT
     */
    virtual Net::Result<uint64_t> Put(const std::string& key,
                                      const std::vector<uint8_t>& value,
                                      std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Read the latest live value of a key
     * @return The entry, NOT_FOUND if never written or expired, READ_ERROR,
     *         INVALID_KEY or TIMEOUT
     */
    virtual Net::Result<KVEntry> Get(const std::string& key,
                                     std::chrono::milliseconds timeout) = 0;

    /**
     * @brief Enumerate every live key
     * @param idle_timeout Longest wait for the next entry before the stream ends
     */
    virtual Net::Result<std::unique_ptr<IEntryStream>> WatchAll(
        std::chrono::milliseconds idle_timeout) = 0;

    /**
     * @brief Release the bucket handle; keys and the bucket itself persist
     */
    virtual void Close() = 0;

    virtual const BucketConfig& GetConfig() const = 0;
};

class IKVContext {
public:
    virtual ~IKVContext() = default;

    /**
     * @brief Create the bucket, or attach to it when it already exists
     *
     * Both outcomes are success. "Already exists" is never reported.
     * @return The bucket handle or BUCKET_ERROR
     */
    virtual Net::Result<std::unique_ptr<IKeyValueBucket>> CreateOrAttachBucket(
        const BucketConfig& config) = 0;

    /**
     * @brief Release the context; idempotent
     */
    virtual void Close() = 0;
};

}  // namespace HPL::KV
