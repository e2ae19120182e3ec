#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

namespace HPL::KV {

/**
 * @brief Operation that produced an entry
 */
enum class KVOperation : uint8_t {
    Put = 0,
    Delete,
    Purge,
};

/**
 * @brief One key/value/revision record returned by a read or enumeration
 *
 * Always a copy: adapters release the substrate's native entry as soon as
 * it has been copied into this struct.
 */
struct KVEntry {
    std::string bucket;                ///< Bucket the entry was read from
    std::string key;                   ///< Key without any bucket prefix
    std::vector<uint8_t> value;        ///< Value bytes
    uint64_t revision = 0;             ///< Substrate revision (monotonic per bucket)
    int64_t created_unix_ns = 0;       ///< Time the revision was written
    KVOperation operation = KVOperation::Put;

    std::string ValueAsString() const
    {
        return std::string(value.begin(), value.end());
    }
};

/**
 * @brief Settings fixed when a bucket is created
 *
 * All keys share one TTL; changing it means recreating the bucket.
 */
struct BucketConfig {
    std::string name;                               ///< Bucket identifier
    std::string description;                        ///< Free text, optional
    std::chrono::milliseconds ttl{0};               ///< 0 = keys never expire
    int32_t max_value_size = -1;                    ///< -1 = unlimited
    uint8_t history = 1;                            ///< Revisions kept per key
};

}  // namespace HPL::KV
