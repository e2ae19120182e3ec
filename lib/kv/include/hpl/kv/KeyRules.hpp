#pragma once

#include <string>

namespace HPL::KV {

/**
 * @brief Bucket names: one or more of [A-Za-z0-9_-]
 */
bool IsValidBucketName(const std::string& name);

/**
 * @brief Keys: one or more of [-/_=.A-Za-z0-9], no leading or trailing '.',
 *        no empty token ("..")
 */
bool IsValidKey(const std::string& key);

}  // namespace HPL::KV
