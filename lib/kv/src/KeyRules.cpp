#include "hpl/kv/KeyRules.hpp"

#include <cctype>

namespace HPL::KV {

namespace {

bool IsAlnum(char c)
{
    return std::isalnum(static_cast<unsigned char>(c)) != 0;
}

}  // namespace

bool IsValidBucketName(const std::string& name)
{
    if (name.empty()) {
        return false;
    }
    for (char c : name) {
        if (!IsAlnum(c) && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

bool IsValidKey(const std::string& key)
{
    if (key.empty() || key.front() == '.' || key.back() == '.') {
        return false;
    }
    if (key.find("..") != std::string::npos) {
        return false;
    }
    for (char c : key) {
        if (!IsAlnum(c) && c != '-' && c != '/' && c != '_' && c != '=' && c != '.') {
            return false;
        }
    }
    return true;
}

}  // namespace HPL::KV
