#include "hpl/presence/PresenceKey.hpp"

#include <cstring>

#include "hpl/kv/KeyRules.hpp"

namespace HPL::Presence {

std::string MakePresenceKey(const std::string& client_id)
{
    return kPresencePrefix + client_id;
}

std::optional<std::string> ParsePresenceKey(const std::string& key)
{
    const size_t prefix_length = std::strlen(kPresencePrefix);
    if (key.size() <= prefix_length || key.compare(0, prefix_length, kPresencePrefix) != 0) {
        return std::nullopt;
    }
    return key.substr(prefix_length);
}

bool IsValidClientId(const std::string& client_id)
{
    if (client_id.empty()) {
        return false;
    }
    return KV::IsValidKey(MakePresenceKey(client_id));
}

}  // namespace HPL::Presence
