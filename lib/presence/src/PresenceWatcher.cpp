#include "hpl/presence/PresenceWatcher.hpp"

#include <algorithm>
#include <iterator>

namespace HPL::Presence {

PresenceChange PresenceWatcher::Update(const std::set<std::string>& snapshot)
{
    PresenceChange change;
    std::set_difference(snapshot.begin(), snapshot.end(), present_.begin(), present_.end(),
                        std::back_inserter(change.joined));
    std::set_difference(present_.begin(), present_.end(), snapshot.begin(), snapshot.end(),
                        std::back_inserter(change.left));
    present_ = snapshot;
    ++updates_;
    return change;
}

bool PresenceWatcher::IsKnown(const std::string& client_id) const
{
    return present_.count(client_id) > 0;
}

void PresenceWatcher::Clear()
{
    present_.clear();
}

}  // namespace HPL::Presence
