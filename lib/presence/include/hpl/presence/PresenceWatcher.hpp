/**
 * @file PresenceWatcher.hpp
 * @brief Detects participants joining and leaving a presence domain
 *
 * Used on the observing side: feed it successive ListPresent() snapshots and
 * it reports the difference to the previous one. Expiry itself is decided by
 * the bucket TTL, never here.
 */

#pragma once

#include <cstdint>
#include <set>
#include <string>
#include <vector>

namespace HPL::Presence {

/**
 * @brief Difference between two presence snapshots
 */
struct PresenceChange {
    std::vector<std::string> joined;   ///< Present now, absent before (sorted)
    std::vector<std::string> left;     ///< Present before, absent now (sorted)

    bool Empty() const { return joined.empty() && left.empty(); }
};

/**
 * @brief Keeps the last snapshot and diffs new ones against it
 *
 * Usage:
 *   PresenceWatcher watcher;
 *   while (running) {
 *       auto snapshot = tracker->ListPresent();
 *       if (!isOk(snapshot)) continue;
 *       auto change = watcher.Update(getValue(snapshot));
 *       for (const auto& id : change.left) {
 *           // Participant stopped heartbeating
 *       }
 *   }
 */
class PresenceWatcher {
public:
    /**
     * @brief Replace the current snapshot
     * @return Ids that joined and left since the previous Update()
     */
    PresenceChange Update(const std::set<std::string>& snapshot);

    /**
     * @brief Whether the id was present in the last snapshot
     */
    bool IsKnown(const std::string& client_id) const;

    const std::set<std::string>& GetPresent() const { return present_; }
    size_t GetPresentCount() const { return present_.size(); }

    /**
     * @brief Number of Update() calls so far
     */
    uint64_t GetUpdateCount() const { return updates_; }

    /**
     * @brief Forget the current snapshot; the next Update() reports all as joined
     */
    void Clear();

private:
    std::set<std::string> present_;
    uint64_t updates_ = 0;
};

}  // namespace HPL::Presence
