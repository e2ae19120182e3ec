/**
 * @file HeartbeatScheduler.hpp
 * @brief Decides when a presence heartbeat is due
 *
 * The tracker never schedules heartbeats itself. The caller's loop asks the
 * scheduler whether a write is due, sends it, and marks it sent. The
 * interval must stay below the bucket TTL or the participant's key expires
 * between writes.
 */

#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>

#include "hpl/net/Error.hpp"

namespace HPL::Presence {

/**
 * @brief Tracks time since the last heartbeat
 *
 * Usage:
 *   auto scheduler = getValue(HeartbeatScheduler::ForTtl(10s));
 *   while (running) {
 *       if (scheduler.IsDue()) {
 *           tracker->SendHeartbeat();
 *           scheduler.MarkSent();
 *       }
 *       std::this_thread::sleep_for(scheduler.TimeUntilDue());
 *   }
 */
class HeartbeatScheduler {
public:
    using TimePoint = std::chrono::steady_clock::time_point;
    using Clock = std::function<TimePoint()>;

    /**
     * @brief Constructor with configurable interval
     * @param interval Time between heartbeats
     * @param clock Time source (steady_clock when empty)
     *
     * A new scheduler is due immediately so the first heartbeat goes out at once.
     */
    explicit HeartbeatScheduler(std::chrono::milliseconds interval, Clock clock = {})
        : interval_(interval), clock_(std::move(clock))
    {
    }

    /**
     * @brief Interval derived from a TTL: ttl / 3, at least 1 ms
     */
    static std::chrono::milliseconds DefaultInterval(std::chrono::milliseconds ttl)
    {
        auto derived = ttl / 3;
        return derived.count() > 0 ? derived : std::chrono::milliseconds(1);
    }

    /**
     * @brief Scheduler for a bucket TTL
     * @param interval 0 selects DefaultInterval(ttl)
     * @return CONFIGURATION_ERROR if ttl is not positive or interval >= ttl
     */
    static Net::Result<HeartbeatScheduler> ForTtl(
        std::chrono::milliseconds ttl,
        std::chrono::milliseconds interval = std::chrono::milliseconds(0), Clock clock = {})
    {
        if (ttl.count() <= 0) {
            return Net::Err<HeartbeatScheduler>(Net::Error(
                Net::Error::CONFIGURATION_ERROR, "HeartbeatScheduler", "", "ttl must be positive"));
        }
        if (interval.count() < 0 || interval >= ttl) {
            return Net::Err<HeartbeatScheduler>(
                Net::Error(Net::Error::CONFIGURATION_ERROR, "HeartbeatScheduler", "",
                           "interval " + std::to_string(interval.count()) +
                               " ms must be shorter than ttl " + std::to_string(ttl.count()) +
                               " ms"));
        }
        if (interval.count() == 0) {
            interval = DefaultInterval(ttl);
        }
        return Net::Ok(HeartbeatScheduler(interval, std::move(clock)));
    }

    /**
     * @brief Check if heartbeat is due
     * @return true if never sent or the interval has elapsed since the last send
     */
    bool IsDue() const
    {
        return !sent_ || (Now() - last_sent_) >= interval_;
    }

    /**
     * @brief Mark that a heartbeat was sent
     */
    void MarkSent()
    {
        last_sent_ = Now();
        sent_ = true;
    }

    /**
     * @brief Time left until the next heartbeat is due, zero if already due
     */
    std::chrono::milliseconds TimeUntilDue() const
    {
        if (!sent_) {
            return std::chrono::milliseconds(0);
        }
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Now() - last_sent_);
        return elapsed >= interval_ ? std::chrono::milliseconds(0) : interval_ - elapsed;
    }

    void SetInterval(std::chrono::milliseconds interval)
    {
        interval_ = interval;
    }

    std::chrono::milliseconds GetInterval() const
    {
        return interval_;
    }

private:
    TimePoint Now() const
    {
        return clock_ ? clock_() : std::chrono::steady_clock::now();
    }

    std::chrono::milliseconds interval_;
    Clock clock_;
    TimePoint last_sent_;
    bool sent_ = false;
};

}  // namespace HPL::Presence
