/**
 * @file NatsLibrary.hpp
 * @brief Process-wide nats.c library lifetime
 *
 * nats.c needs nats_Open() before the first connection and nats_Close()
 * after the last one is destroyed. Acquire() hands out a guard: the first
 * guard opens the library, the last one released closes it. Guards are
 * counted under one lock, so an open never overlaps a close from another
 * thread. Every NatsConnection holds a guard, so callers only need their
 * own guard to keep the library open across connections.
 */

#pragma once

#include <cstddef>
#include <memory>
#include <mutex>

#include "hpl/net/Error.hpp"

namespace HPL::Nats {

class NatsLibrary {
public:
    ~NatsLibrary();

    NatsLibrary(const NatsLibrary&) = delete;
    NatsLibrary& operator=(const NatsLibrary&) = delete;

    /**
     * @brief Get a guard, opening the library if no guard is alive
     * @return SYSTEM_ERROR if nats_Open() fails
     */
    static Net::Result<std::shared_ptr<NatsLibrary>> Acquire();

    /**
     * @brief Whether a guard is currently alive
     */
    static bool IsOpen();

    /**
     * @brief Number of guards currently alive
     */
    static size_t GetGuardCount();

private:
    NatsLibrary() = default;

    static std::mutex mutex_;
    static size_t guards_;  ///< Guarded by mutex_
};

}  // namespace HPL::Nats
