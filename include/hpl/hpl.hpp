#ifndef HPL_HPP
#define HPL_HPP

/**
 * @file hpl.hpp
 * @brief Main header for the HPL heartbeat presence library
 *
 * Includes the substrate independent API and the in-process substrate.
 * The NATS substrate lives in hpl/nats/NatsPresence.hpp and is only
 * available when the library was built with nats.c.
 */

// Error handling and logging
#include "hpl/net/Error.hpp"
#include "hpl/net/Logging.hpp"

// Substrate interfaces
#include "hpl/kv/IKeyValueBucket.hpp"
#include "hpl/kv/KVEntry.hpp"
#include "hpl/kv/KeyRules.hpp"
#include "hpl/net/IConnection.hpp"
#include "hpl/net/Message.hpp"
#include "hpl/net/Subject.hpp"
#include "hpl/net/Subscription.hpp"

// In-process substrate
#include "hpl/memory/MemoryBroker.hpp"
#include "hpl/memory/MemoryConnection.hpp"

// Presence
#include "hpl/presence/HeartbeatScheduler.hpp"
#include "hpl/presence/PresenceConfig.hpp"
#include "hpl/presence/PresenceKey.hpp"
#include "hpl/presence/PresenceTracker.hpp"
#include "hpl/presence/PresenceWatcher.hpp"

/**
 * @namespace HPL
 * @brief Main namespace for the HPL heartbeat presence library
 */
namespace HPL {
    // Version information
    constexpr int VERSION_MAJOR = 0;
    constexpr int VERSION_MINOR = 3;
    constexpr int VERSION_PATCH = 0;
    constexpr const char* VERSION_STRING = "0.3.0";
}

#endif // HPL_HPP
