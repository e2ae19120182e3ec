#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <optional>
#include <string>

namespace HPL::Net {

/**
 * @brief Get (or lazily create) a named, thread-safe console logger
 *
 * Loggers are registered with spdlog, so the same name always yields the
 * same instance. Names used by the library: "hpl.presence", "hpl.memory",
 * "hpl.nats", "hpl.net".
 */
std::shared_ptr<spdlog::logger> GetLogger(const std::string& name);

/**
 * @brief Parse "trace", "debug", "info", "warn", "error", "critical", "off"
 * @return nullopt for anything else
 */
std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& level);

/**
 * @brief Set the level of every registered logger and of loggers created later
 * @return false if the level name is not recognized
 */
bool SetLogLevel(const std::string& level);

} // namespace HPL::Net
