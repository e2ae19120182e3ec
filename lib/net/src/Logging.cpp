#include "hpl/net/Logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace HPL::Net {

std::shared_ptr<spdlog::logger> GetLogger(const std::string& name)
{
    auto logger = spdlog::get(name);
    if (logger) {
        return logger;
    }
    try {
        return spdlog::stdout_color_mt(name);
    } catch (const spdlog::spdlog_ex&) {
        // Another thread registered it first
        return spdlog::get(name);
    }
}

std::optional<spdlog::level::level_enum> ParseLogLevel(const std::string& level)
{
    if (level == "trace") return spdlog::level::trace;
    if (level == "debug") return spdlog::level::debug;
    if (level == "info") return spdlog::level::info;
    if (level == "warn" || level == "warning") return spdlog::level::warn;
    if (level == "error") return spdlog::level::err;
    if (level == "critical") return spdlog::level::critical;
    if (level == "off") return spdlog::level::off;
    return std::nullopt;
}

bool SetLogLevel(const std::string& level)
{
    auto parsed = ParseLogLevel(level);
    if (!parsed) {
        return false;
    }
    spdlog::set_level(*parsed);
    return true;
}

} // namespace HPL::Net
