/**
 * @file presence_main.cpp
 * @brief Presence tracker executable
 *
 * Heartbeats into a NATS key-value bucket and periodically prints which
 * participants of the presence domain are alive.
 *
 * Usage:
 *   hpl_presence [options]
 *
 * Options:
 *   -c, --config <file>      JSON configuration file
 *   -u, --url <url>          Server URL (default: nats://localhost:4222)
 *   -b, --bucket <name>      Presence bucket (default: hpl_presence)
 *   -i, --id <client_id>     Client id (default: hpl_<pid>)
 *   -t, --ttl <seconds>      Bucket TTL (default: 10)
 *   -l, --list <ms>          Listing period (default: 5000)
 *   -v, --log-level <level>  trace, debug, info, warn, error, off
 *   -h, --help               Show this help message
 *
 * Command line options override the configuration file.
 *
 * Example:
 *   # Two participants in the same domain
 *   hpl_presence -b lab -i writer_1 -t 6
 *   hpl_presence -b lab -i merger_1 -t 6
 */

#include <unistd.h>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>

#include <hpl/hpl.hpp>
#include <hpl/nats/NatsPresence.hpp>

using namespace HPL;

static volatile std::sig_atomic_t g_running = 1;

void signalHandler(int) {
  g_running = 0;
}

void printUsage(const char* program) {
  std::cout << "HPL Presence - heartbeat presence tracker\n\n";
  std::cout << "Usage: " << program << " [options]\n\n";
  std::cout << "Options:\n";
  std::cout << "  -c, --config <file>      JSON configuration file\n";
  std::cout << "  -u, --url <url>          Server URL (default: nats://localhost:4222)\n";
  std::cout << "  -b, --bucket <name>      Presence bucket (default: hpl_presence)\n";
  std::cout << "  -i, --id <client_id>     Client id (default: hpl_<pid>)\n";
  std::cout << "  -t, --ttl <seconds>      Bucket TTL (default: 10)\n";
  std::cout << "  -l, --list <ms>          Listing period (default: 5000)\n";
  std::cout << "  -v, --log-level <level>  trace, debug, info, warn, error, off\n";
  std::cout << "  -h, --help               Show this help message\n\n";
  std::cout << "Example:\n";
  std::cout << "  " << program << " -b lab -i writer_1 -t 6\n";
}

int main(int argc, char* argv[]) {
  nlohmann::json overrides = nlohmann::json::object();
  std::string config_file;
  std::chrono::milliseconds list_period(5000);

  // Parse command line arguments
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    bool has_value = i + 1 < argc;

    if (arg == "-h" || arg == "--help") {
      printUsage(argv[0]);
      return 0;
    } else if ((arg == "-c" || arg == "--config") && has_value) {
      config_file = argv[++i];
    } else if ((arg == "-u" || arg == "--url") && has_value) {
      overrides["url"] = argv[++i];
    } else if ((arg == "-b" || arg == "--bucket") && has_value) {
      overrides["bucket"] = argv[++i];
    } else if ((arg == "-i" || arg == "--id") && has_value) {
      overrides["client_id"] = argv[++i];
    } else if ((arg == "-t" || arg == "--ttl") && has_value) {
      try {
        overrides["ttl_seconds"] = std::stoll(argv[++i]);
      } catch (const std::exception&) {
        std::cerr << "ERROR: --ttl expects a number of seconds" << std::endl;
        return 1;
      }
    } else if ((arg == "-l" || arg == "--list") && has_value) {
      try {
        list_period = std::chrono::milliseconds(std::stoll(argv[++i]));
      } catch (const std::exception&) {
        std::cerr << "ERROR: --list expects a number of milliseconds" << std::endl;
        return 1;
      }
    } else if ((arg == "-v" || arg == "--log-level") && has_value) {
      overrides["log_level"] = argv[++i];
    } else {
      std::cerr << "ERROR: unknown or incomplete option " << arg << std::endl;
      printUsage(argv[0]);
      return 1;
    }
  }

  // Build configuration: defaults < file < command line
  nlohmann::json settings = Presence::PresenceConfig{}.ToJSON();
  settings["bucket"] = "hpl_presence";
  settings["client_id"] = "hpl_" + std::to_string(getpid());
  if (!config_file.empty()) {
    // Validated once below, so the file may leave fields to the command line
    auto loaded = Presence::PresenceConfig::LoadJSON(config_file);
    if (!Net::isOk(loaded)) {
      std::cerr << "ERROR: " << Net::getError(loaded).ToString() << std::endl;
      return 1;
    }
    settings.update(Net::getValue(loaded));
  }
  settings.update(overrides);

  auto parsed = Presence::PresenceConfig::FromJSON(settings);
  if (!Net::isOk(parsed)) {
    std::cerr << "ERROR: " << Net::getError(parsed).ToString() << std::endl;
    return 1;
  }
  const Presence::PresenceConfig config = Net::getValue(parsed);
  Net::SetLogLevel(config.log_level);

  // Print configuration
  std::cout << "=== HPL Presence " << VERSION_STRING << " ===" << std::endl;
  std::cout << "URL:        " << config.url << std::endl;
  std::cout << "Bucket:     " << config.bucket_name << std::endl;
  std::cout << "Client id:  " << config.client_id << std::endl;
  std::cout << "TTL:        " << config.ttl.count() << " s" << std::endl;
  std::cout << "Heartbeat:  " << config.EffectiveHeartbeatInterval().count() << " ms"
            << std::endl;
  std::cout << std::endl;

  // Setup signal handlers
  signal(SIGINT, signalHandler);
  signal(SIGTERM, signalHandler);

  auto initialized = Nats::InitPresenceTracker(config);
  if (!Net::isOk(initialized)) {
    std::cerr << "ERROR: " << Net::getError(initialized).ToString() << std::endl;
    return 1;
  }
  auto tracker = Net::takeValue(initialized);

  Presence::HeartbeatScheduler heartbeat(config.EffectiveHeartbeatInterval());
  Presence::HeartbeatScheduler listing(list_period);
  Presence::PresenceWatcher watcher;
  uint64_t failed_heartbeats = 0;

  std::cout << "Tracking presence. Press Ctrl+C to stop." << std::endl;

  while (g_running) {
    if (heartbeat.IsDue()) {
      auto sent = tracker->SendHeartbeat();
      if (!Net::isOk(sent)) {
        // Retried at the next interval; presence lapses only after the TTL
        std::cerr << "WARNING: " << Net::getError(sent).ToString() << std::endl;
        ++failed_heartbeats;
      }
      heartbeat.MarkSent();
    }

    if (listing.IsDue()) {
      auto present = tracker->ListPresent();
      if (Net::isOk(present)) {
        auto change = watcher.Update(Net::getValue(present));
        for (const auto& id : change.joined) {
          std::cout << "[+] " << id << std::endl;
        }
        for (const auto& id : change.left) {
          std::cout << "[-] " << id << std::endl;
        }
        std::cout << "[Status] " << watcher.GetPresentCount() << " present" << std::endl;
      } else {
        std::cerr << "WARNING: " << Net::getError(present).ToString() << std::endl;
      }
      listing.MarkSent();
    }

    auto wait = std::min(heartbeat.TimeUntilDue(), listing.TimeUntilDue());
    std::this_thread::sleep_for(std::min(wait, std::chrono::milliseconds(200)));
  }

  // Cleanup
  std::cout << "\nStopping..." << std::endl;
  tracker->Close();

  std::cout << "\n=== Final Statistics ===" << std::endl;
  std::cout << "Heartbeats sent: " << tracker->GetHeartbeatCount() << std::endl;
  std::cout << "Failed:          " << failed_heartbeats << std::endl;
  std::cout << "Last revision:   " << tracker->GetLastRevision() << std::endl;
  return 0;
}
