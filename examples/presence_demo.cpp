/**
 * @file presence_demo.cpp
 * @brief In-process walk through heartbeat, expiry and resume
 *
 * Runs without a server: two trackers share an in-process broker whose
 * clock is advanced by hand, so the whole lifecycle takes no real time.
 *
 * Usage:
 *   hpl_presence_demo
 */

#include <chrono>
#include <iostream>
#include <set>
#include <string>

#include <hpl/hpl.hpp>

using namespace HPL;
using namespace std::chrono_literals;

namespace {

std::string Join(const std::set<std::string>& ids) {
  std::string text;
  for (const auto& id : ids) {
    text += (text.empty() ? "" : ", ") + id;
  }
  return "{" + text + "}";
}

void PrintPresence(Presence::PresenceTracker& tracker, const std::string& label) {
  auto present = tracker.ListPresent();
  if (!Net::isOk(present)) {
    std::cerr << "   ✗ " << Net::getError(present).ToString() << std::endl;
    return;
  }
  std::cout << "   " << label << ": " << Join(Net::getValue(present)) << std::endl;
}

}  // namespace

int main() {
  std::cout << "HPL Presence Demo (in-process broker)" << std::endl;
  std::cout << "=====================================" << std::endl;

  auto now = std::chrono::steady_clock::now();
  auto broker = Memory::MemoryBroker::Create([&now] { return now; });

  Presence::PresenceConfig config;
  config.url = "mem://demo";
  config.bucket_name = "demo_presence";
  config.ttl = 3s;

  // 1. Two participants join the same presence domain
  std::cout << "\n1. Initializing trackers..." << std::endl;
  config.client_id = "writer";
  auto writer_result = Presence::PresenceTracker::Initialize(config, broker->GetConnector());
  config.client_id = "merger";
  auto merger_result = Presence::PresenceTracker::Initialize(config, broker->GetConnector());
  if (!Net::isOk(writer_result) || !Net::isOk(merger_result)) {
    const auto& error = Net::isOk(writer_result) ? Net::getError(merger_result)
                                                 : Net::getError(writer_result);
    std::cerr << "   ✗ " << error.ToString() << std::endl;
    return 1;
  }
  auto writer = Net::takeValue(writer_result);
  auto merger = Net::takeValue(merger_result);
  std::cout << "   ✓ Both trackers attached to '" << config.bucket_name << "'" << std::endl;

  // 2. Heartbeats make both visible
  std::cout << "\n2. Sending heartbeats..." << std::endl;
  for (auto* tracker : {writer.get(), merger.get()}) {
    auto sent = tracker->SendHeartbeat();
    if (!Net::isOk(sent)) {
      std::cerr << "   ✗ " << Net::getError(sent).ToString() << std::endl;
      return 1;
    }
  }
  PrintPresence(*writer, "present");

  // 3. Only the writer keeps heartbeating at ttl / 3
  std::cout << "\n3. Writer heartbeats every " << config.EffectiveHeartbeatInterval().count()
            << " ms, merger stays silent..." << std::endl;
  Presence::PresenceWatcher watcher;
  watcher.Update({"writer", "merger"});
  for (int round = 0; round < 4; ++round) {
    now += config.EffectiveHeartbeatInterval();
    auto sent = writer->SendHeartbeat();
    if (!Net::isOk(sent)) {
      std::cerr << "   ✗ " << Net::getError(sent).ToString() << std::endl;
      return 1;
    }
    auto present = writer->ListPresent();
    if (Net::isOk(present)) {
      auto change = watcher.Update(Net::getValue(present));
      for (const auto& id : change.left) {
        std::cout << "   [-] " << id << " expired" << std::endl;
      }
    }
  }
  PrintPresence(*writer, "present");

  // 4. The merger comes back
  std::cout << "\n4. Merger resumes..." << std::endl;
  auto resumed = merger->SendHeartbeat();
  if (!Net::isOk(resumed)) {
    std::cerr << "   ✗ " << Net::getError(resumed).ToString() << std::endl;
    return 1;
  }
  auto merger_present = writer->IsPresent("merger");
  if (Net::isOk(merger_present)) {
    std::cout << "   merger present: " << std::boolalpha << Net::getValue(merger_present)
              << std::endl;
  }

  auto entries = writer->ListPresenceEntries();
  if (Net::isOk(entries)) {
    for (const auto& record : Net::getValue(entries)) {
      std::cout << "   " << record.client_id << " last heartbeat " << record.last_heartbeat_unix
                << " (revision " << record.revision << ")" << std::endl;
    }
  }

  // 5. Close; the bucket and keys outlive the trackers
  std::cout << "\n5. Closing trackers..." << std::endl;
  writer->Close();
  merger->Close();
  merger->Close();
  std::cout << "   ✓ Closed (buckets kept: " << broker->GetBucketCount() << ")" << std::endl;
  return 0;
}
