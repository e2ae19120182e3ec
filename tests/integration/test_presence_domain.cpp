/**
 * @file test_presence_domain.cpp
 * @brief Several participants sharing one presence domain
 *
 * Every tracker connects to the same in-process broker, the way separate
 * processes would connect to one server.
 */

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include "hpl/hpl.hpp"

using namespace HPL;
using namespace HPL::Presence;
using namespace std::chrono_literals;

class PresenceDomainTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        now_ = std::chrono::steady_clock::now();
        broker_ = Memory::MemoryBroker::Create([this] { return now_; });
    }

    std::unique_ptr<PresenceTracker> Join(const std::string& client_id,
                                          const std::string& bucket = "daq_presence")
    {
        auto result = PresenceTracker::Initialize("mem://daq", bucket, client_id, 3,
                                                  broker_->GetConnector());
        EXPECT_TRUE(Net::isOk(result));
        return Net::isOk(result) ? Net::takeValue(result) : nullptr;
    }

    static std::set<std::string> Snapshot(PresenceTracker& tracker)
    {
        auto result = tracker.ListPresent();
        EXPECT_TRUE(Net::isOk(result));
        return Net::isOk(result) ? Net::getValue(result) : std::set<std::string>{};
    }

    std::chrono::steady_clock::time_point now_;
    std::shared_ptr<Memory::MemoryBroker> broker_;
};

TEST_F(PresenceDomainTest, PipelineFailureIsDetected) {
    auto source = Join("source_01");
    auto merger = Join("merger");
    auto writer = Join("writer");
    ASSERT_TRUE(source && merger && writer);

    PresenceWatcher watcher;
    std::vector<PresenceTracker*> alive = {source.get(), merger.get(), writer.get()};

    for (auto* tracker : alive) {
        ASSERT_TRUE(Net::isOk(tracker->SendHeartbeat()));
    }
    auto change = watcher.Update(Snapshot(*writer));
    EXPECT_EQ(change.joined, (std::vector<std::string>{"merger", "source_01", "writer"}));

    // The merger stops heartbeating; everyone else keeps going every second
    alive = {source.get(), writer.get()};
    std::vector<std::string> departed;
    for (int second = 0; second < 5; ++second) {
        now_ += 1s;
        for (auto* tracker : alive) {
            ASSERT_TRUE(Net::isOk(tracker->SendHeartbeat()));
        }
        auto step = watcher.Update(Snapshot(*writer));
        EXPECT_TRUE(step.joined.empty());
        departed.insert(departed.end(), step.left.begin(), step.left.end());
    }
    EXPECT_EQ(departed, (std::vector<std::string>{"merger"}));
    EXPECT_EQ(watcher.GetPresent(), (std::set<std::string>{"source_01", "writer"}));

    // A restarted merger rejoins under the same id
    auto restarted = Join("merger");
    ASSERT_NE(restarted, nullptr);
    ASSERT_TRUE(Net::isOk(restarted->SendHeartbeat()));
    auto rejoined = watcher.Update(Snapshot(*source));
    EXPECT_EQ(rejoined.joined, (std::vector<std::string>{"merger"}));
}

TEST_F(PresenceDomainTest, DomainsAreIsolated) {
    auto lab_a = Join("worker", "lab_a");
    auto lab_b = Join("observer", "lab_b");
    ASSERT_TRUE(lab_a && lab_b);

    ASSERT_TRUE(Net::isOk(lab_a->SendHeartbeat()));

    auto seen = lab_b->IsPresent("worker");
    ASSERT_TRUE(Net::isOk(seen));
    EXPECT_FALSE(Net::getValue(seen));
    EXPECT_TRUE(Snapshot(*lab_b).empty());
    EXPECT_EQ(Snapshot(*lab_a), (std::set<std::string>{"worker"}));
}

TEST_F(PresenceDomainTest, SharedClientIdLastWriterWins) {
    auto first = Join("shared");
    auto second = Join("shared");
    auto observer = Join("observer");
    ASSERT_TRUE(first && second && observer);

    ASSERT_TRUE(Net::isOk(first->SendHeartbeat()));
    now_ += 2s;
    ASSERT_TRUE(Net::isOk(second->SendHeartbeat()));
    now_ += 2s;

    // The second write reset the expiry of the one shared key
    auto present = observer->IsPresent("shared");
    ASSERT_TRUE(Net::isOk(present));
    EXPECT_TRUE(Net::getValue(present));

    auto records = observer->ListPresenceEntries();
    ASSERT_TRUE(Net::isOk(records));
    ASSERT_EQ(Net::getValue(records).size(), 1u);
    EXPECT_EQ(Net::getValue(records)[0].revision, second->GetLastRevision());
}

TEST_F(PresenceDomainTest, ObserverNeverHeartbeats) {
    auto worker = Join("worker");
    auto observer = Join("observer");
    ASSERT_TRUE(worker && observer);

    ASSERT_TRUE(Net::isOk(worker->SendHeartbeat()));
    EXPECT_EQ(Snapshot(*observer), (std::set<std::string>{"worker"}));

    auto self = observer->IsSelfPresent();
    ASSERT_TRUE(Net::isOk(self));
    EXPECT_FALSE(Net::getValue(self));
}

TEST(PresenceDomainThreadedTest, ConcurrentParticipants) {
    auto broker = Memory::MemoryBroker::Create();
    constexpr int kParticipants = 4;

    std::atomic<bool> running{true};
    std::atomic<int> failures{0};
    std::atomic<int> ready{0};
    std::vector<std::thread> threads;

    for (int i = 0; i < kParticipants; ++i) {
        threads.emplace_back([&, i] {
            auto result = PresenceTracker::Initialize("mem://daq", "threaded",
                                                      "worker_" + std::to_string(i), 1,
                                                      broker->GetConnector());
            if (!Net::isOk(result)) {
                failures++;
                return;
            }
            auto tracker = Net::takeValue(result);
            bool announced = false;
            // Odd workers stop after a short while; even ones run until told
            auto stop_at = std::chrono::steady_clock::now() + 300ms;
            while (running.load()) {
                if (i % 2 == 1 && std::chrono::steady_clock::now() > stop_at) {
                    break;
                }
                if (!Net::isOk(tracker->SendHeartbeat())) {
                    failures++;
                }
                if (!announced) {
                    announced = true;
                    ready++;
                }
                std::this_thread::sleep_for(100ms);
            }
            tracker->Close();
        });
    }

    for (int i = 0; i < 100 && ready.load() < kParticipants; ++i) {
        std::this_thread::sleep_for(10ms);
    }
    ASSERT_EQ(ready.load(), kParticipants);

    auto observer_result =
        PresenceTracker::Initialize("mem://daq", "threaded", "observer", 1, broker->GetConnector());
    ASSERT_TRUE(Net::isOk(observer_result));
    auto observer = Net::takeValue(observer_result);

    auto all = observer->ListPresent();
    ASSERT_TRUE(Net::isOk(all));
    EXPECT_EQ(Net::getValue(all).size(), static_cast<size_t>(kParticipants));

    // Odd workers stop after 300 ms and their keys expire 1 s later
    std::this_thread::sleep_for(1600ms);
    auto remaining = observer->ListPresent();
    ASSERT_TRUE(Net::isOk(remaining));
    EXPECT_EQ(Net::getValue(remaining), (std::set<std::string>{"worker_0", "worker_2"}));

    running = false;
    for (auto& thread : threads) {
        thread.join();
    }
    EXPECT_EQ(failures.load(), 0);
}
