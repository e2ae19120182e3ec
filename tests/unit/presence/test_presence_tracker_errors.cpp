/**
 * @file test_presence_tracker_errors.cpp
 * @brief PresenceTracker error mapping and lifecycle against mocked substrates
 */

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "hpl/presence/PresenceTracker.hpp"
#include "mock_substrate.hpp"

using namespace HPL;
using namespace HPL::Presence;
using namespace HPL::test;
using namespace std::chrono_literals;

using ::testing::_;
using ::testing::ByMove;
using ::testing::DoAll;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::NiceMock;
using ::testing::Return;
using ::testing::ReturnRef;
using ::testing::SaveArg;

namespace {

using NextResult = Net::Result<std::optional<KV::KVEntry>>;
using StreamResult = Net::Result<std::unique_ptr<KV::IEntryStream>>;

NextResult Deliver(const KV::KVEntry& entry)
{
    return NextResult(std::optional<KV::KVEntry>(entry));
}

NextResult EndOfStream()
{
    return NextResult(std::optional<KV::KVEntry>());
}

Net::Error SubstrateError(Net::Error::Code code, const std::string& message)
{
    return Net::Error(code, "substrate", "", message);
}

PresenceConfig MakeConfig()
{
    PresenceConfig config;
    config.url = "nats://mock:4222";
    config.bucket_name = "presence_test";
    config.client_id = "writer";
    config.ttl = std::chrono::seconds(3);
    return config;
}

}  // namespace

class PresenceTrackerErrorTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        bucket_config_.name = "presence_test";
        bucket_config_.ttl = 3000ms;

        auto connection = std::make_unique<NiceMock<MockConnection>>();
        auto context = std::make_unique<NiceMock<MockKVContext>>();
        auto bucket = std::make_unique<NiceMock<MockBucket>>();
        connection_ = connection.get();
        context_ = context.get();
        bucket_ = bucket.get();

        ON_CALL(*bucket_, GetConfig()).WillByDefault(ReturnRef(bucket_config_));
        ON_CALL(*connection_, GetUrl()).WillByDefault(ReturnRef(url_));

        tracker_ = std::make_unique<PresenceTracker>(MakeConfig(), std::move(connection),
                                                     std::move(context), std::move(bucket));
    }

    // Hands a stream to the next WatchAll call
    NiceMock<MockEntryStream>* ExpectWatch()
    {
        auto stream = std::make_unique<NiceMock<MockEntryStream>>();
        auto* raw = stream.get();
        StreamResult watch{std::unique_ptr<KV::IEntryStream>(std::move(stream))};
        EXPECT_CALL(*bucket_, WatchAll(_)).WillOnce(Return(ByMove(std::move(watch))));
        return raw;
    }

    KV::BucketConfig bucket_config_;
    std::string url_ = "nats://mock:4222";

    // Owned by tracker_; valid until it closes
    NiceMock<MockConnection>* connection_ = nullptr;
    NiceMock<MockKVContext>* context_ = nullptr;
    NiceMock<MockBucket>* bucket_ = nullptr;

    std::unique_ptr<PresenceTracker> tracker_;
};

// === Heartbeat ===

TEST_F(PresenceTrackerErrorTest, HeartbeatWritesUnixSeconds) {
    std::vector<uint8_t> written;
    EXPECT_CALL(*bucket_, Put("presence.writer", _, 500ms))
        .WillOnce(DoAll(SaveArg<1>(&written), Return(Net::Result<uint64_t>(uint64_t{7}))));

    const auto before = std::chrono::duration_cast<std::chrono::seconds>(
                            std::chrono::system_clock::now().time_since_epoch())
                            .count();
    ASSERT_TRUE(Net::isOk(tracker_->SendHeartbeat(500ms)));

    const std::string text(written.begin(), written.end());
    EXPECT_GE(std::stoll(text), before);
    EXPECT_EQ(tracker_->GetLastRevision(), 7u);
    EXPECT_EQ(tracker_->GetHeartbeatCount(), 1u);
}

TEST_F(PresenceTrackerErrorTest, HeartbeatUsesOperationTimeoutByDefault) {
    EXPECT_CALL(*bucket_, Put("presence.writer", _, 2000ms))
        .WillOnce(Return(Net::Result<uint64_t>(uint64_t{1})));
    EXPECT_TRUE(Net::isOk(tracker_->SendHeartbeat()));
}

TEST_F(PresenceTrackerErrorTest, HeartbeatWriteFailure) {
    EXPECT_CALL(*bucket_, Put(_, _, _))
        .WillOnce(Return(Net::Err<uint64_t>(
            SubstrateError(Net::Error::WRITE_ERROR, "stream not available"))));

    auto status = tracker_->SendHeartbeat();
    ASSERT_FALSE(Net::isOk(status));
    const auto& error = Net::getError(status);
    EXPECT_EQ(error.code, Net::Error::HEARTBEAT_ERROR);
    EXPECT_EQ(error.operation, "SendHeartbeat");
    EXPECT_EQ(error.key, "presence.writer");
    EXPECT_NE(error.message.find("stream not available"), std::string::npos);
    EXPECT_EQ(tracker_->GetHeartbeatCount(), 0u);
}

TEST_F(PresenceTrackerErrorTest, HeartbeatTimeoutStaysTimeout) {
    EXPECT_CALL(*bucket_, Put(_, _, _))
        .WillOnce(Return(Net::Err<uint64_t>(SubstrateError(Net::Error::TIMEOUT, "timeout"))));

    auto status = tracker_->SendHeartbeat(10ms);
    ASSERT_FALSE(Net::isOk(status));
    EXPECT_EQ(Net::getError(status).code, Net::Error::TIMEOUT);
}

// === IsPresent ===

TEST_F(PresenceTrackerErrorTest, IsPresentMapsGetOutcomes) {
    EXPECT_CALL(*bucket_, Get("presence.merger", 2000ms))
        .WillOnce(Return(Net::Result<KV::KVEntry>(MakeEntry("presence.merger", "1700000000", 4))))
        .WillOnce(Return(Net::Err<KV::KVEntry>(
            SubstrateError(Net::Error::NOT_FOUND, "key not found"))));

    auto present = tracker_->IsPresent("merger");
    ASSERT_TRUE(Net::isOk(present));
    EXPECT_TRUE(Net::getValue(present));

    auto absent = tracker_->IsPresent("merger");
    ASSERT_TRUE(Net::isOk(absent));
    EXPECT_FALSE(Net::getValue(absent));
}

TEST_F(PresenceTrackerErrorTest, IsPresentReadFailure) {
    EXPECT_CALL(*bucket_, Get("presence.merger", _))
        .WillOnce(Return(Net::Err<KV::KVEntry>(
            SubstrateError(Net::Error::READ_ERROR, "connection lost"))));

    auto result = tracker_->IsPresent("merger");
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::PRESENCE_CHECK_ERROR);
    EXPECT_EQ(Net::getError(result).key, "presence.merger");
    EXPECT_NE(Net::getError(result).message.find("connection lost"), std::string::npos);
}

TEST_F(PresenceTrackerErrorTest, IsPresentTimeoutStaysTimeout) {
    EXPECT_CALL(*bucket_, Get(_, 50ms))
        .WillOnce(Return(Net::Err<KV::KVEntry>(SubstrateError(Net::Error::TIMEOUT, "timeout"))));

    auto result = tracker_->IsPresent("merger", 50ms);
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::TIMEOUT);
}

TEST_F(PresenceTrackerErrorTest, IsSelfPresentChecksOwnKey) {
    EXPECT_CALL(*bucket_, Get("presence.writer", _))
        .WillOnce(Return(Net::Result<KV::KVEntry>(MakeEntry("presence.writer", "1", 1))));

    auto result = tracker_->IsSelfPresent();
    ASSERT_TRUE(Net::isOk(result));
    EXPECT_TRUE(Net::getValue(result));
}

// === Enumeration ===

TEST_F(PresenceTrackerErrorTest, ListKeepsLatestLiveRevision) {
    auto* stream = ExpectWatch();
    EXPECT_CALL(*stream, Next())
        .WillOnce(Return(Deliver(MakeEntry("presence.b", "1700000005", 5))))
        .WillOnce(Return(Deliver(MakeEntry("presence.b", "1700000001", 2))))
        .WillOnce(Return(Deliver(MakeEntry("config.run", "42", 6))))
        .WillOnce(Return(Deliver(MakeEntry("presence.a", "1700000003", 3))))
        .WillOnce(Return(Deliver(MakeEntry("presence.c", "1700000004", 4))))
        .WillOnce(Return(Deliver(MakeEntry("presence.c", "", 7, KV::KVOperation::Delete))))
        .WillOnce(Return(EndOfStream()));
    EXPECT_CALL(*stream, Stop()).Times(1);

    auto result = tracker_->ListPresenceEntries(250ms);
    ASSERT_TRUE(Net::isOk(result));
    const auto& records = Net::getValue(result);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].client_id, "a");
    EXPECT_EQ(records[0].revision, 3u);
    EXPECT_EQ(records[0].last_heartbeat_unix, 1700000003);
    EXPECT_EQ(records[1].client_id, "b");
    EXPECT_EQ(records[1].revision, 5u);
    EXPECT_EQ(records[1].last_heartbeat_unix, 1700000005);
}

TEST_F(PresenceTrackerErrorTest, ListPresentUsesIdleTimeout) {
    EXPECT_CALL(*bucket_, WatchAll(100ms))
        .WillOnce(Return(ByMove(Net::Err<std::unique_ptr<KV::IEntryStream>>(
            SubstrateError(Net::Error::READ_ERROR, "no responders")))));
    EXPECT_CALL(*bucket_, WatchAll(250ms))
        .WillOnce(Return(ByMove(Net::Err<std::unique_ptr<KV::IEntryStream>>(
            SubstrateError(Net::Error::READ_ERROR, "no responders")))));

    EXPECT_FALSE(Net::isOk(tracker_->ListPresent()));
    EXPECT_FALSE(Net::isOk(tracker_->ListPresent(250ms)));
}

TEST_F(PresenceTrackerErrorTest, ListPresentEmptyBucket) {
    auto* stream = ExpectWatch();
    EXPECT_CALL(*stream, Next()).WillOnce(Return(EndOfStream()));

    auto result = tracker_->ListPresent();
    ASSERT_TRUE(Net::isOk(result));
    EXPECT_TRUE(Net::getValue(result).empty());
}

TEST_F(PresenceTrackerErrorTest, ListWatchFailure) {
    EXPECT_CALL(*bucket_, WatchAll(_))
        .WillOnce(Return(ByMove(Net::Err<std::unique_ptr<KV::IEntryStream>>(
            SubstrateError(Net::Error::READ_ERROR, "watcher creation failed")))));

    auto result = tracker_->ListPresent();
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::PRESENCE_CHECK_ERROR);
    EXPECT_EQ(Net::getError(result).operation, "ListPresent");
    EXPECT_EQ(Net::getError(result).key, "presence_test");
}

TEST_F(PresenceTrackerErrorTest, ListStreamFailureStopsWatcher) {
    auto* stream = ExpectWatch();
    EXPECT_CALL(*stream, Next())
        .WillOnce(Return(Deliver(MakeEntry("presence.a", "1", 1))))
        .WillOnce(Return(NextResult(SubstrateError(Net::Error::READ_ERROR, "stream broken"))));
    EXPECT_CALL(*stream, Stop()).Times(::testing::AtLeast(1));

    auto result = tracker_->ListPresent();
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::PRESENCE_CHECK_ERROR);
    EXPECT_NE(Net::getError(result).message.find("stream broken"), std::string::npos);
}

TEST_F(PresenceTrackerErrorTest, ListStreamTimeoutStaysTimeout) {
    auto* stream = ExpectWatch();
    EXPECT_CALL(*stream, Next())
        .WillOnce(Return(NextResult(SubstrateError(Net::Error::TIMEOUT, "timeout"))));

    auto result = tracker_->ListPresenceEntries();
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::TIMEOUT);
}

// === Close ===

TEST_F(PresenceTrackerErrorTest, CloseReleasesInOrder) {
    {
        InSequence order;
        EXPECT_CALL(*bucket_, Close());
        EXPECT_CALL(*context_, Close());
        EXPECT_CALL(*connection_, IsConnected()).WillOnce(Return(true));
        EXPECT_CALL(*connection_, Flush(750ms)).WillOnce(Return(Net::Ok()));
        EXPECT_CALL(*connection_, Close());
    }

    tracker_->Close(750ms);
    EXPECT_TRUE(tracker_->IsClosed());

    // Second close touches nothing
    tracker_->Close();
}

TEST_F(PresenceTrackerErrorTest, CloseSwallowsFlushFailure) {
    EXPECT_CALL(*connection_, IsConnected()).WillOnce(Return(true));
    EXPECT_CALL(*connection_, Flush(_))
        .WillOnce(Return(Net::Err<std::monostate>(
            SubstrateError(Net::Error::CONNECTION_ERROR, "connection lost"))));
    EXPECT_CALL(*connection_, Close()).Times(1);

    tracker_->Close();
    EXPECT_TRUE(tracker_->IsClosed());
}

TEST_F(PresenceTrackerErrorTest, CloseSkipsFlushWhenDisconnected) {
    EXPECT_CALL(*connection_, IsConnected()).WillOnce(Return(false));
    EXPECT_CALL(*connection_, Flush(_)).Times(0);
    EXPECT_CALL(*connection_, Close()).Times(1);

    tracker_->Close();
}

TEST_F(PresenceTrackerErrorTest, CloseWithNonPositiveTimeoutFlushesWithDefault) {
    EXPECT_CALL(*connection_, IsConnected()).WillOnce(Return(true));
    EXPECT_CALL(*connection_, Flush(2000ms)).WillOnce(Return(Net::Ok()));

    tracker_->Close(0ms);
    EXPECT_TRUE(tracker_->IsClosed());
}

TEST_F(PresenceTrackerErrorTest, NonPositiveTimeoutsNeverReachBucket) {
    EXPECT_CALL(*bucket_, Put(_, _, _)).Times(0);
    EXPECT_CALL(*bucket_, Get(_, _)).Times(0);
    EXPECT_CALL(*bucket_, WatchAll(_)).Times(0);

    auto heartbeat = tracker_->SendHeartbeat(-5ms);
    ASSERT_FALSE(Net::isOk(heartbeat));
    EXPECT_EQ(Net::getError(heartbeat).code, Net::Error::CONFIGURATION_ERROR);
    EXPECT_EQ(Net::getError(heartbeat).key, "presence.writer");

    auto present = tracker_->IsPresent("merger", 0ms);
    ASSERT_FALSE(Net::isOk(present));
    EXPECT_EQ(Net::getError(present).code, Net::Error::CONFIGURATION_ERROR);

    auto self = tracker_->IsSelfPresent(0ms);
    ASSERT_FALSE(Net::isOk(self));
    EXPECT_EQ(Net::getError(self).code, Net::Error::CONFIGURATION_ERROR);

    auto listed = tracker_->ListPresent(0ms);
    ASSERT_FALSE(Net::isOk(listed));
    EXPECT_EQ(Net::getError(listed).code, Net::Error::CONFIGURATION_ERROR);
    EXPECT_EQ(Net::getError(listed).operation, "ListPresent");

    auto entries = tracker_->ListPresenceEntries(-1ms);
    ASSERT_FALSE(Net::isOk(entries));
    EXPECT_EQ(Net::getError(entries).code, Net::Error::CONFIGURATION_ERROR);
}

TEST_F(PresenceTrackerErrorTest, ReportsBucketTtl) {
    EXPECT_EQ(tracker_->GetBucketTtl(), 3000ms);
}

// === Initialize ===

class PresenceTrackerInitTest : public ::testing::Test {
protected:
    void SetUp() override
    {
        auto connection = std::make_unique<NiceMock<MockConnection>>();
        connection_ = connection.get();
        ON_CALL(*connection_, GetUrl()).WillByDefault(ReturnRef(url_));

        auto holder = std::make_shared<std::unique_ptr<Net::IConnection>>(std::move(connection));
        connector_ = [holder, this](const std::string& url) {
            requested_url_ = url;
            if (!*holder) {
                return Net::Err<std::unique_ptr<Net::IConnection>>(
                    SubstrateError(Net::Error::CONNECTION_ERROR, "already connected"));
            }
            return Net::Result<std::unique_ptr<Net::IConnection>>(std::move(*holder));
        };
    }

    std::string url_ = "nats://mock:4222";
    std::string requested_url_;
    NiceMock<MockConnection>* connection_ = nullptr;
    Net::Connector connector_;
};

TEST_F(PresenceTrackerInitTest, ConnectFailure) {
    Net::Connector refuse = [](const std::string&) {
        return Net::Err<std::unique_ptr<Net::IConnection>>(
            SubstrateError(Net::Error::CONNECTION_ERROR, "no servers available for connection"));
    };

    auto result = PresenceTracker::Initialize(MakeConfig(), refuse);
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::CONNECTION_ERROR);
    EXPECT_EQ(Net::getError(result).key, "nats://mock:4222");
    EXPECT_NE(Net::getError(result).message.find("no servers available"), std::string::npos);
}

TEST_F(PresenceTrackerInitTest, ContextFailureClosesConnection) {
    EXPECT_CALL(*connection_, GetKVContext(2000ms))
        .WillOnce(Return(ByMove(Net::Err<std::unique_ptr<KV::IKVContext>>(
            SubstrateError(Net::Error::CONTEXT_ERROR, "JetStream not enabled")))));
    EXPECT_CALL(*connection_, Close()).Times(::testing::AtLeast(1));

    auto result = PresenceTracker::Initialize(MakeConfig(), connector_);
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::CONNECTION_ERROR);
    EXPECT_NE(Net::getError(result).message.find("JetStream not enabled"), std::string::npos);
    EXPECT_EQ(requested_url_, "nats://mock:4222");
}

TEST_F(PresenceTrackerInitTest, BucketFailureClosesContextAndConnection) {
    auto context = std::make_unique<NiceMock<MockKVContext>>();
    auto* context_raw = context.get();

    KV::BucketConfig requested;
    EXPECT_CALL(*context_raw, CreateOrAttachBucket(_))
        .WillOnce(Invoke([&requested](const KV::BucketConfig& config) {
            requested = config;
            return Net::Err<std::unique_ptr<KV::IKeyValueBucket>>(
                SubstrateError(Net::Error::BUCKET_ERROR, "insufficient resources"));
        }));
    EXPECT_CALL(*context_raw, Close()).Times(::testing::AtLeast(1));
    EXPECT_CALL(*connection_, Close()).Times(::testing::AtLeast(1));
    EXPECT_CALL(*connection_, GetKVContext(_))
        .WillOnce(Return(ByMove(Net::Result<std::unique_ptr<KV::IKVContext>>(
            std::unique_ptr<KV::IKVContext>(std::move(context))))));

    auto result = PresenceTracker::Initialize(MakeConfig(), connector_);
    ASSERT_FALSE(Net::isOk(result));
    EXPECT_EQ(Net::getError(result).code, Net::Error::BUCKET_ERROR);
    EXPECT_EQ(Net::getError(result).key, "presence_test");

    EXPECT_EQ(requested.name, "presence_test");
    EXPECT_EQ(requested.ttl, 3000ms);
    EXPECT_EQ(requested.history, 1);
    EXPECT_EQ(requested.max_value_size, PresenceConfig::kDefaultMaxValueSize);
}

TEST_F(PresenceTrackerInitTest, SuccessKeepsExistingBucketTtl) {
    KV::BucketConfig existing;
    existing.name = "presence_test";
    existing.ttl = 60000ms;

    auto bucket = std::make_unique<NiceMock<MockBucket>>();
    ON_CALL(*bucket, GetConfig()).WillByDefault(ReturnRef(existing));

    auto context = std::make_unique<NiceMock<MockKVContext>>();
    EXPECT_CALL(*context, CreateOrAttachBucket(_))
        .WillOnce(Return(ByMove(Net::Result<std::unique_ptr<KV::IKeyValueBucket>>(
            std::unique_ptr<KV::IKeyValueBucket>(std::move(bucket))))));
    EXPECT_CALL(*connection_, GetKVContext(_))
        .WillOnce(Return(ByMove(Net::Result<std::unique_ptr<KV::IKVContext>>(
            std::unique_ptr<KV::IKVContext>(std::move(context))))));

    auto result = PresenceTracker::Initialize(MakeConfig(), connector_);
    ASSERT_TRUE(Net::isOk(result));
    auto tracker = Net::takeValue(result);
    EXPECT_EQ(tracker->GetBucketTtl(), 60000ms);
    tracker->Close();
}
