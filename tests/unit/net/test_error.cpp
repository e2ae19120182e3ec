/**
 * @file test_error.cpp
 * @brief Unit tests for Error handling and Result pattern
 */

#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "hpl/net/Error.hpp"

using namespace HPL::Net;

class ErrorTest : public ::testing::Test {};

/**
 * @brief Test Error creation with automatic timestamp
 */
TEST_F(ErrorTest, ErrorCreationWithTimestamp) {
    Error error(Error::HEARTBEAT_ERROR, "Test error message");

    EXPECT_EQ(error.code, Error::HEARTBEAT_ERROR);
    EXPECT_EQ(error.message, "Test error message");
    EXPECT_TRUE(error.operation.empty());
    EXPECT_TRUE(error.key.empty());

    // Timestamp should be in correct format (YYYY-MM-DD HH:MM:SS)
    ASSERT_EQ(error.timestamp.length(), 19u);
    EXPECT_EQ(error.timestamp[4], '-');
    EXPECT_EQ(error.timestamp[7], '-');
    EXPECT_EQ(error.timestamp[10], ' ');
    EXPECT_EQ(error.timestamp[13], ':');
    EXPECT_EQ(error.timestamp[16], ':');
}

TEST_F(ErrorTest, ErrorCarriesOperationAndKey) {
    Error error(Error::WRITE_ERROR, "Put", "presence.a", "maximum value size exceeded");

    EXPECT_EQ(error.operation, "Put");
    EXPECT_EQ(error.key, "presence.a");
    EXPECT_EQ(error.ToString(), "[WRITE_ERROR] Put(presence.a): maximum value size exceeded");
}

TEST_F(ErrorTest, ToStringWithoutContext) {
    Error error(Error::SYSTEM_ERROR, "library not open");
    EXPECT_EQ(error.ToString(), "[SYSTEM_ERROR] library not open");
}

TEST_F(ErrorTest, WrapKeepsCauseText) {
    Error cause(Error::WRITE_ERROR, "Put", "presence.a", "bucket unreachable");
    Error wrapped = Error::Wrap(Error::HEARTBEAT_ERROR, "SendHeartbeat", "presence.a", cause);

    EXPECT_EQ(wrapped.code, Error::HEARTBEAT_ERROR);
    EXPECT_EQ(wrapped.operation, "SendHeartbeat");
    EXPECT_EQ(wrapped.key, "presence.a");
    EXPECT_EQ(wrapped.message, "SendHeartbeat(presence.a): bucket unreachable");
    // Operation is not repeated
    EXPECT_EQ(wrapped.ToString(), "[HEARTBEAT_ERROR] SendHeartbeat(presence.a): bucket unreachable");
}

TEST_F(ErrorTest, WrapWithoutKey) {
    Error cause(Error::CONNECTION_ERROR, "refused");
    Error wrapped = Error::Wrap(Error::CONNECTION_ERROR, "Initialize", "", cause);
    EXPECT_EQ(wrapped.message, "Initialize: refused");
}

TEST_F(ErrorTest, ErrorCodeNames) {
    EXPECT_STREQ(ErrorCodeToString(Error::SUCCESS), "SUCCESS");
    EXPECT_STREQ(ErrorCodeToString(Error::CONFIGURATION_ERROR), "CONFIGURATION_ERROR");
    EXPECT_STREQ(ErrorCodeToString(Error::CONNECTION_ERROR), "CONNECTION_ERROR");
    EXPECT_STREQ(ErrorCodeToString(Error::BUCKET_ERROR), "BUCKET_ERROR");
    EXPECT_STREQ(ErrorCodeToString(Error::PRESENCE_CHECK_ERROR), "PRESENCE_CHECK_ERROR");
    EXPECT_STREQ(ErrorCodeToString(Error::NOT_FOUND), "NOT_FOUND");
    EXPECT_STREQ(ErrorCodeToString(Error::TIMEOUT), "TIMEOUT");
    EXPECT_STREQ(ErrorCodeToString(Error::REQUEST_ERROR), "REQUEST_ERROR");
}

/**
 * @brief Test Result with successful value
 */
TEST_F(ErrorTest, ResultWithSuccessValue) {
    Result<int> result = Ok(42);

    EXPECT_TRUE(isOk(result));
    EXPECT_EQ(getValue(result), 42);
}

TEST_F(ErrorTest, ResultWithError) {
    Result<int> result = Err<int>(Error(Error::NOT_FOUND, "key not found"));

    EXPECT_FALSE(isOk(result));
    EXPECT_EQ(getError(result).code, Error::NOT_FOUND);
    EXPECT_EQ(getError(result).message, "key not found");
}

TEST_F(ErrorTest, StatusOk) {
    Status status = Ok();
    EXPECT_TRUE(isOk(status));

    Status failed = Err<std::monostate>(Error(Error::TIMEOUT, "no reply"));
    EXPECT_FALSE(isOk(failed));
}

TEST_F(ErrorTest, TakeValueMovesOut) {
    Result<std::unique_ptr<int>> result = Ok(std::make_unique<int>(7));
    ASSERT_TRUE(isOk(result));

    auto value = takeValue(result);
    ASSERT_NE(value, nullptr);
    EXPECT_EQ(*value, 7);
}
