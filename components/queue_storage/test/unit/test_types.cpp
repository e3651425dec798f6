// test/unit/test_types.cpp
#include <gtest/gtest.h>
#include "queue_storage/types.hpp"
#include "utils/test_utils.hpp"

using namespace queue_storage;
using namespace queue_storage::test;

TEST(TypesTest, ErrorTypeConversions) {
    EXPECT_EQ("None", errorTypeToString(ErrorType::None));
    EXPECT_EQ("NotStarted", errorTypeToString(ErrorType::NotStarted));
    EXPECT_EQ("AlreadyStarted", errorTypeToString(ErrorType::AlreadyStarted));
    EXPECT_EQ("InvalidDestination", errorTypeToString(ErrorType::InvalidDestination));
    EXPECT_EQ("StorageFailure", errorTypeToString(ErrorType::StorageFailure));
    EXPECT_EQ("QueueFull", errorTypeToString(ErrorType::QueueFull));
    EXPECT_EQ("Cancelled", errorTypeToString(ErrorType::Cancelled));
    EXPECT_EQ("Timeout", errorTypeToString(ErrorType::Timeout));
}

TEST(TypesTest, StorageStateConversions) {
    EXPECT_EQ("Uninitialized", storageStateToString(StorageState::Uninitialized));
    EXPECT_EQ("Ready", storageStateToString(StorageState::Ready));
    EXPECT_EQ("Stopped", storageStateToString(StorageState::Stopped));
}

TEST(TypesTest, ResultSuccess) {
    Result<std::string> result(std::string("id-1"));

    EXPECT_TRUE(static_cast<bool>(result));
    EXPECT_EQ(ErrorType::None, result.error);
    EXPECT_EQ("id-1", *result);
    EXPECT_EQ(4u, result->size());
}

TEST(TypesTest, ResultFailure) {
    Result<std::string> result(ErrorType::QueueFull, "full");

    EXPECT_FALSE(static_cast<bool>(result));
    EXPECT_EQ(ErrorType::QueueFull, result.error);
    EXPECT_EQ("full", result.message);
    EXPECT_TRUE(result.value.empty());
}

TEST(TypesTest, VoidResult) {
    Result<void> ok;
    Result<void> failed(ErrorType::NotStarted);

    EXPECT_TRUE(static_cast<bool>(ok));
    EXPECT_FALSE(static_cast<bool>(failed));
    EXPECT_EQ(ErrorType::NotStarted, failed.error);
    EXPECT_TRUE(failed.message.empty());
}

TEST(TypesTest, DefaultConfigIsValid) {
    StorageConfig config;

    EXPECT_EQ("memory", config.backend);
    EXPECT_EQ(0u, config.maxQueueDepth);
    EXPECT_EQ(255u, config.maxDestinationLength);
    EXPECT_FALSE(config.enableMetrics);
    EXPECT_TRUE(isValid(config));
    EXPECT_TRUE(validate(config).empty());
}

TEST(TypesTest, InvalidConfigs) {
    StorageConfig config = TestConfig::getTestStorageConfig();
    config.backend = "";
    EXPECT_FALSE(isValid(config));

    config = TestConfig::getTestStorageConfig();
    config.backend = "leveldb";
    EXPECT_NE(std::string::npos, validate(config).find("leveldb"));

    config = TestConfig::getTestStorageConfig();
    config.maxDestinationLength = 0;
    EXPECT_FALSE(isValid(config));

    config = TestConfig::getTestStorageConfig();
    config.idleQueueTimeout = std::chrono::milliseconds(-1);
    EXPECT_FALSE(isValid(config));

    config = TestConfig::getTestStorageConfig();
    config.messageIdPrefix = "bad\nprefix";
    EXPECT_FALSE(isValid(config));
}

TEST(TypesTest, StatsToString) {
    StorageStats stats;
    stats.totalEnqueued = 7;
    stats.peakFrames = 3;

    std::string text = toString(stats);
    EXPECT_NE(std::string::npos, text.find("Enqueued: 7"));
    EXPECT_NE(std::string::npos, text.find("Peak Frames: 3"));
}
