#include "utils/test_utils.hpp"
#include <atomic>
#include <cstdio>
#include <fstream>
#include <random>
#include <unistd.h>

namespace queue_storage {
namespace test {

StorageConfig TestConfig::getTestStorageConfig() {
    StorageConfig config;
    config.backend = "memory";
    config.messageIdPrefix = "test";
    return config;
}

StorageConfig TestConfig::getBoundedStorageConfig(size_t maxDepth) {
    StorageConfig config = getTestStorageConfig();
    config.maxQueueDepth = maxDepth;
    return config;
}

Frame TestFrames::createTextFrame(const std::string& body) {
    Headers frameHeaders = {
        {headers::ContentType, "text/plain"},
        {headers::ContentLength, std::to_string(body.size())}
    };
    return Frame(commands::Message, std::move(frameHeaders), body);
}

Frame TestFrames::createFrameWithId(const std::string& messageId, const std::string& body) {
    Frame frame = createTextFrame(body);
    frame.setMessageId(messageId);
    return frame;
}

Frame TestFrames::createBinaryFrame(const std::vector<uint8_t>& data) {
    Headers frameHeaders = {{headers::ContentType, "application/octet-stream"}};
    return Frame(commands::Message, std::move(frameHeaders), data);
}

Frame TestFrames::createProducerFrame(int producer, int sequence) {
    Frame frame = createTextFrame(std::to_string(producer) + ":" + std::to_string(sequence));
    frame.setHeader("producer", std::to_string(producer));
    frame.setHeader("sequence", std::to_string(sequence));
    return frame;
}

void TestAssertions::assertFrameEquals(const Frame& expected, const Frame& actual) {
    EXPECT_EQ(expected.getCommand(), actual.getCommand());
    EXPECT_EQ(expected.getHeaders(), actual.getHeaders());
    EXPECT_EQ(expected.getBody(), actual.getBody());
}

void TestAssertions::assertSameExceptId(const Frame& expected, const Frame& actual) {
    Frame lhs = expected;
    Frame rhs = actual;
    lhs.removeHeader(headers::MessageId);
    rhs.removeHeader(headers::MessageId);
    assertFrameEquals(lhs, rhs);
}

TempFile::TempFile(const std::string& contents) {
    static std::atomic<int> counter{0};
    path_ = "/tmp/queue_storage_test_" + std::to_string(::getpid()) + "_" +
            std::to_string(counter.fetch_add(1)) + ".json";
    std::ofstream out(path_);
    out << contents;
}

TempFile::~TempFile() {
    std::remove(path_.c_str());
}

std::vector<uint8_t> TestHelpers::generateRandomBinary(size_t length) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<int> dis(0, 255);

    std::vector<uint8_t> result(length);
    for (auto& byte : result) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return result;
}

} // namespace test
} // namespace queue_storage
