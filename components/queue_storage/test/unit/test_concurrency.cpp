// test/unit/test_concurrency.cpp
#include <gtest/gtest.h>
#include "queue_storage/memory_queue_storage.hpp"
#include "utils/test_utils.hpp"
#include <atomic>
#include <map>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

using namespace queue_storage;
using namespace queue_storage::test;

class ConcurrencyTest : public ::testing::Test {
protected:
    void SetUp() override {
        storage_ = std::make_unique<MemoryQueueStorage>(TestConfig::getTestStorageConfig());
        ASSERT_TRUE(static_cast<bool>(storage_->start()));
    }

    void TearDown() override {
        if (storage_->isStarted()) {
            EXPECT_TRUE(static_cast<bool>(storage_->stop()));
        }
    }

    std::vector<Frame> drain(const std::string& destination) {
        std::vector<Frame> frames;
        for (;;) {
            auto result = storage_->dequeue(destination);
            EXPECT_TRUE(static_cast<bool>(result)) << result.message;
            if (!result || !result.value.has_value()) {
                break;
            }
            frames.push_back(std::move(*result.value));
        }
        return frames;
    }

    static int headerInt(const Frame& frame, const std::string& name) {
        return std::stoi(frame.getHeader(name).value_or("-1"));
    }

protected:
    std::unique_ptr<MemoryQueueStorage> storage_;
};

TEST_F(ConcurrencyTest, ConcurrentProducersSameDestination) {
    constexpr int kProducers = 8;
    constexpr int kPerProducer = 1000;

    std::atomic<int> failures{0};
    std::vector<std::thread> producers;

    for (int p = 0; p < kProducers; ++p) {
        producers.emplace_back([this, p, &failures]() {
            for (int i = 0; i < kPerProducer; ++i) {
                if (!storage_->enqueue("orders", TestFrames::createProducerFrame(p, i))) {
                    failures++;
                }
            }
        });
    }

    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(0, failures.load());

    auto frames = drain("orders");
    ASSERT_EQ(static_cast<size_t>(kProducers * kPerProducer), frames.size());

    std::set<std::string> ids;
    std::map<int, int> lastSequence;
    for (const auto& frame : frames) {
        EXPECT_TRUE(ids.insert(frame.getMessageId()).second) << "duplicate id " << frame.getMessageId();

        int producer = headerInt(frame, "producer");
        int sequence = headerInt(frame, "sequence");
        auto it = lastSequence.find(producer);
        if (it != lastSequence.end()) {
            EXPECT_LT(it->second, sequence) << "producer " << producer << " reordered";
        }
        lastSequence[producer] = sequence;
    }

    EXPECT_EQ(static_cast<size_t>(kProducers), lastSequence.size());
    for (const auto& [producer, sequence] : lastSequence) {
        EXPECT_EQ(kPerProducer - 1, sequence);
    }
}

TEST_F(ConcurrencyTest, FirstUseCreatesQueueOnce) {
    constexpr int kThreads = 16;

    std::atomic<bool> go{false};
    std::vector<std::thread> threads;

    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([this, t, &go]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto result = storage_->enqueue("new-destination", TestFrames::createProducerFrame(t, 0));
            EXPECT_TRUE(static_cast<bool>(result)) << result.message;
        });
    }

    go = true;
    for (auto& thread : threads) {
        thread.join();
    }

    auto names = storage_->destinations();
    ASSERT_TRUE(static_cast<bool>(names));
    EXPECT_EQ(std::vector<std::string>{"new-destination"}, *names);
    EXPECT_EQ(static_cast<size_t>(kThreads), *storage_->depth("new-destination"));
    EXPECT_EQ(1u, storage_->getStats().queuesCreated);
}

TEST_F(ConcurrencyTest, ProducersAndConsumersNoLossNoDuplicates) {
    constexpr int kProducers = 4;
    constexpr int kConsumers = 4;
    constexpr int kPerProducer = 2000;
    const std::vector<std::string> destinations = {"q0", "q1", "q2"};

    std::atomic<int> producersDone{0};
    std::mutex seenMutex;
    std::set<std::string> seen;
    std::atomic<int> duplicates{0};

    std::vector<std::thread> threads;
    for (int p = 0; p < kProducers; ++p) {
        threads.emplace_back([&, p]() {
            for (int i = 0; i < kPerProducer; ++i) {
                const auto& destination = destinations[static_cast<size_t>(i) % destinations.size()];
                EXPECT_TRUE(static_cast<bool>(storage_->enqueue(destination, TestFrames::createProducerFrame(p, i))));
            }
            producersDone++;
        });
    }

    for (int c = 0; c < kConsumers; ++c) {
        threads.emplace_back([&, c]() {
            size_t round = static_cast<size_t>(c);
            for (;;) {
                bool finished = producersDone.load() == kProducers;
                bool gotAny = false;

                for (size_t d = 0; d < destinations.size(); ++d) {
                    const auto& destination = destinations[(round + d) % destinations.size()];
                    auto result = storage_->dequeue(destination);
                    ASSERT_TRUE(static_cast<bool>(result)) << result.message;
                    if (!result.value) {
                        continue;
                    }
                    gotAny = true;

                    // Every 7th frame is handed back once, as after a failed delivery
                    Frame frame = std::move(*result.value);
                    if (headerInt(frame, "sequence") % 7 == 0 && !frame.hasHeader("redelivered")) {
                        frame.setHeader("redelivered", "true");
                        EXPECT_TRUE(static_cast<bool>(storage_->requeue(destination, std::move(frame))));
                        continue;
                    }

                    std::lock_guard<std::mutex> lock(seenMutex);
                    if (!seen.insert(frame.getMessageId()).second) {
                        duplicates++;
                    }
                }
                ++round;

                if (finished && !gotAny) {
                    break;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(0, duplicates.load());
    EXPECT_EQ(static_cast<size_t>(kProducers * kPerProducer), seen.size());
    EXPECT_EQ(0u, storage_->getStats().currentFrames);
}

TEST_F(ConcurrencyTest, StopWhileProducing) {
    std::atomic<bool> running{true};
    std::atomic<int> unexpected{0};
    std::vector<std::thread> producers;

    for (int p = 0; p < 4; ++p) {
        producers.emplace_back([&, p]() {
            int i = 0;
            while (running.load()) {
                auto result = storage_->enqueue("orders", TestFrames::createProducerFrame(p, i++));
                if (!result && result.error != ErrorType::NotStarted) {
                    unexpected++;
                }
                auto dequeued = storage_->dequeue("orders");
                if (!dequeued && dequeued.error != ErrorType::NotStarted) {
                    unexpected++;
                }
            }
        });
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_TRUE(static_cast<bool>(storage_->stop()));
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
    running = false;

    for (auto& producer : producers) {
        producer.join();
    }

    EXPECT_EQ(0, unexpected.load());
    EXPECT_EQ(StorageState::Stopped, storage_->state());
}
