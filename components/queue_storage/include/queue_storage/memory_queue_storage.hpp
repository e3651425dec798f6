// include/queue_storage/memory_queue_storage.hpp
#pragma once

#include "queue_storage/queue_storage.hpp"
#include "queue_storage/message_id.hpp"

#include <atomic>
#include <chrono>
#include <deque>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>

namespace queue_storage {

class StorageMetrics;

// Non-durable storage holding one deque per destination.
// All frames are discarded on stop().
class MemoryQueueStorage : public QueueStorage {
public:
    explicit MemoryQueueStorage(const StorageConfig& config = StorageConfig{});
    MemoryQueueStorage(const StorageConfig& config, std::shared_ptr<StorageMetrics> metrics);

    ~MemoryQueueStorage() override;

    // Non-copyable, non-movable (contains mutex)
    MemoryQueueStorage(const MemoryQueueStorage&) = delete;
    MemoryQueueStorage& operator=(const MemoryQueueStorage&) = delete;
    MemoryQueueStorage(MemoryQueueStorage&&) = delete;
    MemoryQueueStorage& operator=(MemoryQueueStorage&&) = delete;

    // Lifecycle
    Result<void> start() override;
    Result<void> stop() override;

    // Frame operations
    Result<std::string> enqueue(const std::string& destination, Frame&& frame) override;
    Result<std::string> requeue(const std::string& destination, Frame&& frame) override;
    Result<std::optional<Frame>> dequeue(const std::string& destination) override;

    // Introspection and maintenance
    Result<size_t> depth(const std::string& destination) const override;
    Result<std::vector<std::string>> destinations() const override;
    Result<size_t> purge(const std::string& destination) override;
    Result<size_t> evictIdleQueues(std::chrono::milliseconds maxIdle) override;

    StorageState state() const override;
    StorageStats getStats() const override;

    const StorageConfig& getConfig() const;
    std::shared_ptr<StorageMetrics> getMetrics() const;

private:
    struct DestinationQueue {
        std::mutex mutex;
        std::deque<Frame> frames;
        std::chrono::steady_clock::time_point lastActivity{std::chrono::steady_clock::now()};
    };

    enum class InsertPosition { Tail, Head };

    Result<std::string> insert(const std::string& destination, Frame&& frame, InsertPosition position);
    Result<std::string> pushLocked(DestinationQueue& queue, const std::string& destination,
                                   Frame&& frame, InsertPosition position);

    Result<void> checkDestination(const std::string& destination) const;

    // Caller must hold mutex_ (shared or exclusive)
    DestinationQueue* findQueue(const std::string& destination) const;

    template<typename T>
    Result<T> reject(ErrorType error, const std::string& message) const;

    void frameStored();
    void framesReleased(uint64_t count);

    StorageConfig config_;
    MessageIdGenerator idGenerator_;
    std::shared_ptr<StorageMetrics> metrics_;

    // Guards state_ and the destination map. Data operations hold it
    // shared; lifecycle changes, queue creation and eviction hold it
    // exclusively.
    mutable std::shared_mutex mutex_;
    StorageState state_{StorageState::Uninitialized};
    std::unordered_map<std::string, std::unique_ptr<DestinationQueue>> queues_;

    // Statistics
    std::atomic<uint64_t> totalEnqueued_{0};
    std::atomic<uint64_t> totalRequeued_{0};
    std::atomic<uint64_t> totalDequeued_{0};
    std::atomic<uint64_t> totalEmptyDequeues_{0};
    mutable std::atomic<uint64_t> totalRejected_{0};
    std::atomic<uint64_t> queuesCreated_{0};
    std::atomic<uint64_t> queuesEvicted_{0};
    std::atomic<uint64_t> currentFrames_{0};
    std::atomic<uint64_t> peakFrames_{0};
};

} // namespace queue_storage
