#include "queue_storage/memory_queue_storage.hpp"
#include "queue_storage/metrics.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <new>

namespace queue_storage {

template<typename T>
Result<T> MemoryQueueStorage::reject(ErrorType error, const std::string& message) const {
    totalRejected_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) {
        metrics_->recordRejected(error);
    }
    spdlog::warn("{} ({})", message, errorTypeToString(error));
    return Result<T>(error, message);
}

MemoryQueueStorage::MemoryQueueStorage(const StorageConfig& config)
    : MemoryQueueStorage(config, nullptr) {}

MemoryQueueStorage::MemoryQueueStorage(const StorageConfig& config, std::shared_ptr<StorageMetrics> metrics)
    : config_(config),
      idGenerator_(config.messageIdPrefix),
      metrics_(std::move(metrics)) {}

MemoryQueueStorage::~MemoryQueueStorage() {
    if (state() == StorageState::Ready) {
        auto result = stop();
        if (!result) {
            spdlog::error("Failed to stop memory queue storage on destruction: {}", result.message);
        }
    }
}

Result<void> MemoryQueueStorage::start() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_ == StorageState::Ready) {
        return reject<void>(ErrorType::AlreadyStarted, "Queue storage is already started");
    }

    queues_.clear();
    currentFrames_.store(0, std::memory_order_relaxed);
    state_ = StorageState::Ready;

    if (metrics_) {
        metrics_->setFramesStored(0);
        metrics_->setQueueCount(0);
    }

    spdlog::info("Memory queue storage started (max depth: {}, id prefix: {})",
                 config_.maxQueueDepth == 0 ? std::string("unbounded") : std::to_string(config_.maxQueueDepth),
                 idGenerator_.prefix());
    return Result<void>();
}

Result<void> MemoryQueueStorage::stop() {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<void>(ErrorType::NotStarted, "Queue storage is not running");
    }

    size_t discarded = 0;
    for (const auto& [name, queue] : queues_) {
        discarded += queue->frames.size();
    }
    size_t queueCount = queues_.size();

    queues_.clear();
    state_ = StorageState::Stopped;
    currentFrames_.store(0, std::memory_order_relaxed);

    if (metrics_) {
        metrics_->setFramesStored(0);
        metrics_->setQueueCount(0);
    }

    if (discarded > 0) {
        spdlog::warn("Memory queue storage stopped, discarded {} frames from {} destinations",
                     discarded, queueCount);
    } else {
        spdlog::info("Memory queue storage stopped");
    }
    return Result<void>();
}

Result<std::string> MemoryQueueStorage::enqueue(const std::string& destination, Frame&& frame) {
    return insert(destination, std::move(frame), InsertPosition::Tail);
}

Result<std::string> MemoryQueueStorage::requeue(const std::string& destination, Frame&& frame) {
    return insert(destination, std::move(frame), InsertPosition::Head);
}

Result<std::string> MemoryQueueStorage::insert(const std::string& destination, Frame&& frame,
                                               InsertPosition position) {
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);

        if (state_ != StorageState::Ready) {
            return reject<std::string>(ErrorType::NotStarted, "Queue storage is not running");
        }

        auto check = checkDestination(destination);
        if (!check) {
            return Result<std::string>(check.error, check.message);
        }

        if (auto* queue = findQueue(destination)) {
            return pushLocked(*queue, destination, std::move(frame), position);
        }
    }

    // First use of this destination. Re-check under the exclusive lock so
    // that two racing producers create the queue only once.
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<std::string>(ErrorType::NotStarted, "Queue storage is not running");
    }

    auto it = queues_.find(destination);
    if (it == queues_.end()) {
        try {
            it = queues_.emplace(destination, std::make_unique<DestinationQueue>()).first;
        } catch (const std::bad_alloc&) {
            return reject<std::string>(ErrorType::StorageFailure,
                                       "Out of memory creating queue '" + destination + "'");
        }

        queuesCreated_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordQueueCreated();
            metrics_->setQueueCount(queues_.size());
        }
        spdlog::debug("Created queue for destination '{}'", destination);
    }

    return pushLocked(*it->second, destination, std::move(frame), position);
}

Result<std::string> MemoryQueueStorage::pushLocked(DestinationQueue& queue, const std::string& destination,
                                                   Frame&& frame, InsertPosition position) {
    std::lock_guard<std::mutex> queueLock(queue.mutex);

    if (config_.maxQueueDepth > 0 && queue.frames.size() >= config_.maxQueueDepth) {
        return reject<std::string>(ErrorType::QueueFull,
                                   "Queue '" + destination + "' is full (" +
                                   std::to_string(config_.maxQueueDepth) + " frames)");
    }

    // Requeued frames normally carry their id already; it must survive redelivery.
    std::optional<std::string> previousId;
    if (!frame.hasMessageId()) {
        previousId = frame.getHeader(headers::MessageId);
        frame.setMessageId(idGenerator_.next());
    }
    std::string messageId = frame.getMessageId();

    try {
        if (position == InsertPosition::Tail) {
            queue.frames.push_back(std::move(frame));
        } else {
            queue.frames.push_front(std::move(frame));
        }
    } catch (const std::bad_alloc&) {
        // The deque is unchanged and the frame was not moved; hand it back as it came.
        if (previousId) {
            frame.setMessageId(*previousId);
        } else {
            frame.removeHeader(headers::MessageId);
        }
        return reject<std::string>(ErrorType::StorageFailure,
                                   "Out of memory storing frame for '" + destination + "'");
    }

    queue.lastActivity = std::chrono::steady_clock::now();

    if (position == InsertPosition::Tail) {
        totalEnqueued_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordEnqueue();
        }
    } else {
        totalRequeued_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordRequeue();
        }
    }
    frameStored();

    spdlog::debug("{} frame {} on '{}', depth: {}",
                  position == InsertPosition::Tail ? "Enqueued" : "Requeued",
                  messageId, destination, queue.frames.size());
    return Result<std::string>(messageId);
}

Result<std::optional<Frame>> MemoryQueueStorage::dequeue(const std::string& destination) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<std::optional<Frame>>(ErrorType::NotStarted, "Queue storage is not running");
    }

    auto check = checkDestination(destination);
    if (!check) {
        return Result<std::optional<Frame>>(check.error, check.message);
    }

    auto* queue = findQueue(destination);
    if (!queue) {
        totalEmptyDequeues_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordEmptyDequeue();
        }
        return Result<std::optional<Frame>>(std::nullopt);
    }

    std::lock_guard<std::mutex> queueLock(queue->mutex);
    queue->lastActivity = std::chrono::steady_clock::now();

    if (queue->frames.empty()) {
        totalEmptyDequeues_.fetch_add(1, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordEmptyDequeue();
        }
        return Result<std::optional<Frame>>(std::nullopt);
    }

    std::optional<Frame> frame(std::move(queue->frames.front()));
    queue->frames.pop_front();

    totalDequeued_.fetch_add(1, std::memory_order_relaxed);
    if (metrics_) {
        metrics_->recordDequeue();
    }
    framesReleased(1);

    spdlog::debug("Dequeued frame {} from '{}', depth: {}",
                  frame->getMessageId(), destination, queue->frames.size());
    return Result<std::optional<Frame>>(std::move(frame));
}

Result<size_t> MemoryQueueStorage::depth(const std::string& destination) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<size_t>(ErrorType::NotStarted, "Queue storage is not running");
    }

    auto* queue = findQueue(destination);
    if (!queue) {
        return Result<size_t>(static_cast<size_t>(0));
    }

    std::lock_guard<std::mutex> queueLock(queue->mutex);
    return Result<size_t>(queue->frames.size());
}

Result<std::vector<std::string>> MemoryQueueStorage::destinations() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<std::vector<std::string>>(ErrorType::NotStarted, "Queue storage is not running");
    }

    std::vector<std::string> names;
    names.reserve(queues_.size());
    for (const auto& [name, queue] : queues_) {
        names.push_back(name);
    }
    std::sort(names.begin(), names.end());

    return Result<std::vector<std::string>>(std::move(names));
}

Result<size_t> MemoryQueueStorage::purge(const std::string& destination) {
    std::shared_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<size_t>(ErrorType::NotStarted, "Queue storage is not running");
    }

    auto check = checkDestination(destination);
    if (!check) {
        return Result<size_t>(check.error, check.message);
    }

    auto* queue = findQueue(destination);
    if (!queue) {
        return Result<size_t>(static_cast<size_t>(0));
    }

    std::lock_guard<std::mutex> queueLock(queue->mutex);
    size_t purged = queue->frames.size();
    queue->frames.clear();
    queue->lastActivity = std::chrono::steady_clock::now();
    framesReleased(purged);

    spdlog::info("Purged {} frames from '{}'", purged, destination);
    return Result<size_t>(purged);
}

Result<size_t> MemoryQueueStorage::evictIdleQueues(std::chrono::milliseconds maxIdle) {
    std::unique_lock<std::shared_mutex> lock(mutex_);

    if (state_ != StorageState::Ready) {
        return reject<size_t>(ErrorType::NotStarted, "Queue storage is not running");
    }

    auto now = std::chrono::steady_clock::now();
    size_t evicted = 0;

    for (auto it = queues_.begin(); it != queues_.end();) {
        bool idle;
        {
            std::lock_guard<std::mutex> queueLock(it->second->mutex);
            idle = it->second->frames.empty() && now - it->second->lastActivity >= maxIdle;
        }

        if (idle) {
            spdlog::debug("Evicting idle queue '{}'", it->first);
            it = queues_.erase(it);
            ++evicted;
        } else {
            ++it;
        }
    }

    if (evicted > 0) {
        queuesEvicted_.fetch_add(evicted, std::memory_order_relaxed);
        if (metrics_) {
            metrics_->recordQueuesEvicted(evicted);
            metrics_->setQueueCount(queues_.size());
        }
        spdlog::info("Evicted {} idle queues, {} remaining", evicted, queues_.size());
    }

    return Result<size_t>(evicted);
}

StorageState MemoryQueueStorage::state() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
}

StorageStats MemoryQueueStorage::getStats() const {
    StorageStats stats;
    stats.totalEnqueued = totalEnqueued_.load(std::memory_order_relaxed);
    stats.totalRequeued = totalRequeued_.load(std::memory_order_relaxed);
    stats.totalDequeued = totalDequeued_.load(std::memory_order_relaxed);
    stats.totalEmptyDequeues = totalEmptyDequeues_.load(std::memory_order_relaxed);
    stats.totalRejected = totalRejected_.load(std::memory_order_relaxed);
    stats.queuesCreated = queuesCreated_.load(std::memory_order_relaxed);
    stats.queuesEvicted = queuesEvicted_.load(std::memory_order_relaxed);
    stats.currentFrames = currentFrames_.load(std::memory_order_relaxed);
    stats.peakFrames = peakFrames_.load(std::memory_order_relaxed);
    return stats;
}

const StorageConfig& MemoryQueueStorage::getConfig() const {
    return config_;
}

std::shared_ptr<StorageMetrics> MemoryQueueStorage::getMetrics() const {
    return metrics_;
}

Result<void> MemoryQueueStorage::checkDestination(const std::string& destination) const {
    if (destination.empty()) {
        return reject<void>(ErrorType::InvalidDestination, "Destination name is empty");
    }

    if (destination.size() > config_.maxDestinationLength) {
        return reject<void>(ErrorType::InvalidDestination,
                            "Destination name exceeds " + std::to_string(config_.maxDestinationLength) +
                            " characters");
    }

    for (char c : destination) {
        auto byte = static_cast<unsigned char>(c);
        if (byte < 0x20 || byte == 0x7f) {
            return reject<void>(ErrorType::InvalidDestination,
                                "Destination name contains control characters");
        }
    }

    return Result<void>();
}

MemoryQueueStorage::DestinationQueue* MemoryQueueStorage::findQueue(const std::string& destination) const {
    auto it = queues_.find(destination);
    return it == queues_.end() ? nullptr : it->second.get();
}

void MemoryQueueStorage::frameStored() {
    uint64_t current = currentFrames_.fetch_add(1, std::memory_order_relaxed) + 1;

    uint64_t peak = peakFrames_.load(std::memory_order_relaxed);
    while (current > peak &&
           !peakFrames_.compare_exchange_weak(peak, current, std::memory_order_relaxed)) {
    }

    if (metrics_) {
        metrics_->setFramesStored(current);
    }
}

void MemoryQueueStorage::framesReleased(uint64_t count) {
    if (count == 0) {
        return;
    }
    uint64_t current = currentFrames_.fetch_sub(count, std::memory_order_relaxed) - count;
    if (metrics_) {
        metrics_->setFramesStored(current);
    }
}

} // namespace queue_storage
