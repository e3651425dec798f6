#pragma once

#include "queue_storage/frame.hpp"
#include "queue_storage/types.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace prometheus {
class Registry;
}

namespace queue_storage {

/**
 * @brief Storage for frames published to named destinations
 *
 * Implementations may keep frames in memory, in a file or in a database.
 * The broker drives the lifecycle: start() once at launch, data operations
 * from any number of threads, stop() once at shutdown.
 *
 * Ordering is guaranteed per destination only. Every data operation on a
 * single destination is linearizable.
 */
class QueueStorage {
public:
    virtual ~QueueStorage() = default;

    /**
     * @brief Prepare internal state
     * @return AlreadyStarted if running, StorageFailure if the backing
     *         store is unavailable. A failure here is fatal to the broker.
     */
    virtual Result<void> start() = 0;

    /**
     * @brief Release internal state
     *
     * Non-durable implementations discard every queued frame. A failure is
     * reported for logging only and must not block shutdown.
     */
    virtual Result<void> stop() = 0;

    /**
     * @brief Append a frame to the tail of a destination
     *
     * Assigns a message-id if the frame has none. The frame is moved into
     * storage only on success; on failure the caller keeps it unchanged.
     *
     * @return The message-id carried by the stored frame
     */
    virtual Result<std::string> enqueue(const std::string& destination, Frame&& frame) = 0;

    /**
     * @brief Insert a frame at the head of a destination
     *
     * Used to return a frame after a failed delivery so that it is
     * redelivered before newer frames. An existing message-id is kept;
     * one is allocated only if the frame lacks it.
     *
     * @return The message-id carried by the stored frame
     */
    virtual Result<std::string> requeue(const std::string& destination, Frame&& frame) = 0;

    /**
     * @brief Remove and return the head frame of a destination
     *
     * An empty or unknown destination yields a successful result holding
     * std::nullopt. Errors are reserved for real failures.
     */
    virtual Result<std::optional<Frame>> dequeue(const std::string& destination) = 0;

    // Introspection and maintenance
    virtual Result<size_t> depth(const std::string& destination) const = 0;
    virtual Result<std::vector<std::string>> destinations() const = 0;
    virtual Result<size_t> purge(const std::string& destination) = 0;
    virtual Result<size_t> evictIdleQueues(std::chrono::milliseconds maxIdle) = 0;

    virtual StorageState state() const = 0;
    bool isStarted() const { return state() == StorageState::Ready; }

    virtual StorageStats getStats() const = 0;
};

/**
 * @brief Build a storage backend for the given configuration
 * @param config Storage configuration; config.backend selects the type
 * @param registry Optional Prometheus registry. When null and
 *        config.enableMetrics is set, a private registry is created.
 * @throws ConfigError if the configuration is invalid
 */
std::unique_ptr<QueueStorage> createQueueStorage(const StorageConfig& config,
                                                 std::shared_ptr<prometheus::Registry> registry = nullptr);

} // namespace queue_storage
