#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <utility>

namespace queue_storage {

// Lifecycle of a storage instance
enum class StorageState {
    Uninitialized,
    Ready,
    Stopped
};

// Error types
enum class ErrorType {
    None,
    NotStarted,
    AlreadyStarted,
    InvalidDestination,
    StorageFailure,
    QueueFull,
    Cancelled,  // Reserved for durable backends
    Timeout     // Reserved for durable backends
};


// Result template for operations that can succeed or fail
template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(T value) : success(true), value(std::move(value)), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Check if result is successful
    explicit operator bool() const { return success; }

    // Access value (only if successful)
    T& operator*() { return value; }
    const T& operator*() const { return value; }

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }

    bool success;
    T value{};
    ErrorType error{ErrorType::None};
    std::string message;
};

// Specialization for void
template<>
class Result<void> {
public:
    // Success constructor
    Result() : success(true), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    explicit operator bool() const { return success; }

    bool success;
    ErrorType error{ErrorType::None};
    std::string message;
};


// Storage configuration
struct StorageConfig {
    std::string backend{"memory"};

    // Per-destination limits (0 = unbounded)
    size_t maxQueueDepth{0};
    size_t maxDestinationLength{255};

    // Prefix for generated message ids (empty = random per instance)
    std::string messageIdPrefix;

    bool enableMetrics{false};

    // Empty queues idle longer than this are eligible for eviction (0 = never)
    std::chrono::milliseconds idleQueueTimeout{0};
};

// Aggregate counters kept by a storage instance
struct StorageStats {
    uint64_t totalEnqueued{0};
    uint64_t totalRequeued{0};
    uint64_t totalDequeued{0};
    uint64_t totalEmptyDequeues{0};
    uint64_t totalRejected{0};
    uint64_t queuesCreated{0};
    uint64_t queuesEvicted{0};
    uint64_t currentFrames{0};
    uint64_t peakFrames{0};
};

// Utility functions
std::string errorTypeToString(ErrorType error);
std::string storageStateToString(StorageState state);
std::string toString(const StorageStats& stats);

// Configuration validation
bool isValid(const StorageConfig& config);
std::string validate(const StorageConfig& config);

} // namespace queue_storage
