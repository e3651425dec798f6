// src/types.cpp
#include "queue_storage/types.hpp"
#include <sstream>

namespace queue_storage {

std::string errorTypeToString(ErrorType error) {
    switch (error) {
        case ErrorType::None: return "None";
        case ErrorType::NotStarted: return "NotStarted";
        case ErrorType::AlreadyStarted: return "AlreadyStarted";
        case ErrorType::InvalidDestination: return "InvalidDestination";
        case ErrorType::StorageFailure: return "StorageFailure";
        case ErrorType::QueueFull: return "QueueFull";
        case ErrorType::Cancelled: return "Cancelled";
        case ErrorType::Timeout: return "Timeout";
        default: return "Unknown";
    }
}

std::string storageStateToString(StorageState state) {
    switch (state) {
        case StorageState::Uninitialized: return "Uninitialized";
        case StorageState::Ready: return "Ready";
        case StorageState::Stopped: return "Stopped";
        default: return "Unknown";
    }
}

std::string toString(const StorageStats& stats) {
    std::ostringstream oss;
    oss << "StorageStats {\n";
    oss << "  Enqueued: " << stats.totalEnqueued << "\n";
    oss << "  Requeued: " << stats.totalRequeued << "\n";
    oss << "  Dequeued: " << stats.totalDequeued << "\n";
    oss << "  Empty Dequeues: " << stats.totalEmptyDequeues << "\n";
    oss << "  Rejected: " << stats.totalRejected << "\n";
    oss << "  Queues Created: " << stats.queuesCreated << "\n";
    oss << "  Queues Evicted: " << stats.queuesEvicted << "\n";
    oss << "  Current Frames: " << stats.currentFrames << "\n";
    oss << "  Peak Frames: " << stats.peakFrames << "\n";
    oss << "}";
    return oss.str();
}

bool isValid(const StorageConfig& config) {
    return validate(config).empty();
}

std::string validate(const StorageConfig& config) {
    if (config.backend.empty()) {
        return "backend must not be empty";
    }

    if (config.backend != "memory") {
        return "unknown backend: " + config.backend;
    }

    if (config.maxDestinationLength == 0) {
        return "maxDestinationLength must be greater than zero";
    }

    if (config.idleQueueTimeout.count() < 0) {
        return "idleQueueTimeout must not be negative";
    }

    for (char c : config.messageIdPrefix) {
        if (static_cast<unsigned char>(c) < 0x20) {
            return "messageIdPrefix contains an illegal character";
        }
    }

    return "";
}

} // namespace queue_storage
