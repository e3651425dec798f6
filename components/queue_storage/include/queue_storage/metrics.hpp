#pragma once

#include "queue_storage/types.hpp"

#include <cstddef>
#include <memory>

namespace prometheus {
class Registry;
}

namespace queue_storage {

// Prometheus exporter for storage activity. All methods are thread-safe.
class StorageMetrics {
public:
    explicit StorageMetrics(std::shared_ptr<prometheus::Registry> registry);
    ~StorageMetrics();

    StorageMetrics(const StorageMetrics&) = delete;
    StorageMetrics& operator=(const StorageMetrics&) = delete;

    void recordEnqueue();
    void recordRequeue();
    void recordDequeue();
    void recordEmptyDequeue();
    void recordRejected(ErrorType reason);
    void recordQueueCreated();
    void recordQueuesEvicted(size_t count);
    void setFramesStored(size_t count);
    void setQueueCount(size_t count);

    std::shared_ptr<prometheus::Registry> getRegistry() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace queue_storage
