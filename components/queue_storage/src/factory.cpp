#include "queue_storage/queue_storage.hpp"
#include "queue_storage/config.hpp"
#include "queue_storage/memory_queue_storage.hpp"
#include "queue_storage/metrics.hpp"
#include <spdlog/spdlog.h>

namespace queue_storage {

std::unique_ptr<QueueStorage> createQueueStorage(const StorageConfig& config,
                                                 std::shared_ptr<prometheus::Registry> registry) {
    std::string error = validate(config);
    if (!error.empty()) {
        throw ConfigError(error);
    }

    std::shared_ptr<StorageMetrics> metrics;
    if (registry || config.enableMetrics) {
        metrics = std::make_shared<StorageMetrics>(std::move(registry));
    }

    spdlog::debug("Creating '{}' queue storage (metrics {})", config.backend,
                  metrics ? "enabled" : "disabled");

    if (config.backend == "memory") {
        return std::make_unique<MemoryQueueStorage>(config, std::move(metrics));
    }

    throw ConfigError("unknown backend: " + config.backend);
}

} // namespace queue_storage
