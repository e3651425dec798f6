// src/metrics.cpp
#include "queue_storage/metrics.hpp"
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>

namespace queue_storage {

class StorageMetrics::Impl {
public:
    explicit Impl(std::shared_ptr<prometheus::Registry> registry)
        : registry_(std::move(registry)) {
        initializeMetrics();
    }

    std::shared_ptr<prometheus::Registry> registry_;

    // Frame operations
    prometheus::Counter* framesEnqueued_;
    prometheus::Counter* framesRequeued_;
    prometheus::Counter* framesDequeued_;
    prometheus::Counter* emptyDequeues_;
    prometheus::Family<prometheus::Counter>* rejectedFamily_;

    // Queue lifecycle
    prometheus::Counter* queuesCreated_;
    prometheus::Counter* queuesEvicted_;

    // Current state
    prometheus::Gauge* framesStored_;
    prometheus::Gauge* queueCount_;

private:
    void initializeMetrics() {
        auto& operationFamily = prometheus::BuildCounter()
            .Name("queue_storage_frames_total")
            .Help("Total number of frame operations by type")
            .Register(*registry_);

        framesEnqueued_ = &operationFamily.Add({{"operation", "enqueue"}});
        framesRequeued_ = &operationFamily.Add({{"operation", "requeue"}});
        framesDequeued_ = &operationFamily.Add({{"operation", "dequeue"}});
        emptyDequeues_ = &operationFamily.Add({{"operation", "dequeue_empty"}});

        rejectedFamily_ = &prometheus::BuildCounter()
            .Name("queue_storage_rejected_total")
            .Help("Operations rejected by the storage layer")
            .Register(*registry_);

        auto& queueFamily = prometheus::BuildCounter()
            .Name("queue_storage_queues_total")
            .Help("Destination queues created and evicted")
            .Register(*registry_);

        queuesCreated_ = &queueFamily.Add({{"event", "created"}});
        queuesEvicted_ = &queueFamily.Add({{"event", "evicted"}});

        framesStored_ = &prometheus::BuildGauge()
            .Name("queue_storage_frames_stored")
            .Help("Frames currently held across all destinations")
            .Register(*registry_)
            .Add({});

        queueCount_ = &prometheus::BuildGauge()
            .Name("queue_storage_queues")
            .Help("Destination queues currently allocated")
            .Register(*registry_)
            .Add({});
    }
};

StorageMetrics::StorageMetrics(std::shared_ptr<prometheus::Registry> registry)
    : impl_(std::make_unique<Impl>(registry ? std::move(registry)
                                            : std::make_shared<prometheus::Registry>())) {}

StorageMetrics::~StorageMetrics() = default;

void StorageMetrics::recordEnqueue() {
    impl_->framesEnqueued_->Increment();
}

void StorageMetrics::recordRequeue() {
    impl_->framesRequeued_->Increment();
}

void StorageMetrics::recordDequeue() {
    impl_->framesDequeued_->Increment();
}

void StorageMetrics::recordEmptyDequeue() {
    impl_->emptyDequeues_->Increment();
}

void StorageMetrics::recordRejected(ErrorType reason) {
    impl_->rejectedFamily_->Add({{"reason", errorTypeToString(reason)}}).Increment();
}

void StorageMetrics::recordQueueCreated() {
    impl_->queuesCreated_->Increment();
}

void StorageMetrics::recordQueuesEvicted(size_t count) {
    impl_->queuesEvicted_->Increment(static_cast<double>(count));
}

void StorageMetrics::setFramesStored(size_t count) {
    impl_->framesStored_->Set(static_cast<double>(count));
}

void StorageMetrics::setQueueCount(size_t count) {
    impl_->queueCount_->Set(static_cast<double>(count));
}

std::shared_ptr<prometheus::Registry> StorageMetrics::getRegistry() const {
    return impl_->registry_;
}

} // namespace queue_storage
