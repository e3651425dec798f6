// components/queue_storage/benchmark/benchmark_storage.cpp
#include <benchmark/benchmark.h>
#include "queue_storage/memory_queue_storage.hpp"
#include "queue_storage/message_id.hpp"
#include <spdlog/spdlog.h>
#include <memory>

using namespace queue_storage;

static StorageConfig getBenchmarkConfig() {
    StorageConfig config;
    config.messageIdPrefix = "bench";
    return config;
}

static Frame makeFrame(size_t bodySize) {
    Frame frame(commands::Message);
    frame.setHeader(headers::ContentType, "application/octet-stream");
    frame.setBody(std::vector<uint8_t>(bodySize, 0x42));
    return frame;
}

static void BM_GenerateMessageId(benchmark::State& state) {
    MessageIdGenerator generator("bench");
    for (auto _ : state) {
        auto id = generator.next();
        benchmark::DoNotOptimize(id);
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_GenerateMessageId);

static void BM_EnqueueDequeue(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    MemoryQueueStorage storage(getBenchmarkConfig());
    if (!storage.start()) {
        state.SkipWithError("storage failed to start");
        return;
    }

    const Frame prototype = makeFrame(static_cast<size_t>(state.range(0)));
    for (auto _ : state) {
        auto id = storage.enqueue("bench", Frame(prototype));
        auto frame = storage.dequeue("bench");
        benchmark::DoNotOptimize(id);
        benchmark::DoNotOptimize(frame);
    }

    state.SetItemsProcessed(state.iterations());
    state.SetBytesProcessed(state.iterations() * state.range(0));
}
BENCHMARK(BM_EnqueueDequeue)->Arg(64)->Arg(1024)->Arg(16384);

static void BM_RequeueDequeue(benchmark::State& state) {
    spdlog::set_level(spdlog::level::warn);
    MemoryQueueStorage storage(getBenchmarkConfig());
    if (!storage.start()) {
        state.SkipWithError("storage failed to start");
        return;
    }

    for (int i = 0; i < 1000; ++i) {
        if (!storage.enqueue("bench", makeFrame(128))) {
            state.SkipWithError("enqueue failed");
            return;
        }
    }

    for (auto _ : state) {
        auto frame = storage.dequeue("bench");
        if (frame && frame.value) {
            auto id = storage.requeue("bench", std::move(*frame.value));
            benchmark::DoNotOptimize(id);
        }
    }

    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_RequeueDequeue);

// Shared instance for the multi-threaded benchmarks; thread 0 owns the lifecycle
static std::unique_ptr<MemoryQueueStorage> g_sharedStorage;

static void BM_ContendedSameDestination(benchmark::State& state) {
    if (state.thread_index() == 0) {
        spdlog::set_level(spdlog::level::warn);
        g_sharedStorage = std::make_unique<MemoryQueueStorage>(getBenchmarkConfig());
        if (!g_sharedStorage->start()) {
            state.SkipWithError("storage failed to start");
        }
    }

    const Frame prototype = makeFrame(128);
    for (auto _ : state) {
        auto id = g_sharedStorage->enqueue("shared", Frame(prototype));
        auto frame = g_sharedStorage->dequeue("shared");
        benchmark::DoNotOptimize(id);
        benchmark::DoNotOptimize(frame);
    }

    if (state.thread_index() == 0) {
        g_sharedStorage.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_ContendedSameDestination)->Threads(1)->Threads(4)->Threads(8);

static void BM_IndependentDestinations(benchmark::State& state) {
    if (state.thread_index() == 0) {
        spdlog::set_level(spdlog::level::warn);
        g_sharedStorage = std::make_unique<MemoryQueueStorage>(getBenchmarkConfig());
        if (!g_sharedStorage->start()) {
            state.SkipWithError("storage failed to start");
        }
    }

    const std::string destination = "dest-" + std::to_string(state.thread_index());
    const Frame prototype = makeFrame(128);
    for (auto _ : state) {
        auto id = g_sharedStorage->enqueue(destination, Frame(prototype));
        auto frame = g_sharedStorage->dequeue(destination);
        benchmark::DoNotOptimize(id);
        benchmark::DoNotOptimize(frame);
    }

    if (state.thread_index() == 0) {
        g_sharedStorage.reset();
    }
    state.SetItemsProcessed(state.iterations());
}
BENCHMARK(BM_IndependentDestinations)->Threads(1)->Threads(4)->Threads(8);

BENCHMARK_MAIN();
