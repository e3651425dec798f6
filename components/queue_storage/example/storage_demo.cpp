#include "queue_storage/config.hpp"
#include "queue_storage/queue_storage.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>
#include <atomic>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace po = boost::program_options;
using namespace queue_storage;

namespace {

// Consumes until every producer has finished and the destination is drained.
// Every tenth frame is handed back once, as a broker would after a failed delivery.
size_t runConsumer(QueueStorage& storage, const std::string& destination,
                   const std::atomic<int>& producersDone, int producers) {
    size_t delivered = 0;

    for (;;) {
        bool finished = producersDone.load() == producers;

        auto result = storage.dequeue(destination);
        if (!result) {
            spdlog::error("Dequeue failed: {} - {}", errorTypeToString(result.error), result.message);
            break;
        }

        if (!result.value) {
            if (finished) {
                break;
            }
            std::this_thread::yield();
            continue;
        }

        Frame frame = std::move(*result.value);
        if (!frame.hasHeader("redelivered") && frame.getBodyString().back() == '0') {
            frame.setHeader("redelivered", "true");
            auto requeued = storage.requeue(destination, std::move(frame));
            if (requeued) {
                spdlog::debug("Simulated failed delivery of {}", *requeued);
                continue;
            }
            if (requeued.error != ErrorType::QueueFull) {
                spdlog::error("Requeue failed: {}", requeued.message);
                break;
            }
            // A producer took the slot back; the frame is still ours, deliver it now
            spdlog::debug("Redelivery of {} refused, delivering directly", frame.getMessageId());
        }

        ++delivered;
    }

    return delivered;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        po::options_description desc("Queue storage demo options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("destination,d", po::value<std::string>()->default_value("orders"), "Destination name")
            ("count,n", po::value<int>()->default_value(1000), "Frames per producer")
            ("producers,p", po::value<int>()->default_value(4), "Number of producer threads")
            ("debug", po::bool_switch()->default_value(false), "Enable debug logging");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        spdlog::set_level(vm["debug"].as<bool>() ? spdlog::level::debug : spdlog::level::info);

        StorageConfig config;
        if (vm.count("config")) {
            config = Config::loadStorageConfig(vm["config"].as<std::string>());
        }

        const std::string destination = vm["destination"].as<std::string>();
        const int count = vm["count"].as<int>();
        const int producers = vm["producers"].as<int>();

        auto storage = createQueueStorage(config);
        auto started = storage->start();
        if (!started) {
            std::cerr << "Failed to start storage: " << errorTypeToString(started.error)
                      << " - " << started.message << std::endl;
            return 1;
        }

        std::atomic<int> producersDone{0};
        std::atomic<bool> consumerDone{false};
        std::atomic<size_t> rejected{0};
        std::vector<std::thread> threads;

        for (int p = 0; p < producers; ++p) {
            threads.emplace_back([&, p]() {
                for (int i = 0; i < count; ++i) {
                    Frame frame(commands::Message);
                    frame.setHeader(headers::Destination, destination);
                    frame.setBody("producer " + std::to_string(p) + " frame " + std::to_string(i));

                    // Retry on backpressure; anything else is counted and dropped
                    for (;;) {
                        auto result = storage->enqueue(destination, std::move(frame));
                        if (result) {
                            break;
                        }
                        if (result.error != ErrorType::QueueFull || consumerDone.load()) {
                            rejected++;
                            break;
                        }
                        std::this_thread::yield();
                    }
                }
                producersDone++;
            });
        }

        size_t delivered = runConsumer(*storage, destination, producersDone, producers);
        // Producers still waiting on QueueFull have nobody left to drain for them
        consumerDone = true;

        for (auto& thread : threads) {
            thread.join();
        }

        if (config.idleQueueTimeout.count() > 0) {
            auto evicted = storage->evictIdleQueues(config.idleQueueTimeout);
            if (evicted) {
                spdlog::info("Evicted {} idle queues", *evicted);
            }
        }

        std::cout << "Delivered " << delivered << " frames, rejected " << rejected.load() << std::endl;
        std::cout << toString(storage->getStats()) << std::endl;

        auto stopped = storage->stop();
        if (!stopped) {
            // Shutdown proceeds regardless
            spdlog::warn("Storage stop reported: {}", stopped.message);
        }

        return delivered == static_cast<size_t>(producers) * static_cast<size_t>(count) - rejected.load() ? 0 : 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
