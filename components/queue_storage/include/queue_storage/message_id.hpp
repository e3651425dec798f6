#pragma once

#include <atomic>
#include <cstdint>
#include <string>

namespace queue_storage {

/**
 * @brief Allocates message ids that are unique for the lifetime of a generator
 *
 * Ids have the form "<prefix>-<sequence>". The sequence is a monotonically
 * increasing 64-bit counter, so uniqueness only depends on the prefix not
 * being shared by two live generators. An empty prefix is replaced by a
 * random one.
 */
class MessageIdGenerator {
public:
    explicit MessageIdGenerator(const std::string& prefix = "");

    MessageIdGenerator(const MessageIdGenerator&) = delete;
    MessageIdGenerator& operator=(const MessageIdGenerator&) = delete;

    // Thread-safe
    std::string next();

    const std::string& prefix() const { return prefix_; }
    uint64_t issued() const { return sequence_.load(std::memory_order_relaxed); }

    static std::string randomPrefix();

private:
    std::string prefix_;
    std::atomic<uint64_t> sequence_{0};
};

} // namespace queue_storage
