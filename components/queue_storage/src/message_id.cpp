#include "queue_storage/message_id.hpp"
#include <iomanip>
#include <random>
#include <sstream>

namespace queue_storage {

MessageIdGenerator::MessageIdGenerator(const std::string& prefix)
    : prefix_(prefix.empty() ? randomPrefix() : prefix) {}

std::string MessageIdGenerator::next() {
    uint64_t seq = sequence_.fetch_add(1, std::memory_order_relaxed) + 1;
    return prefix_ + "-" + std::to_string(seq);
}

std::string MessageIdGenerator::randomPrefix() {
    static thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<uint64_t> dis;

    std::ostringstream oss;
    oss << "msg_" << std::hex << std::setw(16) << std::setfill('0') << dis(gen);
    return oss.str();
}

} // namespace queue_storage
