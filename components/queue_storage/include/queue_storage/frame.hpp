#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace queue_storage {

// Well-known header names
namespace headers {
    inline constexpr const char* MessageId = "message-id";
    inline constexpr const char* Destination = "destination";
    inline constexpr const char* ContentType = "content-type";
    inline constexpr const char* ContentLength = "content-length";
}

namespace commands {
    inline constexpr const char* Message = "MESSAGE";
}

using Headers = std::unordered_map<std::string, std::string>;

// A single message in transit between producer, storage and consumer.
// Storage only ever writes the message-id header.
class Frame {
public:
    // Constructors
    Frame();
    explicit Frame(const std::string& command);
    Frame(const std::string& command, Headers headers, std::vector<uint8_t> body);
    Frame(const std::string& command, Headers headers, const std::string& body);

    Frame(const Frame& other) = default;
    Frame(Frame&& other) noexcept = default;
    Frame& operator=(const Frame& other) = default;
    Frame& operator=(Frame&& other) noexcept = default;

    ~Frame() = default;

    // Command
    const std::string& getCommand() const;
    void setCommand(const std::string& command);

    // Headers
    void setHeader(const std::string& name, const std::string& value);
    std::optional<std::string> getHeader(const std::string& name) const;
    bool hasHeader(const std::string& name) const;
    void removeHeader(const std::string& name);
    void clearHeaders();
    const Headers& getHeaders() const;

    // Message id
    bool hasMessageId() const;
    std::string getMessageId() const;
    void setMessageId(const std::string& id);

    // Body
    const std::vector<uint8_t>& getBody() const;
    std::string getBodyString() const;
    void setBody(const std::vector<uint8_t>& body);
    void setBody(const std::string& body);
    void setBody(const uint8_t* data, size_t length);

    // Size information
    size_t getBodyLength() const;
    size_t estimateSize() const;
    bool isEmpty() const;

    std::string toString() const;

    // Comparison operators
    bool operator==(const Frame& other) const;
    bool operator!=(const Frame& other) const;

private:
    std::string command_;
    Headers headers_;
    std::vector<uint8_t> body_;
};

} // namespace queue_storage
