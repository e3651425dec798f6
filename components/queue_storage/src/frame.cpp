#include "queue_storage/frame.hpp"
#include <sstream>

namespace queue_storage {

Frame::Frame() : command_(commands::Message) {}

Frame::Frame(const std::string& command) : command_(command) {}

Frame::Frame(const std::string& command, Headers headers, std::vector<uint8_t> body)
    : command_(command), headers_(std::move(headers)), body_(std::move(body)) {}

Frame::Frame(const std::string& command, Headers headers, const std::string& body)
    : command_(command), headers_(std::move(headers)), body_(body.begin(), body.end()) {}

const std::string& Frame::getCommand() const {
    return command_;
}

void Frame::setCommand(const std::string& command) {
    command_ = command;
}

void Frame::setHeader(const std::string& name, const std::string& value) {
    headers_[name] = value;
}

std::optional<std::string> Frame::getHeader(const std::string& name) const {
    auto it = headers_.find(name);
    if (it == headers_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Frame::hasHeader(const std::string& name) const {
    return headers_.find(name) != headers_.end();
}

void Frame::removeHeader(const std::string& name) {
    headers_.erase(name);
}

void Frame::clearHeaders() {
    headers_.clear();
}

const Headers& Frame::getHeaders() const {
    return headers_;
}

bool Frame::hasMessageId() const {
    auto it = headers_.find(headers::MessageId);
    return it != headers_.end() && !it->second.empty();
}

std::string Frame::getMessageId() const {
    auto it = headers_.find(headers::MessageId);
    return it == headers_.end() ? std::string() : it->second;
}

void Frame::setMessageId(const std::string& id) {
    headers_[headers::MessageId] = id;
}

const std::vector<uint8_t>& Frame::getBody() const {
    return body_;
}

std::string Frame::getBodyString() const {
    return std::string(body_.begin(), body_.end());
}

void Frame::setBody(const std::vector<uint8_t>& body) {
    body_ = body;
}

void Frame::setBody(const std::string& body) {
    body_.assign(body.begin(), body.end());
}

void Frame::setBody(const uint8_t* data, size_t length) {
    if (data && length > 0) {
        body_.assign(data, data + length);
    } else {
        body_.clear();
    }
}

size_t Frame::getBodyLength() const {
    return body_.size();
}

size_t Frame::estimateSize() const {
    // command + newline, "name:value\n" per header, blank line, body, NUL
    size_t size = command_.size() + 1;
    for (const auto& [name, value] : headers_) {
        size += name.size() + value.size() + 2;
    }
    return size + 1 + body_.size() + 1;
}

bool Frame::isEmpty() const {
    return body_.empty();
}

std::string Frame::toString() const {
    std::ostringstream oss;
    oss << "Frame{command=" << command_;
    if (hasMessageId()) {
        oss << ", message-id=" << getMessageId();
    }
    oss << ", headers=" << headers_.size()
        << ", body=" << body_.size() << " bytes}";
    return oss.str();
}

bool Frame::operator==(const Frame& other) const {
    return command_ == other.command_ &&
           headers_ == other.headers_ &&
           body_ == other.body_;
}

bool Frame::operator!=(const Frame& other) const {
    return !(*this == other);
}

} // namespace queue_storage
