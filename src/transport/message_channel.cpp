#include "voice_relay/transport/message_channel.hpp"

#include <utility>

namespace voice_relay {
namespace transport {

bool MessageChannel::push(std::string message) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        queue_.push_back(std::move(message));
    }
    cv_.notify_one();
    return true;
}

std::optional<std::string> MessageChannel::pop() {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [this]() { return closed_ || !queue_.empty(); });
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto message = std::move(queue_.front());
    queue_.pop_front();
    return message;
}

void MessageChannel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

bool MessageChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

size_t MessageChannel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

}
}
