#pragma once

#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include <string>

namespace voice_relay {
namespace transport {

// Hands messages from a network event loop to a blocking consumer.
class MessageChannel {
public:
    // Returns false if the channel is already closed.
    bool push(std::string message);

    // Blocks until a message arrives or the channel is closed and drained.
    std::optional<std::string> pop();

    void close();
    bool is_closed() const;
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> queue_;
    bool closed_ = false;
};

}
}
