#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace voice_relay {
namespace transport {

class TransportError : public std::runtime_error {
public:
    explicit TransportError(const std::string& message) : std::runtime_error(message) {}
};

// One side of a relayed call: a full-duplex stream of text messages.
class Connection {
public:
    virtual ~Connection() = default;

    // Blocks for the next message. std::nullopt once the peer or this side has
    // closed the connection and every buffered message was consumed.
    virtual std::optional<std::string> receive() = 0;

    // Returns false when the connection is closed or the send failed.
    virtual bool send(const std::string& message) = 0;

    // Idempotent. Wakes a receiver blocked in receive().
    virtual void close() = 0;

    virtual bool is_open() const = 0;
};

}
}
