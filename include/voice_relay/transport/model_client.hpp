#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "voice_relay/transport/connection.hpp"
#include "voice_relay/transport/message_channel.hpp"

namespace voice_relay {
namespace transport {

struct ModelClientOptions {
    std::string url;
    std::vector<std::pair<std::string, std::string>> headers;
    bool verify_peer = true;
    std::chrono::seconds connect_timeout{10};
};

// TLS WebSocket client for the model realtime endpoint. The websocket event
// loop runs on a private worker thread; received messages are queued for
// receive(). There is no reconnect: once closed, the client stays closed.
class ModelClient : public Connection {
public:
    explicit ModelClient(ModelClientOptions options);
    ~ModelClient() override;

    ModelClient(const ModelClient&) = delete;
    ModelClient& operator=(const ModelClient&) = delete;

    // Blocks until the handshake completes. Throws TransportError on failure
    // or timeout.
    void connect();

    std::optional<std::string> receive() override;
    bool send(const std::string& message) override;
    void close() override;
    bool is_open() const override;

private:
    enum class State {
        Idle,
        Connecting,
        Open,
        Failed,
        Closed
    };

    void set_state(State state, const std::string& reason = {});

    ModelClientOptions options_;
    MessageChannel inbox_;
    std::thread worker_;
    mutable std::mutex state_mutex_;
    std::condition_variable state_cv_;
    State state_ = State::Idle;
    std::string failure_reason_;
    std::mutex ws_mutex_;
    struct WsState;
    std::unique_ptr<WsState> ws_state_;
};

}
}
