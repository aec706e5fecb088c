#pragma once

#include <functional>
#include <memory>
#include <string>
#include <thread>

#include "voice_relay/transport/connection.hpp"
#include "voice_relay/utils/async.hpp"

namespace voice_relay {
namespace transport {

// Plain WebSocket endpoint for telephony media streams. TLS is expected to be
// terminated in front of it. Every accepted stream is handed to the session
// handler on its own thread, which owns the call until the handler returns.
class MediaStreamServer {
public:
    using SessionHandler = std::function<void(const std::shared_ptr<Connection>&)>;

    MediaStreamServer(int port, std::string path, int max_sessions, SessionHandler on_session);
    ~MediaStreamServer();

    MediaStreamServer(const MediaStreamServer&) = delete;
    MediaStreamServer& operator=(const MediaStreamServer&) = delete;

    void start();
    // Stops accepting, closes open streams and returns once every session
    // handler has returned.
    void stop();
    size_t active_streams() const;

private:
    struct WsState;

    int port_;
    std::string path_;
    int max_sessions_;
    SessionHandler on_session_;
    std::unique_ptr<WsState> ws_state_;
    utils::AsyncGroup sessions_;
    std::thread server_thread_;
};

}
}
