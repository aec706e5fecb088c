#pragma once

#include <atomic>
#include <memory>

#include "voice_relay/call/call_log.hpp"
#include "voice_relay/config.hpp"
#include "voice_relay/server/http_server.hpp"
#include "voice_relay/session/bridge.hpp"
#include "voice_relay/transport/connection.hpp"
#include "voice_relay/transport/media_stream_server.hpp"

namespace voice_relay {

class RelayApp {
public:
    explicit RelayApp(Config config);

    void init();
    // Blocks until stop() or SIGINT/SIGTERM.
    void run();
    void stop();
    const Config& config() const;

private:
    void handle_media_stream(const std::shared_ptr<transport::Connection>& telephony);
    std::unique_ptr<transport::Connection> connect_model() const;

    Config config_;
    call::CallLogRegistry call_logs_;
    std::unique_ptr<HttpServer> http_server_;
    // Destroyed first: its shutdown waits for sessions using the members above.
    std::unique_ptr<transport::MediaStreamServer> media_server_;
    std::atomic<bool> quitting_{false};
};

}
