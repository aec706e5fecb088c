#include "voice_relay/app.hpp"

#include <chrono>
#include <csignal>
#include <memory>
#include <thread>
#include <utility>

#include "voice_relay/logging.hpp"
#include "voice_relay/realtime/session_config.hpp"
#include "voice_relay/transport/model_client.hpp"

namespace voice_relay {

namespace {

constexpr const char* kMediaStreamPath = "/media-stream";

std::atomic<bool> g_signal_received{false};

void on_signal(int) {
    g_signal_received = true;
}

}

RelayApp::RelayApp(Config config)
    : config_(std::move(config)),
      call_logs_(config_.logs_dir, logging::parse_level(config_.call_log_level)) {}

void RelayApp::init() {
    std::signal(SIGINT, on_signal);
    std::signal(SIGTERM, on_signal);

    http_server_ = std::make_unique<HttpServer>(config_);
    http_server_->start();

    media_server_ = std::make_unique<transport::MediaStreamServer>(
        config_.media_stream_port, kMediaStreamPath, config_.max_sessions,
        [this](const std::shared_ptr<transport::Connection>& telephony) {
            handle_media_stream(telephony);
        });
    media_server_->start();
}

void RelayApp::run() {
    while (!quitting_ && !g_signal_received) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }
    stop();
}

void RelayApp::stop() {
    if (quitting_.exchange(true)) {
        return;
    }
    logging::info("Shutting down");
    if (media_server_) {
        media_server_->stop();
    }
    if (http_server_) {
        http_server_->stop();
    }
}

const Config& RelayApp::config() const {
    return config_;
}

void RelayApp::handle_media_stream(const std::shared_ptr<transport::Connection>& telephony) {
    const auto instructions = load_system_prompt(config_.prompts_file);
    session::SessionBridge bridge(
        call_logs_,
        [this]() { return connect_model(); },
        realtime::make_session_update(config_, instructions),
        realtime::ModelAdapterOptions{config_.drop_cancelled_turn_audio});
    bridge.run(*telephony);
}

std::unique_ptr<transport::Connection> RelayApp::connect_model() const {
    transport::ModelClientOptions options;
    options.url = config_.realtime_endpoint();
    options.headers = {
        {"Authorization", "Bearer " + config_.openai_api_key},
        {"OpenAI-Beta", "realtime=v1"}
    };
    options.verify_peer = config_.tls_verify_peer;
    auto client = std::make_unique<transport::ModelClient>(std::move(options));
    client->connect();
    logging::debug(
        "Model connection open",
        {kv("url", config_.realtime_endpoint())});
    return client;
}

}
