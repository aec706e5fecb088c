#include "voice_relay/server/http_server.hpp"

#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "voice_relay/logging.hpp"
#include "voice_relay/metrics.hpp"
#include "voice_relay/server/twiml.hpp"

namespace voice_relay {

HttpServer::HttpServer(const Config& config)
    : config_(config) {}

void HttpServer::start() {
    server_ = std::make_unique<httplib::Server>();

    server_->Get("/", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"message", "Twilio Media Stream Server is running!"}};
        res.set_content(payload.dump(), "application/json");
    });

    server_->Get("/health", [](const httplib::Request&, httplib::Response& res) {
        nlohmann::json payload{{"status", "ok"}};
        res.set_content(payload.dump(), "application/json");
        logging::debug("Health check served");
    });

    server_->Get("/metrics", [](const httplib::Request&, httplib::Response& res) {
        res.set_content(Metrics::instance().render_prometheus(),
                        "text/plain; version=0.0.4");
    });

    auto incoming_call = [this](const httplib::Request& req, httplib::Response& res) {
        handle_incoming_call(req, res);
    };
    server_->Get("/incoming-call", incoming_call);
    server_->Post("/incoming-call", incoming_call);

    if (!server_->bind_to_port("0.0.0.0", config_.http_port)) {
        throw std::runtime_error("cannot bind HTTP port " + std::to_string(config_.http_port));
    }
    server_thread_ = std::thread([this]() {
        logging::info(
            "HTTP server listening",
            {kv("port", config_.http_port)});
        server_->listen_after_bind();
    });
}

void HttpServer::stop() {
    if (server_) {
        server_->stop();
    }
    if (server_thread_.joinable()) {
        server_thread_.join();
    }
}

void HttpServer::handle_incoming_call(const httplib::Request& request,
                                      httplib::Response& response) const {
    const auto stream_url = server::media_stream_url(config_,
                                                     request.get_header_value("Host"));
    logging::info(
        "Incoming call answered",
        {kv("from", request.get_param_value("From")),
         kv("call_sid", request.get_param_value("CallSid")),
         kv("stream_url", stream_url)});
    response.set_content(server::render_incoming_call_twiml(config_, stream_url),
                         "application/xml");
}

}
