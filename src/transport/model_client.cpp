#include "voice_relay/transport/model_client.hpp"

#include <boost/asio/ssl/context.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <websocketpp/client.hpp>
#include <websocketpp/config/asio_client.hpp>
#include <websocketpp/uri.hpp>

#include "voice_relay/logging.hpp"

namespace voice_relay {
namespace transport {

namespace {

using WsClient = websocketpp::client<websocketpp::config::asio_tls_client>;
using SslContext = boost::asio::ssl::context;

websocketpp::lib::shared_ptr<SslContext> make_tls_context(const std::string& host,
                                                          bool verify_peer) {
    auto context = websocketpp::lib::make_shared<SslContext>(SslContext::tlsv12_client);
    context->set_options(SslContext::default_workarounds |
                         SslContext::no_sslv2 |
                         SslContext::no_sslv3 |
                         SslContext::single_dh_use);
    if (verify_peer) {
        context->set_default_verify_paths();
        context->set_verify_mode(boost::asio::ssl::verify_peer);
        context->set_verify_callback(boost::asio::ssl::host_name_verification(host));
    } else {
        context->set_verify_mode(boost::asio::ssl::verify_none);
    }
    return context;
}

}

struct ModelClient::WsState {
    std::shared_ptr<WsClient> client;
    websocketpp::connection_hdl connection;
};

ModelClient::ModelClient(ModelClientOptions options)
    : options_(std::move(options)) {}

ModelClient::~ModelClient() {
    close();
    if (worker_.joinable()) {
        worker_.join();
    }
}

void ModelClient::connect() {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Idle) {
            throw TransportError("model client already used");
        }
        state_ = State::Connecting;
    }

    const websocketpp::uri uri(options_.url);
    if (!uri.get_valid() || !uri.get_secure()) {
        set_state(State::Failed, "invalid url");
        throw TransportError("invalid model url " + options_.url);
    }
    const auto host = uri.get_host();

    auto client = std::make_shared<WsClient>();
    client->clear_access_channels(websocketpp::log::alevel::all);
    client->clear_error_channels(websocketpp::log::elevel::all);
    client->init_asio();

    WsClient* endpoint = client.get();
    const bool verify_peer = options_.verify_peer;
    client->set_tls_init_handler([host, verify_peer](websocketpp::connection_hdl) {
        return make_tls_context(host, verify_peer);
    });
    client->set_open_handler([this](websocketpp::connection_hdl) {
        set_state(State::Open);
    });
    client->set_message_handler([this](websocketpp::connection_hdl,
                                       WsClient::message_ptr msg) {
        inbox_.push(msg->get_payload());
    });
    client->set_close_handler([this, endpoint](websocketpp::connection_hdl hdl) {
        auto conn = endpoint->get_con_from_hdl(hdl);
        logging::debug(
            "Model connection closed",
            {kv("code", conn->get_remote_close_code()),
             kv("reason", conn->get_remote_close_reason())});
        set_state(State::Closed);
    });
    client->set_fail_handler([this, endpoint](websocketpp::connection_hdl hdl) {
        auto conn = endpoint->get_con_from_hdl(hdl);
        set_state(State::Failed, conn->get_ec().message());
    });

    websocketpp::lib::error_code ec;
    auto conn = client->get_connection(options_.url, ec);
    if (ec) {
        set_state(State::Failed, ec.message());
        throw TransportError("model connection setup failed: " + ec.message());
    }
    for (const auto& header : options_.headers) {
        conn->append_header(header.first, header.second);
    }
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        ws_state_ = std::make_unique<WsState>();
        ws_state_->client = client;
        ws_state_->connection = conn->get_handle();
    }
    client->connect(conn);
    worker_ = std::thread([this, client]() {
        try {
            client->run();
        } catch (const std::exception& ex) {
            logging::error(
                "Model connection loop failed",
                {kv("error", ex.what())});
            set_state(State::Failed, ex.what());
        }
    });

    std::unique_lock<std::mutex> lock(state_mutex_);
    const bool settled = state_cv_.wait_for(lock, options_.connect_timeout, [this]() {
        return state_ != State::Connecting;
    });
    if (state_ == State::Open) {
        return;
    }
    const auto reason = settled ? failure_reason_ : std::string("handshake timed out");
    lock.unlock();
    close();
    throw TransportError("model connection failed: " + reason);
}

std::optional<std::string> ModelClient::receive() {
    return inbox_.pop();
}

bool ModelClient::send(const std::string& message) {
    if (!is_open()) {
        return false;
    }
    std::lock_guard<std::mutex> lock(ws_mutex_);
    if (!ws_state_ || !ws_state_->client || ws_state_->connection.expired()) {
        return false;
    }
    websocketpp::lib::error_code ec;
    ws_state_->client->send(ws_state_->connection, message,
                            websocketpp::frame::opcode::text, ec);
    if (ec) {
        logging::warn(
            "Model send failed",
            {kv("error", ec.message())});
        return false;
    }
    return true;
}

void ModelClient::close() {
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        was_open = state_ == State::Open || state_ == State::Connecting;
        if (state_ != State::Failed) {
            state_ = State::Closed;
        }
    }
    state_cv_.notify_all();
    {
        std::lock_guard<std::mutex> lock(ws_mutex_);
        if (ws_state_ && ws_state_->client && !ws_state_->connection.expired()) {
            websocketpp::lib::error_code ec;
            if (was_open) {
                ws_state_->client->close(ws_state_->connection,
                                         websocketpp::close::status::normal,
                                         "session ended", ec);
            }
            if (ec || !was_open) {
                ws_state_->client->stop();
            }
        }
    }
    inbox_.close();
}

bool ModelClient::is_open() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_ == State::Open;
}

void ModelClient::set_state(State state, const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ == State::Closed || state_ == State::Failed) {
            return;
        }
        state_ = state;
        if (!reason.empty()) {
            failure_reason_ = reason;
        }
    }
    state_cv_.notify_all();
    if (state == State::Closed || state == State::Failed) {
        inbox_.close();
    }
}

}
}
