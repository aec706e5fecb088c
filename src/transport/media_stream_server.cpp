#include "voice_relay/transport/media_stream_server.hpp"

#include <atomic>
#include <map>
#include <mutex>
#include <system_error>
#include <utility>
#include <vector>

#include <websocketpp/config/asio_no_tls.hpp>
#include <websocketpp/server.hpp>

#include "voice_relay/logging.hpp"
#include "voice_relay/transport/message_channel.hpp"
#include "voice_relay/utils/async.hpp"

namespace voice_relay {
namespace transport {

namespace {

using WsServer = websocketpp::server<websocketpp::config::asio>;
using websocketpp::connection_hdl;

class ServerConnection : public Connection {
public:
    ServerConnection(std::shared_ptr<WsServer> server, connection_hdl hdl, std::string remote)
        : server_(std::move(server)),
          hdl_(std::move(hdl)),
          remote_(std::move(remote)) {}

    std::optional<std::string> receive() override {
        return inbox_.pop();
    }

    bool send(const std::string& message) override {
        if (!open_) {
            return false;
        }
        websocketpp::lib::error_code ec;
        server_->send(hdl_, message, websocketpp::frame::opcode::text, ec);
        if (ec) {
            logging::warn(
                "Media stream send failed",
                {kv("remote", remote_),
                 kv("error", ec.message())});
            return false;
        }
        return true;
    }

    void close() override {
        if (open_.exchange(false)) {
            websocketpp::lib::error_code ec;
            server_->close(hdl_, websocketpp::close::status::normal, "call ended", ec);
        }
        inbox_.close();
    }

    bool is_open() const override {
        return open_;
    }

    void deliver(std::string message) {
        inbox_.push(std::move(message));
    }

    void peer_closed() {
        open_ = false;
        inbox_.close();
    }

    const std::string& remote() const {
        return remote_;
    }

private:
    std::shared_ptr<WsServer> server_;
    connection_hdl hdl_;
    std::string remote_;
    MessageChannel inbox_;
    std::atomic<bool> open_{true};
};

}

struct MediaStreamServer::WsState {
    std::shared_ptr<WsServer> server = std::make_shared<WsServer>();
    std::mutex mutex;
    bool stopping = false;
    std::map<connection_hdl, std::shared_ptr<ServerConnection>,
             std::owner_less<connection_hdl>> connections;

    std::shared_ptr<ServerConnection> find(const connection_hdl& hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = connections.find(hdl);
        return it == connections.end() ? nullptr : it->second;
    }

    std::shared_ptr<ServerConnection> release(const connection_hdl& hdl) {
        std::lock_guard<std::mutex> lock(mutex);
        const auto it = connections.find(hdl);
        if (it == connections.end()) {
            return nullptr;
        }
        auto connection = it->second;
        connections.erase(it);
        return connection;
    }
};

MediaStreamServer::MediaStreamServer(int port,
                                     std::string path,
                                     int max_sessions,
                                     SessionHandler on_session)
    : port_(port),
      path_(std::move(path)),
      max_sessions_(max_sessions),
      on_session_(std::move(on_session)),
      ws_state_(std::make_unique<WsState>()) {}

MediaStreamServer::~MediaStreamServer() {
    stop();
}

void MediaStreamServer::start() {
    WsState* state = ws_state_.get();
    auto& server = *state->server;
    server.clear_access_channels(websocketpp::log::alevel::all);
    server.clear_error_channels(websocketpp::log::elevel::all);
    server.init_asio();
    server.set_reuse_addr(true);

    server.set_validate_handler([this, state](connection_hdl hdl) {
        auto conn = state->server->get_con_from_hdl(hdl);
        const auto resource = conn->get_resource();
        if (resource.compare(0, resource.find('?'), path_) != 0) {
            logging::warn(
                "Media stream rejected: unknown path",
                {kv("path", resource),
                 kv("remote", conn->get_remote_endpoint())});
            conn->set_status(websocketpp::http::status_code::not_found);
            return false;
        }
        if (max_sessions_ > 0 && active_streams() >= static_cast<size_t>(max_sessions_)) {
            logging::warn(
                "Media stream rejected: session limit reached",
                {kv("limit", max_sessions_),
                 kv("remote", conn->get_remote_endpoint())});
            conn->set_status(websocketpp::http::status_code::service_unavailable);
            return false;
        }
        return true;
    });

    server.set_open_handler([this, state](connection_hdl hdl) {
        auto conn = state->server->get_con_from_hdl(hdl);
        auto connection = std::make_shared<ServerConnection>(state->server, hdl,
                                                             conn->get_remote_endpoint());
        bool accepted = false;
        {
            std::lock_guard<std::mutex> lock(state->mutex);
            if (!state->stopping) {
                state->connections[hdl] = connection;
                accepted = true;
            }
        }
        if (!accepted) {
            connection->close();
            return;
        }
        logging::info(
            "Client connected",
            {kv("remote", connection->remote())});
        auto handler = on_session_;
        try {
            sessions_.run("media_session", [handler, connection]() {
                handler(connection);
                connection->close();
            });
        } catch (const std::system_error& ex) {
            logging::error(
                "Media session could not start",
                {kv("remote", connection->remote()),
                 kv("error", ex.what())});
            state->release(hdl);
            connection->close();
        }
    });

    server.set_message_handler([state](connection_hdl hdl, WsServer::message_ptr msg) {
        if (msg->get_opcode() != websocketpp::frame::opcode::text) {
            return;
        }
        if (auto connection = state->find(hdl)) {
            connection->deliver(msg->get_payload());
        }
    });

    auto on_gone = [state](connection_hdl hdl) {
        if (auto connection = state->release(hdl)) {
            logging::info(
                "Client disconnected",
                {kv("remote", connection->remote())});
            connection->peer_closed();
        }
    };
    server.set_close_handler(on_gone);
    server.set_fail_handler(on_gone);

    server.listen(static_cast<uint16_t>(port_));
    server.start_accept();

    server_thread_ = std::thread([this, state]() {
        logging::info(
            "Media stream server listening",
            {kv("port", port_),
             kv("path", path_)});
        try {
            state->server->run();
        } catch (const std::exception& ex) {
            logging::error(
                "Media stream server stopped",
                {kv("error", ex.what())});
        }
    });
}

void MediaStreamServer::stop() {
    if (!server_thread_.joinable()) {
        return;
    }
    auto& server = *ws_state_->server;
    websocketpp::lib::error_code ec;
    server.stop_listening(ec);

    std::vector<std::shared_ptr<ServerConnection>> open_connections;
    {
        std::lock_guard<std::mutex> lock(ws_state_->mutex);
        ws_state_->stopping = true;
        for (const auto& item : ws_state_->connections) {
            open_connections.push_back(item.second);
        }
    }
    for (const auto& connection : open_connections) {
        connection->close();
    }
    // Session handlers reference their owner; none may outlive this call.
    if (const auto pending = sessions_.active()) {
        logging::info(
            "Waiting for media sessions to finish",
            {kv("sessions", pending)});
    }
    sessions_.wait();
    server_thread_.join();
}

size_t MediaStreamServer::active_streams() const {
    std::lock_guard<std::mutex> lock(ws_state_->mutex);
    return ws_state_->connections.size();
}

}
}
