#pragma once

#include <memory>
#include <thread>

#include <httplib.h>

#include "voice_relay/config.hpp"

namespace voice_relay {

class HttpServer {
public:
    explicit HttpServer(const Config& config);

    void start();
    void stop();

private:
    void handle_incoming_call(const httplib::Request& request, httplib::Response& response) const;

    const Config& config_;
    std::unique_ptr<httplib::Server> server_;
    std::thread server_thread_;
};

}
