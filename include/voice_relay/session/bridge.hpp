#pragma once

#include <functional>
#include <memory>

#include <nlohmann/json.hpp>

#include "voice_relay/call/call_log.hpp"
#include "voice_relay/realtime/model_adapter.hpp"
#include "voice_relay/transport/connection.hpp"

namespace voice_relay {
namespace session {

// Opens a connected model connection or throws.
using ModelConnector = std::function<std::unique_ptr<transport::Connection>()>;

// Relays one call between an accepted telephony connection and a freshly
// opened model connection.
class SessionBridge {
public:
    SessionBridge(call::CallLogRegistry& registry,
                  ModelConnector connect_model,
                  nlohmann::json session_update,
                  realtime::ModelAdapterOptions options = {});

    // Returns once both directions have finished and both connections are
    // closed. Failures end the call and are logged, never thrown.
    void run(transport::Connection& telephony);

private:
    void relay(transport::Connection& telephony, transport::Connection& model);

    call::CallLogRegistry& registry_;
    ModelConnector connect_model_;
    nlohmann::json session_update_;
    realtime::ModelAdapterOptions options_;
};

}
}
