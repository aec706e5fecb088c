#pragma once

#include <string>

#include <nlohmann/json.hpp>

#include "voice_relay/call/call_log.hpp"
#include "voice_relay/call/session.hpp"
#include "voice_relay/transport/connection.hpp"

namespace voice_relay {
namespace realtime {

struct ModelAdapterOptions {
    // Drop audio deltas tagged with a turn id that was already cancelled.
    bool drop_cancelled_turn_audio = false;
};

// Model -> telephony direction of a call, plus the session configuration sent
// when the model connection opens.
class ModelAdapter {
public:
    ModelAdapter(call::CallSession& session,
                 transport::Connection& model,
                 transport::Connection& telephony,
                 ModelAdapterOptions options = {});

    bool send_session_update(const nlohmann::json& session_update);

    // Consumes model events until the model connection closes.
    void run();
    void handle_message(const std::string& text);

private:
    void dispatch(const std::string& type, const nlohmann::json& event, const call::CallLog& log);
    void handle_turn_start(const nlohmann::json& event, const call::CallLog& log);
    void handle_turn_end(const nlohmann::json& event, const call::CallLog& log);
    void forward_audio_delta(const nlohmann::json& event, const call::CallLog& log);
    void report_error(const nlohmann::json& event, const call::CallLog& log);

    call::CallSession& session_;
    transport::Connection& model_;
    transport::Connection& telephony_;
    ModelAdapterOptions options_;
};

}
}
