#pragma once

#include <string>

#include "voice_relay/call/call_log.hpp"
#include "voice_relay/call/session.hpp"
#include "voice_relay/telephony/frames.hpp"
#include "voice_relay/transport/connection.hpp"

namespace voice_relay {
namespace telephony {

// Telephony -> model direction of a call.
class TelephonyIngress {
public:
    enum class ExitReason {
        Stopped,
        PeerClosed
    };

    TelephonyIngress(call::CallSession& session,
                     call::CallLogRegistry& registry,
                     transport::Connection& model);

    ExitReason run(transport::Connection& telephony);

    // Returns false when the frame ends the call.
    bool handle_message(const std::string& text);

private:
    void handle_start(const InboundFrame& frame);
    void handle_media(const InboundFrame& frame);

    call::CallSession& session_;
    call::CallLogRegistry& registry_;
    transport::Connection& model_;
};

}
}
