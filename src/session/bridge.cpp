#include "voice_relay/session/bridge.hpp"

#include <chrono>
#include <exception>
#include <thread>
#include <utility>

#include "voice_relay/call/session.hpp"
#include "voice_relay/logging.hpp"
#include "voice_relay/metrics.hpp"
#include "voice_relay/telephony/ingress.hpp"

namespace voice_relay {
namespace session {

SessionBridge::SessionBridge(call::CallLogRegistry& registry,
                             ModelConnector connect_model,
                             nlohmann::json session_update,
                             realtime::ModelAdapterOptions options)
    : registry_(registry),
      connect_model_(std::move(connect_model)),
      session_update_(std::move(session_update)),
      options_(options) {}

void SessionBridge::run(transport::Connection& telephony) {
    const auto started = std::chrono::steady_clock::now();
    Metrics::instance().session_opened();

    std::unique_ptr<transport::Connection> model;
    try {
        model = connect_model_();
    } catch (const std::exception& ex) {
        logging::error(
            "Model connection failed",
            {kv("error", ex.what())});
    }

    if (model) {
        try {
            relay(telephony, *model);
        } catch (const std::exception& ex) {
            logging::error(
                "Session failed",
                {kv("error", ex.what())});
        }
        model->close();
    } else {
        Metrics::instance().increment(metric::kModelConnectFailures);
    }
    telephony.close();

    const auto elapsed = std::chrono::duration<double>(
        std::chrono::steady_clock::now() - started).count();
    Metrics::instance().session_closed(elapsed);
}

void SessionBridge::relay(transport::Connection& telephony, transport::Connection& model) {
    call::CallSession session;
    realtime::ModelAdapter model_adapter(session, model, telephony, options_);
    if (!model_adapter.send_session_update(session_update_)) {
        logging::error("Session update could not be sent, ending call");
        return;
    }
    telephony::TelephonyIngress ingress(session, registry_, model);

    // Whichever side ends first closes the other, so both pumps drain and stop.
    std::thread model_pump([&]() {
        try {
            model_adapter.run();
        } catch (const std::exception& ex) {
            logging::error(
                "Model pump failed",
                {kv("stream_sid", session.stream_id().value_or("")),
                 kv("error", ex.what())});
            session.log().error(std::string("Error in send_to_twilio: ") + ex.what());
        }
        telephony.close();
    });

    try {
        const auto reason = ingress.run(telephony);
        logging::info(
            "Telephony stream ended",
            {kv("stream_sid", session.stream_id().value_or("")),
             kv("reason", reason == telephony::TelephonyIngress::ExitReason::Stopped
                              ? "stop"
                              : "closed")});
    } catch (const std::exception& ex) {
        logging::error(
            "Telephony pump failed",
            {kv("stream_sid", session.stream_id().value_or("")),
             kv("error", ex.what())});
        session.log().error(std::string("Error in receive_from_twilio: ") + ex.what());
    }
    telephony.close();
    model.close();
    model_pump.join();

    session.log().info("Call ended");
    logging::info(
        "Call ended",
        {kv("stream_sid", session.stream_id().value_or("")),
         kv("call_log", session.log().path().string())});
    session.close_log();
}

}
}
