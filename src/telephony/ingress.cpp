#include "voice_relay/telephony/ingress.hpp"

#include <exception>

#include "voice_relay/logging.hpp"
#include "voice_relay/metrics.hpp"
#include "voice_relay/realtime/events.hpp"

namespace voice_relay {
namespace telephony {

TelephonyIngress::TelephonyIngress(call::CallSession& session,
                                   call::CallLogRegistry& registry,
                                   transport::Connection& model)
    : session_(session),
      registry_(registry),
      model_(model) {}

TelephonyIngress::ExitReason TelephonyIngress::run(transport::Connection& telephony) {
    while (auto message = telephony.receive()) {
        if (!handle_message(*message)) {
            return ExitReason::Stopped;
        }
    }
    session_.log().info("Client disconnected");
    return ExitReason::PeerClosed;
}

bool TelephonyIngress::handle_message(const std::string& text) {
    const logging::StreamScope scope(session_.stream_id().value_or(""));
    InboundFrame frame;
    try {
        frame = parse_inbound_frame(text);
    } catch (const std::exception& ex) {
        logging::error(
            "Malformed telephony frame",
            {kv("error", ex.what())});
        session_.log().error(std::string("Malformed telephony frame: ") + ex.what());
        return true;
    }

    switch (frame.kind) {
    case FrameKind::Start:
        handle_start(frame);
        return true;
    case FrameKind::Media:
        handle_media(frame);
        return true;
    case FrameKind::Stop:
        session_.log().info("Call stopped - Stream SID: " + session_.stream_id().value_or(""));
        return false;
    case FrameKind::Other:
        logging::debug(
            "Telephony event ignored",
            {kv("event", frame.event)});
        return true;
    }
    return true;
}

void TelephonyIngress::handle_start(const InboundFrame& frame) {
    if (session_.has_started()) {
        logging::warn(
            "Duplicate start frame ignored",
            {kv("new_stream_sid", frame.stream_id)});
        session_.log().warn("Duplicate start event ignored: " + frame.raw.dump());
        return;
    }

    call::CallLog log;
    try {
        log = registry_.open(frame.stream_id);
    } catch (const std::exception& ex) {
        // The call is relayed without an audit trail rather than dropped.
        logging::error(
            "Failed to open call log",
            {kv("stream_sid", frame.stream_id),
             kv("error", ex.what())});
    }
    if (!session_.start(frame.stream_id, log)) {
        return;
    }
    logging::info(
        "Call started",
        {kv("stream_sid", frame.stream_id),
         kv("call_log", log.path().string())});
    log.info("Call started - Stream SID: " + frame.stream_id);
    log.info("Start event payload: " + frame.raw.dump());
}

void TelephonyIngress::handle_media(const InboundFrame& frame) {
    if (!model_.is_open()) {
        Metrics::instance().increment(metric::kTelephonyFramesDropped);
        return;
    }
    const auto log = session_.log();
    log.info("Received audio data from Twilio");
    log.debug("Audio payload size: " + std::to_string(frame.payload.size()));
    if (!model_.send(realtime::make_audio_append(frame.payload).dump())) {
        Metrics::instance().increment(metric::kTelephonyFramesDropped);
        return;
    }
    Metrics::instance().increment(metric::kTelephonyMediaFrames);
}

}
}
