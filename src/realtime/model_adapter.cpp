#include "voice_relay/realtime/model_adapter.hpp"

#include <exception>

#include "voice_relay/logging.hpp"
#include "voice_relay/metrics.hpp"
#include "voice_relay/realtime/events.hpp"
#include "voice_relay/telephony/frames.hpp"
#include "voice_relay/utils/base64.hpp"

namespace voice_relay {
namespace realtime {

ModelAdapter::ModelAdapter(call::CallSession& session,
                           transport::Connection& model,
                           transport::Connection& telephony,
                           ModelAdapterOptions options)
    : session_(session),
      model_(model),
      telephony_(telephony),
      options_(options) {}

bool ModelAdapter::send_session_update(const nlohmann::json& session_update) {
    const auto payload = session_update.dump();
    logging::debug(
        "Sending session update",
        {kv("payload", payload)});
    return model_.send(payload);
}

void ModelAdapter::run() {
    while (auto message = model_.receive()) {
        handle_message(*message);
    }
}

void ModelAdapter::handle_message(const std::string& text) {
    const logging::StreamScope scope(session_.stream_id().value_or(""));
    const auto log = session_.log();
    nlohmann::json event;
    std::string type;
    try {
        event = nlohmann::json::parse(text);
        type = event.at("type").get<std::string>();
    } catch (const std::exception& ex) {
        logging::error(
            "Malformed model event",
            {kv("error", ex.what())});
        log.error(std::string("Malformed model event: ") + ex.what());
        return;
    }

    if (is_loggable_event(type)) {
        log.info("OpenAI event: " + type);
        log.debug("Full event payload: " + event.dump());
    }

    try {
        dispatch(type, event, log);
    } catch (const std::exception& ex) {
        logging::error(
            "Model event handling failed",
            {kv("type", type),
             kv("error", ex.what())});
        log.error("Error handling " + type + " event: " + ex.what());
    }
}

void ModelAdapter::dispatch(const std::string& type,
                            const nlohmann::json& event,
                            const call::CallLog& log) {
    if (type == event::kTurnStart) {
        handle_turn_start(event, log);
    } else if (type == event::kTurnEnd) {
        handle_turn_end(event, log);
    } else if (type == event::kAudioDelta) {
        forward_audio_delta(event, log);
    } else if (type == event::kError) {
        report_error(event, log);
    }
}

void ModelAdapter::report_error(const nlohmann::json& event, const call::CallLog& log) {
    std::string message;
    const auto details = event.find("error");
    if (details != event.end() && details->is_object()) {
        const auto text = details->find("message");
        if (text != details->end() && !text->is_null()) {
            message = text->is_string() ? text->get<std::string>() : text->dump();
        }
    }
    logging::error(
        "Model reported an error",
        {kv("message", message)});
    log.error("OpenAI error: " + event.dump());
}

void ModelAdapter::handle_turn_start(const nlohmann::json& event, const call::CallLog& log) {
    const auto turn_id = turn_id_of(event);
    if (!turn_id) {
        log.warn("Turn start without id ignored");
        return;
    }
    auto& turns = session_.turns();
    if (const auto superseded = turns.on_turn_start(*turn_id)) {
        if (model_.send(make_response_cancel(*superseded).dump())) {
            Metrics::instance().increment(metric::kTurnCancellations);
            log.info("Cancelled response for turn " + *superseded);
        } else {
            log.warn("Could not cancel response for turn " + *superseded);
        }
    }
    log.info("New turn started: " + *turns.active_turn());
}

void ModelAdapter::handle_turn_end(const nlohmann::json& event, const call::CallLog& log) {
    const auto turn_id = turn_id_of(event);
    log.info("Turn ended: " + turn_id.value_or("None"));
    if (!turn_id) {
        return;
    }
    const auto result = session_.turns().on_turn_end(*turn_id);
    if (result == call::TurnController::EndResult::Stale) {
        log.info("Ignoring end of turn " + *turn_id + ", active turn is " +
                 session_.turns().active_turn().value_or("None"));
    }
}

void ModelAdapter::forward_audio_delta(const nlohmann::json& event, const call::CallLog& log) {
    const auto delta = event.find("delta");
    if (delta == event.end() || !delta->is_string() || delta->get_ref<const std::string&>().empty()) {
        return;
    }
    if (options_.drop_cancelled_turn_audio) {
        const auto turn = event.find("turn_id");
        if (turn != event.end() && (turn->is_string() || turn->is_number())) {
            const auto turn_id = turn->is_string() ? turn->get<std::string>() : turn->dump();
            if (session_.turns().was_cancelled(turn_id)) {
                log.debug("Dropped audio delta from cancelled turn " + turn_id);
                return;
            }
        }
    }
    const auto stream_id = session_.stream_id();
    if (!stream_id) {
        logging::warn("Audio delta dropped: call has no stream id yet");
        return;
    }
    if (!telephony_.is_open()) {
        return;
    }

    try {
        const auto payload = utils::base64_encode(
            utils::base64_decode(delta->get<std::string>()));
        if (!telephony_.send(telephony::make_media_frame(*stream_id, payload).dump())) {
            return;
        }
        Metrics::instance().increment(metric::kModelAudioDeltas);
        log.info("Sent audio response to Twilio");
        log.debug("Audio response size: " + std::to_string(payload.size()));
    } catch (const std::exception& ex) {
        Metrics::instance().increment(metric::kAudioDecodeErrors);
        log.error(std::string("Error processing audio data: ") + ex.what());
    }
}

}
}
