#include "voice_relay/realtime/events.hpp"

#include <array>

namespace voice_relay {
namespace realtime {

namespace {

const std::array<const char*, 9> kLoggableEvents = {
    "response.content.done",
    "rate_limits.updated",
    "response.done",
    "input_audio_buffer.committed",
    "input_audio_buffer.speech_stopped",
    "input_audio_buffer.speech_started",
    "session.created",
    event::kTurnStart,
    event::kTurnEnd,
};

}

bool is_loggable_event(const std::string& type) {
    for (const auto* name : kLoggableEvents) {
        if (type == name) {
            return true;
        }
    }
    return false;
}

nlohmann::json make_audio_append(const std::string& payload) {
    return {
        {"type", event::kAudioAppend},
        {"audio", payload}
    };
}

nlohmann::json make_response_cancel(const std::string& turn_id) {
    return {
        {"type", event::kResponseCancel},
        {"turn_id", turn_id}
    };
}

std::optional<std::string> turn_id_of(const nlohmann::json& event) {
    const auto turn = event.find("turn");
    if (turn == event.end() || !turn->is_object()) {
        return std::nullopt;
    }
    const auto id = turn->find("id");
    if (id == turn->end()) {
        return std::nullopt;
    }
    if (id->is_string()) {
        return id->get<std::string>();
    }
    // Ids are opaque; numeric ones are kept in their JSON spelling.
    if (id->is_number()) {
        return id->dump();
    }
    return std::nullopt;
}

}
}
