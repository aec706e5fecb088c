#pragma once

#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace voice_relay {
namespace realtime {

namespace event {

constexpr const char* kSessionUpdate = "session.update";
constexpr const char* kAudioAppend = "input_audio_buffer.append";
constexpr const char* kResponseCancel = "response.cancel";
constexpr const char* kAudioDelta = "response.audio.delta";
constexpr const char* kTurnStart = "turn.start";
constexpr const char* kTurnEnd = "turn.end";
constexpr const char* kError = "error";

}

// Events summarized in the call log.
bool is_loggable_event(const std::string& type);

nlohmann::json make_audio_append(const std::string& payload);
nlohmann::json make_response_cancel(const std::string& turn_id);

// turn.id of a turn event as text; std::nullopt when absent or neither a
// string nor a number.
std::optional<std::string> turn_id_of(const nlohmann::json& event);

}
}
