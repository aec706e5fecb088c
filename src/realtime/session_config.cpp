#include "voice_relay/realtime/session_config.hpp"

#include "voice_relay/realtime/events.hpp"

namespace voice_relay {
namespace realtime {

nlohmann::json make_session_update(const Config& config, const std::string& instructions) {
    nlohmann::json turn_detection = nullptr;
    if (config.turn_detection == TurnDetection::ServerVad) {
        turn_detection = {
            {"type", "server_vad"},
            {"mode", config.turn_detection_mode},
            {"time_units", {
                {"speech_gap_ms", config.speech_gap_ms},
                {"speech_timeout_ms", config.speech_timeout_ms}
            }}
        };
    }

    return {
        {"type", event::kSessionUpdate},
        {"session", {
            {"turn_detection", turn_detection},
            {"input_audio_format", config.input_audio_format},
            {"output_audio_format", config.output_audio_format},
            {"voice", config.voice},
            {"instructions", instructions},
            {"modalities", {"text", "audio"}},
            {"temperature", config.temperature}
        }}
    };
}

}
}
