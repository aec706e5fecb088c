#pragma once

#include <string>

#include <nlohmann/json.hpp>

namespace voice_relay {
namespace telephony {

enum class FrameKind {
    Start,
    Media,
    Stop,
    Other
};

struct InboundFrame {
    FrameKind kind = FrameKind::Other;
    std::string event;
    std::string stream_id;
    std::string payload;
    nlohmann::json raw;
};

// Throws nlohmann::json::exception when the text is not JSON or a start/media
// frame lacks its required fields.
InboundFrame parse_inbound_frame(const std::string& text);

nlohmann::json make_media_frame(const std::string& stream_id, const std::string& payload);

}
}
