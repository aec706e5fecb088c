#include "voice_relay/telephony/frames.hpp"

namespace voice_relay {
namespace telephony {

InboundFrame parse_inbound_frame(const std::string& text) {
    InboundFrame frame;
    frame.raw = nlohmann::json::parse(text);
    frame.event = frame.raw.at("event").get<std::string>();
    if (frame.event == "start") {
        frame.kind = FrameKind::Start;
        frame.stream_id = frame.raw.at("start").at("streamSid").get<std::string>();
    } else if (frame.event == "media") {
        frame.kind = FrameKind::Media;
        frame.payload = frame.raw.at("media").at("payload").get<std::string>();
    } else if (frame.event == "stop") {
        frame.kind = FrameKind::Stop;
    }
    return frame;
}

nlohmann::json make_media_frame(const std::string& stream_id, const std::string& payload) {
    return {
        {"event", "media"},
        {"streamSid", stream_id},
        {"media", {{"payload", payload}}}
    };
}

}
}
