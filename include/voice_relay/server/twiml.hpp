#pragma once

#include <string>

#include "voice_relay/config.hpp"

namespace voice_relay {
namespace server {

// Greets the caller, then connects a bidirectional media stream to stream_url.
std::string render_incoming_call_twiml(const Config& config, const std::string& stream_url);

// MEDIA_STREAM_URL when configured, otherwise wss://<host>/media-stream with any
// port stripped from the Host header.
std::string media_stream_url(const Config& config, const std::string& host_header);

std::string xml_escape(const std::string& text);

}
}
