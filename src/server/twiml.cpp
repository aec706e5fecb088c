#include "voice_relay/server/twiml.hpp"

#include <sstream>

namespace voice_relay {
namespace server {

std::string xml_escape(const std::string& text) {
    std::string escaped;
    escaped.reserve(text.size());
    for (char ch : text) {
        switch (ch) {
        case '&': escaped += "&amp;"; break;
        case '<': escaped += "&lt;"; break;
        case '>': escaped += "&gt;"; break;
        case '"': escaped += "&quot;"; break;
        case '\'': escaped += "&apos;"; break;
        default: escaped.push_back(ch); break;
        }
    }
    return escaped;
}

std::string render_incoming_call_twiml(const Config& config, const std::string& stream_url) {
    const auto voice = xml_escape(config.greeting_voice);
    std::ostringstream out;
    out << R"(<?xml version="1.0" encoding="UTF-8"?>)"
        << "<Response>";
    if (!config.greeting_text.empty()) {
        out << "<Say voice=\"" << voice << "\">" << xml_escape(config.greeting_text) << "</Say>";
        out << "<Pause length=\"1\"/>";
    }
    if (!config.greeting_follow_up.empty()) {
        out << "<Say voice=\"" << voice << "\">" << xml_escape(config.greeting_follow_up)
            << "</Say>";
    }
    out << "<Connect><Stream url=\"" << xml_escape(stream_url) << "\"/></Connect>"
        << "</Response>";
    return out.str();
}

std::string media_stream_url(const Config& config, const std::string& host_header) {
    if (config.media_stream_url) {
        return *config.media_stream_url;
    }
    std::string host = host_header;
    if (!host.empty() && host.front() == '[') {
        const auto end = host.find(']');
        if (end != std::string::npos) {
            host = host.substr(0, end + 1);
        }
    } else {
        const auto colon = host.find(':');
        if (colon != std::string::npos) {
            host = host.substr(0, colon);
        }
    }
    return "wss://" + host + "/media-stream";
}

}
}
