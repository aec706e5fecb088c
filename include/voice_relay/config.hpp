#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace voice_relay {

enum class TurnDetection {
    ServerVad,
    None
};

struct Config {
    std::string openai_api_key;
    std::string openai_realtime_url = "wss://api.openai.com/v1/realtime";
    std::string openai_model = "gpt-4o-realtime-preview-2024-10-01";
    bool tls_verify_peer = true;
    int http_port = 5000;
    int media_stream_port = 5050;
    std::optional<std::string> media_stream_url;
    int max_sessions = 0;
    std::filesystem::path logs_dir = "logs";
    std::string log_level = "INFO";
    std::optional<std::string> log_filename;
    std::string call_log_level = "INFO";
    std::filesystem::path prompts_file = "prompts.json";
    std::string voice = "shimmer";
    std::string greeting_voice = "Polly.Matthew";
    std::string greeting_text =
        "Hello. Welcome to the Supply Drop Resource Assistance Line. I can help you find "
        "Wildfire relief resources in Southern California and Hurricane Recovery Resources "
        "in Western North Carolina. How can I help?";
    std::string greeting_follow_up = "How can I help?";
    TurnDetection turn_detection = TurnDetection::ServerVad;
    std::string turn_detection_mode = "normal";
    int speech_gap_ms = 600;
    int speech_timeout_ms = 6000;
    double temperature = 0.8;
    std::string input_audio_format = "g711_ulaw";
    std::string output_audio_format = "g711_ulaw";
    bool drop_cancelled_turn_audio = false;
    std::string log_name = "voice_relay";

    static Config load();
    void validate() const;

    std::string realtime_endpoint() const;
};

std::string load_system_prompt(const std::filesystem::path& path);

}
