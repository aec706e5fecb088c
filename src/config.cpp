#include "voice_relay/config.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <sstream>
#include <stdexcept>

#include "voice_relay/logging.hpp"

namespace voice_relay {

namespace {

constexpr const char* kDefaultPrompt = "You are a helpful AI assistant.";

std::string get_env_str(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return value ? std::string(value) : fallback;
}

std::optional<std::string> get_env_optional(const char* name) {
    const char* value = std::getenv(name);
    if (!value) {
        return std::nullopt;
    }
    std::string result(value);
    if (result.empty()) {
        return std::nullopt;
    }
    return result;
}

std::string get_env_required(const char* name) {
    const char* value = std::getenv(name);
    if (!value || std::string(value).empty()) {
        throw std::runtime_error(std::string(name) + " is required");
    }
    return std::string(value);
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::tolower(ch)); });
    return value;
}

bool get_env_bool(const char* name, bool fallback) {
    const char* value = std::getenv(name);
    if (!value) {
        return fallback;
    }
    return to_lower(value) == "true";
}

int get_env_int(const char* name, int fallback) {
    const char* value = std::getenv(name);
    return value ? std::stoi(value) : fallback;
}

double get_env_double(const char* name, double fallback) {
    const char* value = std::getenv(name);
    return value ? std::stod(value) : fallback;
}

TurnDetection parse_turn_detection(const std::string& raw) {
    const auto value = to_lower(raw);
    if (value == "server_vad") {
        return TurnDetection::ServerVad;
    }
    if (value == "none" || value == "off") {
        return TurnDetection::None;
    }
    throw std::runtime_error("TURN_DETECTION must be server_vad or none, got " + raw);
}

std::string trim(std::string value) {
    auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
    value.erase(value.begin(), std::find_if(value.begin(), value.end(),
                                            [&](unsigned char ch) { return !is_space(ch); }));
    value.erase(std::find_if(value.rbegin(), value.rend(),
                             [&](unsigned char ch) { return !is_space(ch); }).base(),
                value.end());
    return value;
}

std::string timestamp_suffix() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm tm_value{};
    localtime_r(&time_t, &tm_value);
    std::ostringstream stream;
    stream << std::put_time(&tm_value, "%Y%m%d_%H%M%S");
    return stream.str();
}

std::string strip_quotes(std::string value) {
    if (value.size() < 2) {
        return value;
    }
    if ((value.front() == '"' && value.back() == '"') ||
        (value.front() == '\'' && value.back() == '\'')) {
        return value.substr(1, value.size() - 2);
    }
    return value;
}

// Variables already present in the environment win over .env entries.
void load_dotenv() {
    const std::filesystem::path dotenv_path = std::filesystem::current_path() / ".env";
    if (!std::filesystem::exists(dotenv_path)) {
        return;
    }

    std::ifstream stream(dotenv_path);
    if (!stream.is_open()) {
        return;
    }

    std::string line;
    while (std::getline(stream, line)) {
        line = trim(line);
        if (line.empty() || line.rfind("#", 0) == 0) {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        const auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));
        if (key.empty()) {
            continue;
        }
        setenv(key.c_str(), strip_quotes(value).c_str(), 0);
    }
}

}

Config Config::load() {
    load_dotenv();
    Config config;

    config.openai_api_key = get_env_required("OPENAI_API_KEY");
    config.openai_realtime_url = get_env_str("OPENAI_REALTIME_URL", config.openai_realtime_url);
    config.openai_model = get_env_str("OPENAI_MODEL", config.openai_model);
    config.tls_verify_peer = get_env_bool("TLS_VERIFY_PEER", true);

    config.http_port = get_env_int("PORT", 5000);
    config.media_stream_port = get_env_int("MEDIA_STREAM_PORT", 5050);
    config.media_stream_url = get_env_optional("MEDIA_STREAM_URL");
    config.max_sessions = get_env_int("MAX_SESSIONS", 0);

    config.logs_dir = get_env_str("LOGS_DIR", "logs");
    config.log_level = get_env_str("LOG_LEVEL", "INFO");
    const auto log_filename_raw = get_env_str("LOG_FILENAME", "");
    if (!log_filename_raw.empty()) {
        const std::filesystem::path log_path(log_filename_raw);
        const auto stamped = log_path.stem().string() + "_" + timestamp_suffix() +
                             log_path.extension().string();
        config.log_filename = (config.logs_dir / stamped).string();
    }
    config.call_log_level = get_env_str("CALL_LOG_LEVEL", "INFO");

    config.prompts_file = get_env_str("PROMPTS_FILE", "prompts.json");
    config.voice = get_env_str("VOICE", config.voice);
    config.greeting_voice = get_env_str("GREETING_VOICE", config.greeting_voice);
    config.greeting_text = get_env_str("GREETING_TEXT", config.greeting_text);
    config.greeting_follow_up = get_env_str("GREETING_FOLLOW_UP", config.greeting_follow_up);

    config.turn_detection = parse_turn_detection(get_env_str("TURN_DETECTION", "server_vad"));
    config.turn_detection_mode = get_env_str("TURN_DETECTION_MODE", "normal");
    config.speech_gap_ms = get_env_int("SPEECH_GAP_MS", 600);
    config.speech_timeout_ms = get_env_int("SPEECH_TIMEOUT_MS", 6000);
    config.temperature = get_env_double("TEMPERATURE", 0.8);
    config.input_audio_format = get_env_str("INPUT_AUDIO_FORMAT", "g711_ulaw");
    config.output_audio_format = get_env_str("OUTPUT_AUDIO_FORMAT", "g711_ulaw");
    config.drop_cancelled_turn_audio = get_env_bool("DROP_CANCELLED_TURN_AUDIO", false);

    config.log_name = get_env_str("LOG_NAME", "voice_relay");

    return config;
}

void Config::validate() const {
    if (openai_api_key.empty()) {
        throw std::runtime_error("OPENAI_API_KEY is required");
    }
    if (openai_realtime_url.rfind("wss://", 0) != 0) {
        throw std::runtime_error("OPENAI_REALTIME_URL must be a wss:// URL");
    }
    if (http_port <= 0) {
        throw std::runtime_error("PORT must be positive");
    }
    if (media_stream_port <= 0) {
        throw std::runtime_error("MEDIA_STREAM_PORT must be positive");
    }
    if (http_port == media_stream_port) {
        throw std::runtime_error("PORT and MEDIA_STREAM_PORT must differ");
    }
    if (max_sessions < 0) {
        throw std::runtime_error("MAX_SESSIONS must be zero or positive");
    }
    if (speech_gap_ms <= 0 || speech_timeout_ms <= 0) {
        throw std::runtime_error("SPEECH_GAP_MS and SPEECH_TIMEOUT_MS must be positive");
    }
    if (temperature < 0.0 || temperature > 2.0) {
        throw std::runtime_error("TEMPERATURE must be within [0, 2]");
    }
}

std::string Config::realtime_endpoint() const {
    const auto separator = openai_realtime_url.find('?') == std::string::npos ? '?' : '&';
    return openai_realtime_url + separator + "model=" + openai_model;
}

std::string load_system_prompt(const std::filesystem::path& path) {
    try {
        std::ifstream stream(path);
        if (!stream.is_open()) {
            throw std::runtime_error("cannot open " + path.string());
        }
        const auto prompts = nlohmann::json::parse(stream);
        return prompts.at("system_message").at("content").get<std::string>();
    } catch (const std::exception& ex) {
        logging::error(
            "Error loading system prompt",
            {kv("path", path.string()),
             kv("error", ex.what())});
        return kDefaultPrompt;
    }
}

}
