#include <catch2/catch_test_macros.hpp>

#include "test_support.hpp"
#include "voice_relay/config.hpp"
#include "voice_relay/realtime/session_config.hpp"

#include <cstdlib>
#include <fstream>
#include <optional>
#include <stdexcept>
#include <string>

using voice_relay::Config;
using voice_relay::TurnDetection;

namespace {

class ScopedEnv {
public:
    ScopedEnv(const char* name, const char* value) : name_(name) {
        if (const char* previous = std::getenv(name)) {
            previous_ = previous;
        }
        if (value) {
            setenv(name, value, 1);
        } else {
            unsetenv(name);
        }
    }

    ~ScopedEnv() {
        if (previous_) {
            setenv(name_.c_str(), previous_->c_str(), 1);
        } else {
            unsetenv(name_.c_str());
        }
    }

private:
    std::string name_;
    std::optional<std::string> previous_;
};

}

TEST_CASE("missing API key is fatal") {
    ScopedEnv key("OPENAI_API_KEY", nullptr);
    REQUIRE_THROWS_AS(Config::load(), std::runtime_error);
}

TEST_CASE("defaults describe the shimmer persona with server VAD") {
    ScopedEnv key("OPENAI_API_KEY", "sk-test");
    const auto config = Config::load();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.voice == "shimmer");
    REQUIRE(config.turn_detection == TurnDetection::ServerVad);
    REQUIRE(config.speech_gap_ms == 600);
    REQUIRE(config.speech_timeout_ms == 6000);
    REQUIRE(config.temperature == 0.8);
    REQUIRE(config.realtime_endpoint() ==
            "wss://api.openai.com/v1/realtime?model=gpt-4o-realtime-preview-2024-10-01");
}

TEST_CASE("persona and turn detection come from the environment") {
    ScopedEnv key("OPENAI_API_KEY", "sk-test");
    ScopedEnv voice("VOICE", "alloy");
    ScopedEnv detection("TURN_DETECTION", "none");
    ScopedEnv greeting("GREETING_TEXT", "Hi there.");
    const auto config = Config::load();
    REQUIRE(config.voice == "alloy");
    REQUIRE(config.turn_detection == TurnDetection::None);
    REQUIRE(config.greeting_text == "Hi there.");
}

TEST_CASE("invalid settings are rejected") {
    ScopedEnv key("OPENAI_API_KEY", "sk-test");
    {
        ScopedEnv detection("TURN_DETECTION", "sometimes");
        REQUIRE_THROWS_AS(Config::load(), std::runtime_error);
    }
    auto config = Config::load();
    config.media_stream_port = config.http_port;
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);

    config = Config::load();
    config.openai_realtime_url = "http://api.openai.com/v1/realtime";
    REQUIRE_THROWS_AS(config.validate(), std::runtime_error);
}

TEST_CASE("system prompt is read from the prompts file") {
    voice_relay::testing::TempDir dir;
    const auto path = dir.path() / "prompts.json";
    {
        std::ofstream out(path);
        out << R"({"system_message":{"content":"You help with relief resources."}})";
    }
    REQUIRE(voice_relay::load_system_prompt(path) == "You help with relief resources.");
}

TEST_CASE("system prompt falls back when the file is missing or invalid") {
    voice_relay::testing::TempDir dir;
    REQUIRE(voice_relay::load_system_prompt(dir.path() / "missing.json") ==
            "You are a helpful AI assistant.");

    const auto path = dir.path() / "prompts.json";
    {
        std::ofstream out(path);
        out << R"({"system_message":{}})";
    }
    REQUIRE(voice_relay::load_system_prompt(path) == "You are a helpful AI assistant.");
}

TEST_CASE("session update carries the configured session") {
    Config config;
    const auto update = voice_relay::realtime::make_session_update(config, "Be brief.");
    REQUIRE(update.at("type") == "session.update");
    const auto& session = update.at("session");
    REQUIRE(session.at("voice") == "shimmer");
    REQUIRE(session.at("instructions") == "Be brief.");
    REQUIRE(session.at("input_audio_format") == "g711_ulaw");
    REQUIRE(session.at("output_audio_format") == "g711_ulaw");
    REQUIRE(session.at("modalities") == nlohmann::json::array({"text", "audio"}));
    REQUIRE(session.at("temperature") == 0.8);
    REQUIRE(session.at("turn_detection").at("type") == "server_vad");
    REQUIRE(session.at("turn_detection").at("mode") == "normal");
    REQUIRE(session.at("turn_detection").at("time_units").at("speech_gap_ms") == 600);
    REQUIRE(session.at("turn_detection").at("time_units").at("speech_timeout_ms") == 6000);

    config.turn_detection = TurnDetection::None;
    const auto manual = voice_relay::realtime::make_session_update(config, "Be brief.");
    REQUIRE(manual.at("session").at("turn_detection").is_null());
}
