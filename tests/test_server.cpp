#include <catch2/catch_test_macros.hpp>

#include "voice_relay/config.hpp"
#include "voice_relay/metrics.hpp"
#include "voice_relay/server/twiml.hpp"

#include <string>

using voice_relay::Config;

TEST_CASE("incoming call TwiML greets then connects the media stream") {
    Config config;
    config.greeting_text = "Welcome & hello.";
    const auto twiml = voice_relay::server::render_incoming_call_twiml(
        config, "wss://relay.example.com/media-stream");

    REQUIRE(twiml.find("<Say voice=\"Polly.Matthew\">Welcome &amp; hello.</Say>") !=
            std::string::npos);
    REQUIRE(twiml.find("<Pause length=\"1\"/>") != std::string::npos);
    REQUIRE(twiml.find("<Say voice=\"Polly.Matthew\">How can I help?</Say>") !=
            std::string::npos);
    REQUIRE(twiml.find(
                "<Connect><Stream url=\"wss://relay.example.com/media-stream\"/></Connect>") !=
            std::string::npos);
    REQUIRE(twiml.find("<Say") < twiml.find("<Connect>"));
}

TEST_CASE("default greeting asks how to help, pauses, then asks again") {
    const auto twiml = voice_relay::server::render_incoming_call_twiml(
        Config{}, "wss://relay.example.com/media-stream");
    const std::string first_say =
        "<Say voice=\"Polly.Matthew\">Hello. Welcome to the Supply Drop Resource Assistance "
        "Line. I can help you find Wildfire relief resources in Southern California and "
        "Hurricane Recovery Resources in Western North Carolina. How can I help?</Say>";
    const std::string follow_up = "<Pause length=\"1\"/><Say voice=\"Polly.Matthew\">How can I help?</Say>";
    REQUIRE(twiml.find(first_say + follow_up) != std::string::npos);
}

TEST_CASE("media stream url follows the request host unless configured") {
    Config config;
    REQUIRE(voice_relay::server::media_stream_url(config, "relay.example.com:5000") ==
            "wss://relay.example.com/media-stream");
    REQUIRE(voice_relay::server::media_stream_url(config, "[::1]:5000") ==
            "wss://[::1]/media-stream");

    config.media_stream_url = "wss://media.example.com/stream";
    REQUIRE(voice_relay::server::media_stream_url(config, "relay.example.com") ==
            "wss://media.example.com/stream");
}

TEST_CASE("metrics render counters and session durations") {
    auto& metrics = voice_relay::Metrics::instance();
    const auto before = metrics.counter(voice_relay::metric::kTurnCancellations);
    metrics.increment(voice_relay::metric::kTurnCancellations);
    REQUIRE(metrics.counter(voice_relay::metric::kTurnCancellations) == before + 1);

    const auto active = metrics.active_sessions();
    metrics.session_opened();
    REQUIRE(metrics.active_sessions() == active + 1);
    metrics.session_closed(2.0);
    REQUIRE(metrics.active_sessions() == active);

    const auto text = metrics.render_prometheus();
    REQUIRE(text.find("relay_turn_cancellations_total ") != std::string::npos);
    REQUIRE(text.find("relay_sessions_active ") != std::string::npos);
    REQUIRE(text.find("relay_session_duration_seconds_bucket{le=\"+Inf\"}") != std::string::npos);
}
