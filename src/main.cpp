#include "voice_relay/app.hpp"
#include "voice_relay/config.hpp"
#include "voice_relay/logging.hpp"

#include <string>

int main() {
    try {
        const auto config = voice_relay::Config::load();
        config.validate();
        voice_relay::logging::init(config);
        voice_relay::info(
            "Starting voice-relay",
            {voice_relay::kv("http_port", config.http_port),
             voice_relay::kv("media_stream_port", config.media_stream_port),
             voice_relay::kv("model", config.openai_model),
             voice_relay::kv("voice", config.voice),
             voice_relay::kv("logs_dir", config.logs_dir.string())});
        voice_relay::RelayApp app(config);
        app.init();
        app.run();
    } catch (const std::exception& ex) {
        voice_relay::error(
            "Startup failed",
            {voice_relay::kv("error", ex.what())});
        return 1;
    }
    return 0;
}
