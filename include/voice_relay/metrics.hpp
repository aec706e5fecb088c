#pragma once

#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace voice_relay {

class Metrics {
public:
    static Metrics& instance();

    void increment(const std::string& counter, uint64_t value = 1);
    void session_opened();
    void session_closed(double duration_seconds);

    uint64_t counter(const std::string& name) const;
    int64_t active_sessions() const;
    std::string render_prometheus() const;

private:
    struct HistogramSeries {
        uint64_t count = 0;
        double sum = 0.0;
        std::vector<uint64_t> buckets;
    };

    Metrics();

    mutable std::mutex mutex_;
    std::map<std::string, uint64_t> counters_;
    int64_t active_sessions_ = 0;
    HistogramSeries session_durations_;
    std::vector<double> histogram_bounds_;
};

namespace metric {

constexpr const char* kSessionsStarted = "relay_sessions_started_total";
constexpr const char* kTelephonyMediaFrames = "relay_telephony_media_frames_total";
constexpr const char* kTelephonyFramesDropped = "relay_telephony_frames_dropped_total";
constexpr const char* kModelAudioDeltas = "relay_model_audio_deltas_total";
constexpr const char* kTurnCancellations = "relay_turn_cancellations_total";
constexpr const char* kAudioDecodeErrors = "relay_audio_decode_errors_total";
constexpr const char* kModelConnectFailures = "relay_model_connect_failures_total";

}

}
