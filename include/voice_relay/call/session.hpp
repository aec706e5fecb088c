#pragma once

#include <chrono>
#include <mutex>
#include <optional>
#include <string>

#include "voice_relay/call/call_log.hpp"
#include "voice_relay/call/turn_controller.hpp"

namespace voice_relay {
namespace call {

// State of one relayed call. The stream id and log are written by the
// telephony pump and read by the model pump, so they are guarded here; the
// turn controller belongs to the model pump alone.
class CallSession {
public:
    CallSession();

    bool has_started() const;
    // Returns false and changes nothing if the session already has a stream.
    bool start(const std::string& stream_id, CallLog log);

    std::optional<std::string> stream_id() const;
    CallLog log() const;
    std::chrono::system_clock::time_point accepted_at() const;
    std::optional<std::chrono::system_clock::time_point> started_at() const;

    TurnController& turns();

    // Flushes and releases the log; later writes are discarded.
    void close_log();

private:
    mutable std::mutex mutex_;
    std::optional<std::string> stream_id_;
    CallLog log_;
    std::chrono::system_clock::time_point accepted_at_;
    std::optional<std::chrono::system_clock::time_point> started_at_;
    TurnController turns_;
};

}
}
