#include "voice_relay/call/session.hpp"

#include <utility>

namespace voice_relay {
namespace call {

CallSession::CallSession()
    : accepted_at_(std::chrono::system_clock::now()) {}

bool CallSession::has_started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_id_.has_value();
}

bool CallSession::start(const std::string& stream_id, CallLog log) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stream_id_) {
        return false;
    }
    stream_id_ = stream_id;
    log_ = std::move(log);
    started_at_ = std::chrono::system_clock::now();
    return true;
}

std::optional<std::string> CallSession::stream_id() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stream_id_;
}

CallLog CallSession::log() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return log_;
}

std::chrono::system_clock::time_point CallSession::accepted_at() const {
    return accepted_at_;
}

std::optional<std::chrono::system_clock::time_point> CallSession::started_at() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_at_;
}

TurnController& CallSession::turns() {
    return turns_;
}

void CallSession::close_log() {
    CallLog released;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        released = std::move(log_);
        log_ = CallLog();
    }
    released.flush();
}

}
}
