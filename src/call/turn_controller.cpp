#include "voice_relay/call/turn_controller.hpp"

#include <algorithm>

namespace voice_relay {
namespace call {

std::optional<std::string> TurnController::on_turn_start(const std::string& turn_id) {
    if (active_turn_ && *active_turn_ == turn_id) {
        return std::nullopt;
    }
    std::optional<std::string> superseded;
    if (active_turn_) {
        superseded = *active_turn_;
        cancelled_.push_back(*active_turn_);
        if (cancelled_.size() > kCancelledHistory) {
            cancelled_.pop_front();
        }
    }
    active_turn_ = turn_id;
    return superseded;
}

TurnController::EndResult TurnController::on_turn_end(const std::string& turn_id) {
    if (!active_turn_) {
        return EndResult::Idle;
    }
    if (*active_turn_ != turn_id) {
        return EndResult::Stale;
    }
    active_turn_.reset();
    return EndResult::Ended;
}

const std::optional<std::string>& TurnController::active_turn() const {
    return active_turn_;
}

bool TurnController::is_idle() const {
    return !active_turn_;
}

bool TurnController::was_cancelled(const std::string& turn_id) const {
    return std::find(cancelled_.begin(), cancelled_.end(), turn_id) != cancelled_.end();
}

}
}
