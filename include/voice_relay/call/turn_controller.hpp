#pragma once

#include <cstddef>
#include <deque>
#include <optional>
#include <string>

namespace voice_relay {
namespace call {

// Tracks the model's active conversational turn. Owned by the model pump of a
// single session; not synchronized.
class TurnController {
public:
    // Number of superseded turn ids remembered for was_cancelled().
    static constexpr std::size_t kCancelledHistory = 64;

    enum class EndResult {
        Ended,
        Stale,
        Idle
    };

    // Makes turn_id current. Returns the superseded turn id when another turn
    // was active; that response must be cancelled before the new turn's audio
    // is treated as current.
    std::optional<std::string> on_turn_start(const std::string& turn_id);

    // Only an end for the active turn returns to idle.
    EndResult on_turn_end(const std::string& turn_id);

    const std::optional<std::string>& active_turn() const;
    bool is_idle() const;
    bool was_cancelled(const std::string& turn_id) const;

private:
    std::optional<std::string> active_turn_;
    std::deque<std::string> cancelled_;
};

}
}
