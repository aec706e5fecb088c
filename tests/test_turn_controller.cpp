#include <catch2/catch_test_macros.hpp>

#include "voice_relay/call/turn_controller.hpp"

#include <optional>
#include <string>
#include <vector>

using voice_relay::call::TurnController;

TEST_CASE("first turn start from idle cancels nothing") {
    TurnController turns;
    REQUIRE(turns.is_idle());
    REQUIRE_FALSE(turns.on_turn_start("t1").has_value());
    REQUIRE(turns.active_turn() == std::optional<std::string>("t1"));
}

TEST_CASE("each superseding turn cancels exactly the previous one") {
    TurnController turns;
    std::vector<std::string> cancelled;
    for (const auto* id : {"t1", "t2", "t3"}) {
        if (auto superseded = turns.on_turn_start(id)) {
            cancelled.push_back(*superseded);
        }
    }
    REQUIRE(cancelled == std::vector<std::string>{"t1", "t2"});
    REQUIRE(turns.active_turn() == std::optional<std::string>("t3"));
    REQUIRE_FALSE(turns.was_cancelled("t3"));
    REQUIRE(turns.was_cancelled("t1"));
    REQUIRE(turns.was_cancelled("t2"));
}

TEST_CASE("repeating the active turn id is idempotent") {
    TurnController turns;
    turns.on_turn_start("t1");
    REQUIRE_FALSE(turns.on_turn_start("t1").has_value());
    REQUIRE_FALSE(turns.on_turn_start("t1").has_value());
    REQUIRE(turns.active_turn() == std::optional<std::string>("t1"));
    REQUIRE_FALSE(turns.was_cancelled("t1"));
}

TEST_CASE("ending the active turn returns to idle") {
    TurnController turns;
    turns.on_turn_start("t1");
    REQUIRE(turns.on_turn_end("t1") == TurnController::EndResult::Ended);
    REQUIRE(turns.is_idle());
    REQUIRE_FALSE(turns.on_turn_start("t2").has_value());
}

TEST_CASE("stale and duplicate turn ends change nothing") {
    TurnController turns;
    turns.on_turn_start("t1");
    turns.on_turn_start("t2");
    REQUIRE(turns.on_turn_end("t1") == TurnController::EndResult::Stale);
    REQUIRE(turns.active_turn() == std::optional<std::string>("t2"));

    REQUIRE(turns.on_turn_end("t2") == TurnController::EndResult::Ended);
    REQUIRE(turns.on_turn_end("t2") == TurnController::EndResult::Idle);
    REQUIRE(turns.is_idle());
}

TEST_CASE("cancelled turn history keeps only the most recent ids") {
    TurnController turns;
    const auto total = TurnController::kCancelledHistory + 10;
    for (std::size_t i = 0; i <= total; ++i) {
        turns.on_turn_start("t" + std::to_string(i));
    }
    REQUIRE_FALSE(turns.was_cancelled("t0"));
    REQUIRE_FALSE(turns.was_cancelled("t9"));
    REQUIRE(turns.was_cancelled("t10"));
    REQUIRE(turns.was_cancelled("t" + std::to_string(total - 1)));
    REQUIRE_FALSE(turns.was_cancelled("t" + std::to_string(total)));
}
