#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lir/bankroll_tracker.h"
#include <stdexcept>
#include <vector>

using namespace lir;

TEST_CASE("Bankroll Tracker Balance", "[bankroll]") {
    BankrollTracker tracker(500.0);
    REQUIRE(tracker.get_balance() == 500.0);
    REQUIRE(tracker.get_starting_balance() == 500.0);
    REQUIRE(tracker.get_session_profit() == 0.0);

    tracker.apply_result(25.0);
    tracker.apply_result(-10.0);
    REQUIRE(tracker.get_balance() == 515.0);
    REQUIRE(tracker.get_session_profit() == 15.0);
    REQUIRE(tracker.get_history().empty());

    REQUIRE_THROWS_AS(BankrollTracker(-1.0), std::invalid_argument);
}

TEST_CASE("Bankroll Tracker Drawdown", "[bankroll]") {
    BankrollTracker tracker(100.0);

    SECTION("Peak only rises") {
        tracker.apply_result(50.0);   // 150
        tracker.apply_result(-30.0);  // 120
        REQUIRE(tracker.get_peak_balance() == 150.0);
        REQUIRE(tracker.get_current_drawdown() == 30.0);
        REQUIRE(tracker.get_max_drawdown() == 30.0);
        REQUIRE(tracker.get_max_drawdown_pct() == Catch::Approx(20.0));
    }

    SECTION("Percentage uses the peak in force at the worst drawdown") {
        tracker.apply_result(-50.0);  // 50, pic 100
        tracker.apply_result(150.0);  // 200, nouveau pic
        tracker.apply_result(-40.0);  // 160
        REQUIRE(tracker.get_peak_balance() == 200.0);
        REQUIRE(tracker.get_max_drawdown() == 50.0);
        REQUIRE(tracker.get_max_drawdown_pct() == Catch::Approx(50.0));
        REQUIRE(tracker.get_current_drawdown() == 40.0);
    }

    SECTION("Monotonic gains have no drawdown") {
        tracker.apply_result(10.0);
        tracker.apply_result(10.0);
        REQUIRE(tracker.get_max_drawdown() == 0.0);
        REQUIRE(tracker.get_max_drawdown_pct() == 0.0);
        REQUIRE(tracker.get_current_drawdown() == 0.0);
    }
}

TEST_CASE("Bankroll Tracker History", "[bankroll]") {
    BankrollTracker tracker(100.0, true);
    tracker.apply_result(-5.0);
    tracker.apply_result(20.0);
    tracker.apply_result(0.0);
    REQUIRE(tracker.get_history() == std::vector<double>{95.0, 115.0, 115.0});
}
