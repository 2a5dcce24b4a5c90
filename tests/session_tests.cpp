#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include "lir/session.h"
#include "lir/paytable.h"
#include "lir/strategy.h"
#include "test_helpers.hpp"
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

using namespace lir;

namespace {

// Donne gagnante (paire d'As) et donne perdante (hauteur)
const char* WINNING_DEAL = "As Ah Kd Qc 2s";
const char* LOSING_DEAL = "2c 7d 9h Js 4s";

SessionConfig base_config() {
    SessionConfig config;
    config.starting_bankroll = 500.0;
    config.base_bet = 5.0;
    config.max_hands = 100;
    return config;
}

} // namespace

TEST_CASE("Session Stop Conditions", "[session]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(3);
    FlatBetting flat(5.0);

    SECTION("Win limit") {
        GameEngine engine(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(WINNING_DEAL));
        SessionConfig config = base_config();
        config.win_limit = 50.0;

        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        REQUIRE(r.stop_reason == StopReason::WIN_LIMIT);
        REQUIRE(r.hands_played == 4);
        REQUIRE(r.session_profit == 60.0);
        REQUIRE(r.final_bankroll == 560.0);
        REQUIRE(r.total_wagered == 60.0);
        REQUIRE(r.outcome == SessionOutcome::WIN);
        REQUIRE(r.peak_bankroll == 560.0);
        REQUIRE(r.max_drawdown == 0.0);
        REQUIRE(session.get_streak() == 4);
    }

    SECTION("Loss limit") {
        GameEngine engine(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(LOSING_DEAL));
        SessionConfig config = base_config();
        config.loss_limit = 40.0;

        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        REQUIRE(r.stop_reason == StopReason::LOSS_LIMIT);
        REQUIRE(r.hands_played == 3);
        REQUIRE(r.session_profit == -45.0);
        REQUIRE(r.outcome == SessionOutcome::LOSS);
        REQUIRE(r.max_drawdown == 45.0);
        REQUIRE(r.max_drawdown_pct == Catch::Approx(9.0));
        REQUIRE(session.get_streak() == -3);
    }

    SECTION("Max hands") {
        GameEngine engine(std::make_shared<AlwaysPullStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(LOSING_DEAL));
        SessionConfig config = base_config();
        config.max_hands = 10;

        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        REQUIRE(r.stop_reason == StopReason::MAX_HANDS);
        REQUIRE(r.hands_played == 10);
        REQUIRE(r.session_profit == -50.0);
        REQUIRE(r.total_wagered == 50.0);
    }

    SECTION("Insufficient funds") {
        GameEngine engine(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(LOSING_DEAL));
        SessionConfig config = base_config();
        config.starting_bankroll = 50.0;

        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        // 50 -> 35 -> 20 -> 5 < 15
        REQUIRE(r.stop_reason == StopReason::INSUFFICIENT_FUNDS);
        REQUIRE(r.hands_played == 3);
        REQUIRE(r.final_bankroll == 5.0);
    }

    SECTION("Exhausted bankroll stops even without the funds check") {
        GameEngine engine(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(LOSING_DEAL));
        SessionConfig config = base_config();
        config.starting_bankroll = 35.0;
        config.max_hands = 2000;
        config.stop_on_insufficient_funds = false;

        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        // 35 -> 20 -> 5 -> -10 : la 3e main se joue à découvert
        REQUIRE(r.stop_reason == StopReason::INSUFFICIENT_FUNDS);
        REQUIRE(r.hands_played == 3);
        REQUIRE(r.final_bankroll == -10.0);
    }

    SECTION("Win limit is checked before max hands") {
        GameEngine engine(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng);
        engine.set_deck_preparer(test::fixed_deck(WINNING_DEAL));
        SessionConfig config = base_config();
        config.win_limit = 45.0;
        config.max_hands = 3;

        Session session(config, engine, flat);
        REQUIRE(session.run_to_completion().stop_reason == StopReason::WIN_LIMIT);
    }

    SECTION("No hand after completion") {
        GameEngine engine(std::make_shared<AlwaysPullStrategy>(), main_table, nullptr, rng);
        SessionConfig config = base_config();
        config.max_hands = 2;

        Session session(config, engine, flat);
        REQUIRE_FALSE(session.is_complete());
        session.run_to_completion();
        REQUIRE(session.is_complete());
        REQUIRE(session.should_stop());
        REQUIRE(session.get_stop_reason() == StopReason::MAX_HANDS);
        REQUIRE_THROWS_AS(session.play_hand(), std::logic_error);
        REQUIRE(session.get_hands_played() == 2);
    }
}

TEST_CASE("Session Hand Callback", "[session]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(11);
    GameEngine engine(std::make_shared<BasicStrategy>(), main_table, nullptr, rng);
    FlatBetting flat(5.0);
    SessionConfig config = base_config();
    config.max_hands = 25;

    Session session(config, engine, flat);
    std::vector<int> ids;
    double net_sum = 0.0;
    session.set_hand_callback([&](int hand_id, const GameHandResult& hand) {
        ids.push_back(hand_id);
        net_sum += hand.net_result;
    });
    const SessionResult r = session.run_to_completion();

    REQUIRE(ids.size() == 25);
    for (int i = 0; i < 25; ++i) REQUIRE(ids[i] == i);
    REQUIRE(r.session_profit == Catch::Approx(net_sum));
    REQUIRE(r.final_bankroll == Catch::Approx(500.0 + net_sum));
}

TEST_CASE("Session Bonus Bets", "[session][bonus]") {
    const MainPaytable main_table = standard_main_paytable();
    const BonusPaytable bonus_b = bonus_paytable_b();
    std::mt19937_64 rng(5);
    GameEngine engine(std::make_shared<AlwaysPullStrategy>(), main_table, &bonus_b, rng);
    engine.set_deck_preparer(test::fixed_deck("Qs Ks As 2d 3c"));
    FlatBetting flat(5.0);

    SessionConfig config = base_config();
    config.max_hands = 2;
    config.bonus_bet = 2.0;

    SECTION("Fixed bonus bet") {
        Session session(config, engine, flat);
        const SessionResult r = session.run_to_completion();
        // -5 principal, +200 mini royal
        REQUIRE(r.session_profit == 390.0);
        REQUIRE(r.total_wagered == 10.0);
        REQUIRE(r.total_bonus_wagered == 4.0);
    }

    SECTION("Bonus strategy chooses the amount") {
        Session session(config, engine, flat, std::make_shared<AlwaysBonusStrategy>(100.0));
        const SessionResult r = session.run_to_completion();
        // Plafonné à max_bonus_bet = 25
        REQUIRE(r.total_bonus_wagered == 50.0);
        REQUIRE(r.session_profit == 2.0 * (25.0 * 100.0 - 5.0));
    }

    SECTION("next_bonus_bet without strategy returns the fixed amount") {
        BankrollTracker bankroll(500.0);
        REQUIRE(next_bonus_bet(config, nullptr, bankroll, 0, 0, 0, 5.0) == 2.0);
        NeverBonusStrategy never;
        REQUIRE(next_bonus_bet(config, &never, bankroll, 0, 0, 0, 5.0) == 0.0);
    }
}

TEST_CASE("Session With Betting Progression", "[session][betting]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(5);
    GameEngine engine(std::make_shared<AlwaysPullStrategy>(), main_table, nullptr, rng);
    engine.set_deck_preparer(test::fixed_deck(LOSING_DEAL));
    MartingaleBetting martingale(5.0);
    martingale.record_result(-1.0); // état résiduel effacé par la session

    SessionConfig config = base_config();
    config.starting_bankroll = 1000.0;
    config.max_hands = 3;

    Session session(config, engine, martingale);
    const SessionResult r = session.run_to_completion();
    // 5 + 10 + 20
    REQUIRE(r.total_wagered == 35.0);
    REQUIRE(r.session_profit == -35.0);
}

TEST_CASE("Session Determinism", "[session][rng]") {
    const MainPaytable main_table = standard_main_paytable();
    SessionConfig config = base_config();
    config.win_limit = 100.0;
    config.loss_limit = 100.0;

    auto run_once = [&](uint64_t seed) {
        std::mt19937_64 rng(seed);
        GameEngine engine(std::make_shared<BasicStrategy>(), main_table, nullptr, rng);
        FlatBetting flat(5.0);
        Session session(config, engine, flat);
        return session.run_to_completion();
    };

    REQUIRE(run_once(77) == run_once(77));
}

TEST_CASE("Session Config Validation", "[session]") {
    SessionConfig config = base_config();
    REQUIRE_NOTHROW(config.validate());
    REQUIRE(config.minimum_bet_required() == 15.0);

    SECTION("Non-positive bankroll or bet") {
        config.starting_bankroll = 0.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.starting_bankroll = 500.0;
        config.base_bet = -5.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Limits must be positive") {
        config.win_limit = 0.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.win_limit.reset();
        config.loss_limit = -10.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.loss_limit.reset();
        config.max_hands = 0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("At least one stop condition") {
        config.max_hands.reset();
        config.stop_on_insufficient_funds = false;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.loss_limit = 100.0;
        REQUIRE_NOTHROW(config.validate());
    }

    SECTION("Bankroll must cover one full hand") {
        config.starting_bankroll = 14.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
        config.starting_bankroll = 15.0;
        REQUIRE_NOTHROW(config.validate());
        config.bonus_bet = 1.0;
        REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    }

    SECTION("Session constructor validates") {
        const MainPaytable main_table = standard_main_paytable();
        std::mt19937_64 rng(1);
        GameEngine engine(std::make_shared<BasicStrategy>(), main_table, nullptr, rng);
        FlatBetting flat(5.0);
        config.base_bet = 0.0;
        REQUIRE_THROWS_AS(Session(config, engine, flat), std::invalid_argument);
    }
}

TEST_CASE("Streaks and Outcomes", "[session]") {
    REQUIRE(calculate_new_streak(0, 10.0) == 1);
    REQUIRE(calculate_new_streak(2, 10.0) == 3);
    REQUIRE(calculate_new_streak(-3, 10.0) == 1);
    REQUIRE(calculate_new_streak(0, -5.0) == -1);
    REQUIRE(calculate_new_streak(4, -5.0) == -1);
    REQUIRE(calculate_new_streak(-2, -5.0) == -3);
    REQUIRE(calculate_new_streak(3, 0.0) == 3);
    REQUIRE(calculate_new_streak(-3, 0.0) == -3);

    REQUIRE(outcome_from_profit(0.01) == SessionOutcome::WIN);
    REQUIRE(outcome_from_profit(-0.01) == SessionOutcome::LOSS);
    REQUIRE(outcome_from_profit(0.0) == SessionOutcome::PUSH);
}
