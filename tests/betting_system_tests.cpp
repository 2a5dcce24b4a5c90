#include <catch2/catch_test_macros.hpp>
#include "lir/betting_system.h"
#include <stdexcept>

using namespace lir;

namespace {

BettingContext context_with(double bankroll) {
    BettingContext ctx;
    ctx.bankroll = bankroll;
    ctx.starting_bankroll = 500.0;
    ctx.session_profit = bankroll - 500.0;
    return ctx;
}

} // namespace

TEST_CASE("Flat Betting", "[betting]") {
    FlatBetting flat(10.0);
    REQUIRE(flat.get_name() == "flat");
    REQUIRE(flat.get_base_bet() == 10.0);
    REQUIRE(flat.get_bet(context_with(500.0)) == 10.0);
    flat.record_result(-30.0);
    REQUIRE(flat.get_bet(context_with(470.0)) == 10.0);

    SECTION("Bet never exceeds the bankroll") {
        REQUIRE(flat.get_bet(context_with(7.0)) == 7.0);
        REQUIRE(flat.get_bet(context_with(0.0)) == 0.0);
        REQUIRE(flat.get_bet(context_with(-5.0)) == 0.0);
    }

    REQUIRE_THROWS_AS(FlatBetting(0.0), std::invalid_argument);
}

TEST_CASE("Martingale Betting", "[betting]") {
    const BettingContext rich = context_with(10000.0);

    SECTION("Doubles after a loss, resets after a win") {
        MartingaleBetting m(5.0);
        REQUIRE(m.get_bet(rich) == 5.0);
        m.record_result(-15.0);
        REQUIRE(m.get_bet(rich) == 10.0);
        m.record_result(-30.0);
        REQUIRE(m.get_bet(rich) == 20.0);
        m.record_result(0.0); // égalité : inchangé
        REQUIRE(m.get_bet(rich) == 20.0);
        m.record_result(20.0);
        REQUIRE(m.get_bet(rich) == 5.0);
    }

    SECTION("Resets to base once the progression is exhausted") {
        MartingaleBetting m(5.0, 2.0, 10000.0, 3);
        m.record_result(-1.0);
        m.record_result(-1.0);
        m.record_result(-1.0);
        REQUIRE(m.get_bet(rich) == 40.0);
        m.record_result(-1.0);
        REQUIRE(m.get_bet(rich) == 5.0);
    }

    SECTION("Capped by max bet and bankroll") {
        MartingaleBetting m(100.0, 2.0, 300.0, 6);
        m.record_result(-1.0);
        m.record_result(-1.0);
        REQUIRE(m.get_bet(rich) == 300.0);
        REQUIRE(m.get_bet(context_with(250.0)) == 250.0);
    }

    SECTION("Win without reset keeps the current bet") {
        MartingaleBetting m(5.0, 2.0, 500.0, 6, false);
        m.record_result(-1.0);
        m.record_result(5.0);
        REQUIRE(m.get_bet(rich) == 10.0);
        m.reset();
        REQUIRE(m.get_bet(rich) == 5.0);
    }

    SECTION("Invalid parameters") {
        REQUIRE_THROWS_AS(MartingaleBetting(0.0), std::invalid_argument);
        REQUIRE_THROWS_AS(MartingaleBetting(5.0, 1.0), std::invalid_argument);
        REQUIRE_THROWS_AS(MartingaleBetting(5.0, 2.0, 500.0, 0), std::invalid_argument);
    }
}

TEST_CASE("D'Alembert Betting", "[betting]") {
    const BettingContext rich = context_with(10000.0);
    DAlembertBetting d(10.0, 5.0, 5.0, 5.0, 20.0);

    REQUIRE(d.get_name() == "dalembert");
    REQUIRE(d.get_bet(rich) == 10.0);
    d.record_result(-10.0);
    REQUIRE(d.get_bet(rich) == 15.0);
    d.record_result(-10.0);
    d.record_result(-10.0);
    REQUIRE(d.get_bet(rich) == 20.0);   // plafond
    d.record_result(30.0);
    REQUIRE(d.get_bet(rich) == 15.0);
    d.record_result(30.0);
    d.record_result(30.0);
    d.record_result(30.0);
    REQUIRE(d.get_bet(rich) == 5.0);    // plancher
    d.reset();
    REQUIRE(d.get_bet(rich) == 10.0);

    REQUIRE_THROWS_AS(DAlembertBetting(10.0, 5.0, 5.0, 50.0, 20.0), std::invalid_argument);
}

TEST_CASE("Betting System Factory", "[betting]") {
    BettingSystemConfig config;
    REQUIRE(create_betting_system(config, 5.0)->get_name() == "flat");
    config.type = "martingale";
    REQUIRE(create_betting_system(config, 5.0)->get_name() == "martingale");
    config.type = "dalembert";
    REQUIRE(create_betting_system(config, 5.0)->get_name() == "dalembert");
    config.type = "fibonacci";
    REQUIRE_THROWS_AS(create_betting_system(config, 5.0), std::invalid_argument);
}
