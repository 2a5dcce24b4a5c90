#include <catch2/catch_test_macros.hpp>
#include "lir/strategy.h"
#include "lir/hand_analysis.h"
#include <stdexcept>
#include <vector>

using namespace lir;

namespace {

Decision bet1(const Strategy& s, const std::string& hand) {
    const std::vector<Card> cards = cards_from_string(hand);
    return s.decide_bet1(analyze_three_cards(cards), StrategyContext{});
}

Decision bet2(const Strategy& s, const std::string& hand) {
    const std::vector<Card> cards = cards_from_string(hand);
    return s.decide_bet2(analyze_four_cards(cards), StrategyContext{});
}

} // namespace

TEST_CASE("Basic Strategy Bet 1", "[strategy]") {
    BasicStrategy basic;

    SECTION("Paying hands ride") {
        REQUIRE(bet1(basic, "Tc Td 4s") == Decision::RIDE);
        REQUIRE(bet1(basic, "5c 5d 5h") == Decision::RIDE);
    }

    SECTION("Low pairs and junk are pulled") {
        REQUIRE(bet1(basic, "9c 9d 4s") == Decision::PULL);
        REQUIRE(bet1(basic, "2c 7d Kh") == Decision::PULL);
    }

    SECTION("Royal draw rides") {
        REQUIRE(bet1(basic, "Ah Kh Th") == Decision::RIDE);
    }

    SECTION("Three suited consecutive, except A-2-3 and 2-3-4") {
        REQUIRE(bet1(basic, "3s 4s 5s") == Decision::RIDE);
        REQUIRE(bet1(basic, "2s 3s 4s") == Decision::PULL);
        REQUIRE(bet1(basic, "As 2s 3s") == Decision::PULL);
    }

    SECTION("One-gap needs a high card") {
        REQUIRE(bet1(basic, "8d 9d Jd") == Decision::RIDE);
        REQUIRE(bet1(basic, "5d 6d 8d") == Decision::PULL);
    }

    SECTION("Two-gap needs two high cards") {
        REQUIRE(bet1(basic, "9d Jd Kd") == Decision::RIDE);
        REQUIRE(bet1(basic, "7d 9d Jd") == Decision::PULL);
    }

    SECTION("Unsuited straight draw is pulled") {
        REQUIRE(bet1(basic, "9c Td Jh") == Decision::PULL);
    }
}

TEST_CASE("Basic Strategy Bet 2", "[strategy]") {
    BasicStrategy basic;

    REQUIRE(bet2(basic, "2c 2d 4s 4h") == Decision::RIDE);          // deux paires
    REQUIRE(bet2(basic, "Qc Qd 4s 7h") == Decision::RIDE);          // paire haute
    REQUIRE(bet2(basic, "2h 7h 9h 4h") == Decision::RIDE);          // 4 à la couleur
    REQUIRE(bet2(basic, "7c 8d 9h Ts") == Decision::RIDE);          // ouverte avec une haute
    REQUIRE(bet2(basic, "5c 6d 7h 8s") == Decision::PULL);          // ouverte sans haute
    REQUIRE(bet2(basic, "Ac Kd Qh Js") == Decision::RIDE);          // ventrale, 4 hautes
    REQUIRE(bet2(basic, "9c Jd Qh Ks") == Decision::PULL);          // ventrale, 3 hautes
    REQUIRE(bet2(basic, "2c 7d 9h Ks") == Decision::PULL);
}

TEST_CASE("Variance Bound Strategies", "[strategy]") {
    AlwaysRideStrategy ride;
    AlwaysPullStrategy pull;
    REQUIRE(bet1(ride, "2c 7d Kh") == Decision::RIDE);
    REQUIRE(bet2(ride, "2c 7d 9h Ks") == Decision::RIDE);
    REQUIRE(bet1(pull, "Ac Ad Ah") == Decision::PULL);
    REQUIRE(bet2(pull, "Ac Ad Ah As") == Decision::PULL);
    REQUIRE_FALSE(ride.uses_deck_composition());
}

TEST_CASE("Strategy Factory", "[strategy]") {
    REQUIRE(create_strategy(StrategyConfig{})->get_name() == "basic");
    REQUIRE(create_strategy(StrategyConfig{"always_ride", {}, {}})->get_name() == "always_ride");
    REQUIRE(create_strategy(StrategyConfig{"always_pull", {}, {}})->get_name() == "always_pull");
    REQUIRE(create_strategy(StrategyConfig{"conservative", {}, {}})->get_name() == "conservative");
    REQUIRE(create_strategy(StrategyConfig{"aggressive", {}, {}})->get_name() == "aggressive");

    StrategyConfig custom{"custom", {{"default", Decision::RIDE}}, {{"default", Decision::PULL}}};
    auto strategy = create_strategy(custom);
    REQUIRE(strategy->get_name() == "custom");
    REQUIRE(bet1(*strategy, "2c 7d Kh") == Decision::RIDE);
    REQUIRE(bet2(*strategy, "2c 7d 9h Ks") == Decision::PULL);

    REQUIRE_THROWS_AS(create_strategy(StrategyConfig{"martingale", {}, {}}), std::invalid_argument);
    REQUIRE_THROWS_AS(create_strategy(StrategyConfig{"custom", {}, {}}), std::invalid_argument);
}

TEST_CASE("Decision Names", "[strategy][string]") {
    REQUIRE(std::string(decision_to_string(Decision::RIDE)) == "ride");
    REQUIRE(decision_from_string("pull") == Decision::PULL);
    REQUIRE_THROWS_AS(decision_from_string("fold"), std::invalid_argument);
}
