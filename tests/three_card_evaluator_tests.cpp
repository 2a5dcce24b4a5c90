#include <catch2/catch_test_macros.hpp>
#include "eval/three_card_evaluator.hpp"
#include <stdexcept>
#include <vector>

using namespace lir;

namespace {

ThreeCardHandRank eval3(const std::string& hand) {
    const std::vector<Card> cards = cards_from_string(hand);
    return evaluate_three_card_hand(cards);
}

} // namespace

TEST_CASE("Three Card Categories", "[evaluator][bonus]") {
    REQUIRE(eval3("Qs Ks As") == ThreeCardHandRank::MINI_ROYAL);
    REQUIRE(eval3("As Qs Ks") == ThreeCardHandRank::MINI_ROYAL);
    REQUIRE(eval3("Js Qs Ks") == ThreeCardHandRank::STRAIGHT_FLUSH);
    REQUIRE(eval3("Ah 2h 3h") == ThreeCardHandRank::STRAIGHT_FLUSH);
    REQUIRE(eval3("9c 9d 9h") == ThreeCardHandRank::THREE_OF_A_KIND);
    REQUIRE(eval3("4c 5d 6h") == ThreeCardHandRank::STRAIGHT);
    REQUIRE(eval3("Qc Kd Ah") == ThreeCardHandRank::STRAIGHT);
    REQUIRE(eval3("2d 7d Jd") == ThreeCardHandRank::FLUSH);
    REQUIRE(eval3("Jc Jd 4h") == ThreeCardHandRank::PAIR);
    REQUIRE(eval3("2c 7d Jh") == ThreeCardHandRank::HIGH_CARD);
}

TEST_CASE("Three Card Straights", "[evaluator][bonus]") {
    SECTION("A-2-3 is a straight") {
        REQUIRE(eval3("Ac 2d 3h") == ThreeCardHandRank::STRAIGHT);
        REQUIRE(eval3("3c Ad 2h") == ThreeCardHandRank::STRAIGHT);
    }

    SECTION("K-A-2 does not wrap") {
        REQUIRE(eval3("Kc Ad 2h") == ThreeCardHandRank::HIGH_CARD);
        REQUIRE(eval3("Kc Ac 2c") == ThreeCardHandRank::FLUSH);
    }
}

TEST_CASE("Three Card Ordering", "[evaluator][bonus]") {
    REQUIRE(ThreeCardHandRank::STRAIGHT > ThreeCardHandRank::FLUSH);
    REQUIRE(ThreeCardHandRank::THREE_OF_A_KIND > ThreeCardHandRank::STRAIGHT);
    REQUIRE(ThreeCardHandRank::MINI_ROYAL > ThreeCardHandRank::STRAIGHT_FLUSH);
}

TEST_CASE("Three Card Invalid Input", "[evaluator][bonus]") {
    REQUIRE_THROWS_AS(eval3("Ac 2d"), std::invalid_argument);
    REQUIRE_THROWS_AS(eval3("Ac 2d 3h 4s"), std::invalid_argument);
    REQUIRE_THROWS_AS(eval3("Ac Ac 3h"), std::invalid_argument);
}

TEST_CASE("Three Card Rank Names", "[evaluator][string]") {
    REQUIRE(to_string(ThreeCardHandRank::MINI_ROYAL) == "mini_royal");
    REQUIRE(three_card_rank_from_string("three_of_a_kind") == ThreeCardHandRank::THREE_OF_A_KIND);
    REQUIRE_THROWS_AS(three_card_rank_from_string("royal"), std::invalid_argument);
}
