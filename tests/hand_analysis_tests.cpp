#include <catch2/catch_test_macros.hpp>
#include "lir/hand_analysis.h"
#include <stdexcept>
#include <vector>

using namespace lir;

namespace {

HandAnalysis analyze(const std::string& hand) {
    const std::vector<Card> cards = cards_from_string(hand);
    if (cards.size() == 3) return analyze_three_cards(cards);
    return analyze_four_cards(cards);
}

} // namespace

TEST_CASE("Three Card Analysis: made hands", "[analysis]") {
    SECTION("High pair pays") {
        HandAnalysis a = analyze("Tc Td 4s");
        REQUIRE(a.has_pair);
        REQUIRE(a.has_high_pair);
        REQUIRE(a.has_paying_hand);
        REQUIRE(a.pair_rank == Rank::TEN);
        REQUIRE(a.high_cards == 2);
    }

    SECTION("Low pair does not pay") {
        HandAnalysis a = analyze("9c 9d 4s");
        REQUIRE(a.has_pair);
        REQUIRE_FALSE(a.has_high_pair);
        REQUIRE_FALSE(a.has_paying_hand);
        REQUIRE(a.pair_rank == Rank::NINE);
    }

    SECTION("Trips") {
        HandAnalysis a = analyze("5c 5d 5h");
        REQUIRE(a.has_trips);
        REQUIRE_FALSE(a.has_pair);
        REQUIRE(a.has_paying_hand);
        REQUIRE_FALSE(a.pair_rank.has_value());
    }

    SECTION("Nothing") {
        HandAnalysis a = analyze("2c 7d Kh");
        REQUIRE_FALSE(a.has_paying_hand);
        REQUIRE_FALSE(a.is_flush_draw);
        REQUIRE_FALSE(a.is_straight_draw);
        REQUIRE(a.connected_cards == 1);
        REQUIRE(a.high_cards == 1);
    }
}

TEST_CASE("Three Card Analysis: draws", "[analysis]") {
    SECTION("Suited royal draw") {
        HandAnalysis a = analyze("Ah Kh Qh");
        REQUIRE(a.suited_cards == 3);
        REQUIRE(a.suited_high_cards == 3);
        REQUIRE(a.is_flush_draw);
        REQUIRE(a.is_straight_draw);
        REQUIRE(a.connected_cards == 3);
        REQUIRE(a.gaps == 2);
        REQUIRE(a.is_straight_flush_draw);
        REQUIRE(a.straight_flush_spread == 3);
        REQUIRE(a.is_royal_draw);
        REQUIRE_FALSE(a.is_excluded_sf_consecutive);
    }

    SECTION("Royal draw needs the ace") {
        HandAnalysis a = analyze("Kh Qh Jh");
        REQUIRE(a.suited_high_cards == 3);
        REQUIRE_FALSE(a.is_royal_draw);
        REQUIRE(a.is_straight_flush_draw);
    }

    SECTION("Excluded low consecutive straight flush draws") {
        HandAnalysis low = analyze("2s 3s 4s");
        REQUIRE(low.is_straight_flush_draw);
        REQUIRE(low.straight_flush_spread == 3);
        REQUIRE(low.is_excluded_sf_consecutive);

        HandAnalysis wheel = analyze("As 2s 3s");
        REQUIRE(wheel.is_straight_flush_draw);
        REQUIRE(wheel.straight_flush_spread == 3);
        REQUIRE(wheel.is_excluded_sf_consecutive);
        REQUIRE_FALSE(wheel.is_royal_draw);

        REQUIRE_FALSE(analyze("3s 4s 5s").is_excluded_sf_consecutive);
    }

    SECTION("Spread of a gapped straight flush draw") {
        HandAnalysis a = analyze("5d 7d 9d");
        REQUIRE(a.is_straight_flush_draw);
        REQUIRE(a.straight_flush_spread == 5);
        REQUIRE(a.suited_high_cards == 0);

        HandAnalysis wide = analyze("2d 7d Jd");
        REQUIRE(wide.is_flush_draw);
        REQUIRE_FALSE(wide.is_straight_flush_draw);
        REQUIRE(wide.straight_flush_spread == 0);
    }

    SECTION("Gapped straight draw, no open/inside flags at 3 cards") {
        HandAnalysis a = analyze("4c 6d 8h");
        REQUIRE(a.is_straight_draw);
        REQUIRE(a.connected_cards == 3);
        REQUIRE(a.gaps == 2);
        REQUIRE_FALSE(a.is_open_straight_draw);
        REQUIRE_FALSE(a.is_inside_straight_draw);
    }
}

TEST_CASE("Four Card Analysis", "[analysis]") {
    SECTION("Open-ended straight draw") {
        HandAnalysis a = analyze("5c 6d 7h 8s");
        REQUIRE(a.is_straight_draw);
        REQUIRE(a.connected_cards == 4);
        REQUIRE(a.is_open_straight_draw);
        REQUIRE_FALSE(a.is_inside_straight_draw);
    }

    SECTION("Four consecutive against the ace count as inside") {
        HandAnalysis high = analyze("Ac Kd Qh Js");
        REQUIRE(high.is_straight_draw);
        REQUIRE(high.is_inside_straight_draw);
        REQUIRE_FALSE(high.is_open_straight_draw);
        REQUIRE(high.high_cards == 4);

        HandAnalysis low = analyze("Ac 2d 3h 4s");
        REQUIRE(low.is_inside_straight_draw);
        REQUIRE_FALSE(low.is_open_straight_draw);
    }

    SECTION("Gutshot") {
        HandAnalysis a = analyze("5c 6d 8h 9s");
        REQUIRE(a.is_inside_straight_draw);
        REQUIRE_FALSE(a.is_open_straight_draw);
        REQUIRE(a.gaps == 1);
    }

    SECTION("Flush draw needs four suited cards") {
        REQUIRE(analyze("2h 7h 9h Kh").is_flush_draw);
        REQUIRE(analyze("2h 7h 9h Kh").suited_cards == 4);
        HandAnalysis three_suited = analyze("Ah Kh Qh 2c");
        REQUIRE(three_suited.suited_cards == 3);
        REQUIRE_FALSE(three_suited.is_flush_draw);
        REQUIRE_FALSE(three_suited.is_straight_flush_draw);
    }

    SECTION("Two pair pays") {
        HandAnalysis a = analyze("2c 2d 4s 4h");
        REQUIRE(a.has_two_pair);
        REQUIRE_FALSE(a.has_pair);
        REQUIRE(a.has_paying_hand);
    }
}

TEST_CASE("Analysis Card Count", "[analysis]") {
    const std::vector<Card> two = cards_from_string("Ac Kd");
    const std::vector<Card> four = cards_from_string("Ac Kd Qh Js");
    REQUIRE_THROWS_AS(analyze_three_cards(two), std::invalid_argument);
    REQUIRE_THROWS_AS(analyze_three_cards(four), std::invalid_argument);
    REQUIRE_THROWS_AS(analyze_four_cards(two), std::invalid_argument);
}
