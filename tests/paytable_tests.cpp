#include <catch2/catch_test_macros.hpp>
#include "lir/paytable.h"
#include <map>
#include <stdexcept>

using namespace lir;

TEST_CASE("Standard Main Paytable", "[paytable]") {
    const MainPaytable table = standard_main_paytable();
    REQUIRE(table.get_name() == "standard");
    REQUIRE(table.multiplier(FiveCardHandRank::ROYAL_FLUSH) == 1000);
    REQUIRE(table.multiplier(FiveCardHandRank::STRAIGHT_FLUSH) == 200);
    REQUIRE(table.multiplier(FiveCardHandRank::FOUR_OF_A_KIND) == 50);
    REQUIRE(table.multiplier(FiveCardHandRank::FULL_HOUSE) == 11);
    REQUIRE(table.multiplier(FiveCardHandRank::FLUSH) == 8);
    REQUIRE(table.multiplier(FiveCardHandRank::STRAIGHT) == 5);
    REQUIRE(table.multiplier(FiveCardHandRank::THREE_OF_A_KIND) == 3);
    REQUIRE(table.multiplier(FiveCardHandRank::TWO_PAIR) == 2);
    REQUIRE(table.multiplier(FiveCardHandRank::PAIR_TENS_OR_BETTER) == 1);
    REQUIRE(table.multiplier(FiveCardHandRank::PAIR_BELOW_TENS) == 0);
    REQUIRE(table.multiplier(FiveCardHandRank::HIGH_CARD) == 0);

    REQUIRE(table.payout(FiveCardHandRank::FLUSH, 15.0) == 120.0);
    REQUIRE(table.payout(FiveCardHandRank::HIGH_CARD, 15.0) == 0.0);
}

TEST_CASE("Bonus Paytables", "[paytable][bonus]") {
    SECTION("Paytable A") {
        const BonusPaytable a = bonus_paytable_a();
        REQUIRE(a.multiplier(ThreeCardHandRank::MINI_ROYAL) == 50);
        REQUIRE(a.multiplier(ThreeCardHandRank::STRAIGHT) == 6);
        REQUIRE(a.multiplier(ThreeCardHandRank::FLUSH) == 3);
        REQUIRE(a.multiplier(ThreeCardHandRank::HIGH_CARD) == 0);
    }

    SECTION("Paytable B") {
        const BonusPaytable b = bonus_paytable_b();
        REQUIRE(b.multiplier(ThreeCardHandRank::MINI_ROYAL) == 100);
        REQUIRE(b.multiplier(ThreeCardHandRank::STRAIGHT_FLUSH) == 40);
        REQUIRE(b.multiplier(ThreeCardHandRank::THREE_OF_A_KIND) == 30);
        REQUIRE(b.multiplier(ThreeCardHandRank::STRAIGHT) == 5);
        REQUIRE(b.multiplier(ThreeCardHandRank::FLUSH) == 4);
        REQUIRE(b.multiplier(ThreeCardHandRank::PAIR) == 1);
        REQUIRE(b.payout(ThreeCardHandRank::PAIR, 5.0) == 5.0);
    }

    SECTION("Progressive paytable C") {
        REQUIRE(bonus_paytable_c().multiplier(ThreeCardHandRank::MINI_ROYAL) == 1000);
        REQUIRE(bonus_paytable_c(2500).multiplier(ThreeCardHandRank::MINI_ROYAL) == 2500);
        REQUIRE(bonus_paytable_c().multiplier(ThreeCardHandRank::STRAIGHT_FLUSH) == 200);
    }
}

TEST_CASE("Paytable Lookup By Name", "[paytable]") {
    REQUIRE(main_paytable_by_name("standard").get_name() == "standard");
    REQUIRE(bonus_paytable_by_name("paytable_a").get_name() == "paytable_a");
    REQUIRE(bonus_paytable_by_name("paytable_c", 777).multiplier(ThreeCardHandRank::MINI_ROYAL) == 777);
    REQUIRE_THROWS_AS(main_paytable_by_name("vegas"), std::invalid_argument);
    REQUIRE_THROWS_AS(bonus_paytable_by_name("paytable_z"), std::invalid_argument);
}

TEST_CASE("Paytable Validation", "[paytable]") {
    std::map<ThreeCardHandRank, int> payouts = {
        {ThreeCardHandRank::MINI_ROYAL, 50},
        {ThreeCardHandRank::STRAIGHT_FLUSH, 40},
        {ThreeCardHandRank::THREE_OF_A_KIND, 30},
        {ThreeCardHandRank::STRAIGHT, 6},
        {ThreeCardHandRank::FLUSH, 3},
        {ThreeCardHandRank::PAIR, 1},
        {ThreeCardHandRank::HIGH_CARD, 0}
    };
    REQUIRE_NOTHROW(BonusPaytable("ok", payouts));

    SECTION("Missing rank") {
        payouts.erase(ThreeCardHandRank::PAIR);
        REQUIRE_THROWS_AS(BonusPaytable("missing", payouts), PaytableValidationError);
    }

    SECTION("Negative multiplier") {
        payouts[ThreeCardHandRank::FLUSH] = -1;
        REQUIRE_THROWS_AS(BonusPaytable("negative", payouts), PaytableValidationError);
    }

    SECTION("Main table missing a rank") {
        REQUIRE_THROWS_AS(MainPaytable("short", {{FiveCardHandRank::ROYAL_FLUSH, 1000}}), PaytableValidationError);
    }
}
