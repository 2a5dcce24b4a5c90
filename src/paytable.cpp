#include "lir/paytable.h"
#include "spdlog/spdlog.h"
#include <utility>

namespace lir {

namespace {

// Vérifie qu'un rang est présent avec un multiplicateur positif ou nul
template <typename RankT>
int checked_multiplier(const std::string& table, const std::map<RankT, int>& payouts, RankT rank) {
    auto it = payouts.find(rank);
    if (it == payouts.end()) {
        throw PaytableValidationError("Paytable '" + table + "' is missing hand rank '" + to_string(rank) + "'");
    }
    if (it->second < 0) {
        throw PaytableValidationError("Paytable '" + table + "' has negative multiplier "
                                      + std::to_string(it->second) + " for '" + to_string(rank) + "'");
    }
    return it->second;
}

} // namespace

MainPaytable::MainPaytable(std::string name, const std::map<FiveCardHandRank, int>& payouts)
    : name_(std::move(name))
{
    for (int r = 0; r < NUM_FIVE_CARD_RANKS; ++r) {
        multipliers_[r] = checked_multiplier(name_, payouts, static_cast<FiveCardHandRank>(r));
    }
}

BonusPaytable::BonusPaytable(std::string name, const std::map<ThreeCardHandRank, int>& payouts)
    : name_(std::move(name))
{
    for (int r = 1; r <= NUM_THREE_CARD_RANKS; ++r) {
        multipliers_[r - 1] = checked_multiplier(name_, payouts, static_cast<ThreeCardHandRank>(r));
    }
}

MainPaytable standard_main_paytable() {
    return MainPaytable("standard", {
        {FiveCardHandRank::ROYAL_FLUSH, 1000},
        {FiveCardHandRank::STRAIGHT_FLUSH, 200},
        {FiveCardHandRank::FOUR_OF_A_KIND, 50},
        {FiveCardHandRank::FULL_HOUSE, 11},
        {FiveCardHandRank::FLUSH, 8},
        {FiveCardHandRank::STRAIGHT, 5},
        {FiveCardHandRank::THREE_OF_A_KIND, 3},
        {FiveCardHandRank::TWO_PAIR, 2},
        {FiveCardHandRank::PAIR_TENS_OR_BETTER, 1},
        {FiveCardHandRank::PAIR_BELOW_TENS, 0},
        {FiveCardHandRank::HIGH_CARD, 0}
    });
}

BonusPaytable bonus_paytable_a() {
    return BonusPaytable("paytable_a", {
        {ThreeCardHandRank::MINI_ROYAL, 50},
        {ThreeCardHandRank::STRAIGHT_FLUSH, 40},
        {ThreeCardHandRank::THREE_OF_A_KIND, 30},
        {ThreeCardHandRank::STRAIGHT, 6},
        {ThreeCardHandRank::FLUSH, 3},
        {ThreeCardHandRank::PAIR, 1},
        {ThreeCardHandRank::HIGH_CARD, 0}
    });
}

BonusPaytable bonus_paytable_b() {
    return BonusPaytable("paytable_b", {
        {ThreeCardHandRank::MINI_ROYAL, 100},
        {ThreeCardHandRank::STRAIGHT_FLUSH, 40},
        {ThreeCardHandRank::THREE_OF_A_KIND, 30},
        {ThreeCardHandRank::STRAIGHT, 5},
        {ThreeCardHandRank::FLUSH, 4},
        {ThreeCardHandRank::PAIR, 1},
        {ThreeCardHandRank::HIGH_CARD, 0}
    });
}

// Variante progressive : le Mini Royal paie le jackpot configuré
BonusPaytable bonus_paytable_c(int progressive_payout) {
    return BonusPaytable("paytable_c", {
        {ThreeCardHandRank::MINI_ROYAL, progressive_payout},
        {ThreeCardHandRank::STRAIGHT_FLUSH, 200},
        {ThreeCardHandRank::THREE_OF_A_KIND, 30},
        {ThreeCardHandRank::STRAIGHT, 6},
        {ThreeCardHandRank::FLUSH, 4},
        {ThreeCardHandRank::PAIR, 1},
        {ThreeCardHandRank::HIGH_CARD, 0}
    });
}

MainPaytable main_paytable_by_name(const std::string& name) {
    if (name == "standard") return standard_main_paytable();
    spdlog::error("Table principale inconnue : {}", name);
    throw std::invalid_argument("Unknown main paytable: '" + name + "'");
}

BonusPaytable bonus_paytable_by_name(const std::string& name, int progressive_payout) {
    if (name == "paytable_a") return bonus_paytable_a();
    if (name == "paytable_b") return bonus_paytable_b();
    if (name == "paytable_c") return bonus_paytable_c(progressive_payout);
    spdlog::error("Table bonus inconnue : {}", name);
    throw std::invalid_argument("Unknown bonus paytable: '" + name + "'");
}

} // namespace lir
