// ─────────────────────────────────────────────────────────────────────────────
//  src/eval/hand_evaluator.cpp
//  Évaluateur 5 cartes Let It Ride : table de fréquences par valeur de rang,
//  détection couleur / quinte (roue A-2-3-4-5 comprise), puis classement par
//  précédence décroissante. Aucune allocation sur le chemin chaud.
// ─────────────────────────────────────────────────────────────────────────────
#include "eval/hand_evaluator.hpp"
#include "core/bitboard.hpp"
#include <algorithm>    // Pour std::lexicographical_compare_three_way
#include <array>
#include <map>
#include <stdexcept>

namespace lir {

namespace {

constexpr int TENS_THRESHOLD = 10;

const std::map<FiveCardHandRank, std::string> FIVE_CARD_RANK_NAMES = {
    {FiveCardHandRank::HIGH_CARD, "high_card"},
    {FiveCardHandRank::PAIR_BELOW_TENS, "pair_below_tens"},
    {FiveCardHandRank::PAIR_TENS_OR_BETTER, "pair_tens_or_better"},
    {FiveCardHandRank::TWO_PAIR, "two_pair"},
    {FiveCardHandRank::THREE_OF_A_KIND, "three_of_a_kind"},
    {FiveCardHandRank::STRAIGHT, "straight"},
    {FiveCardHandRank::FLUSH, "flush"},
    {FiveCardHandRank::FULL_HOUSE, "full_house"},
    {FiveCardHandRank::FOUR_OF_A_KIND, "four_of_a_kind"},
    {FiveCardHandRank::STRAIGHT_FLUSH, "straight_flush"},
    {FiveCardHandRank::ROYAL_FLUSH, "royal_flush"}
};

inline Rank to_rank(int value) { return static_cast<Rank>(value); }

} // namespace

std::strong_ordering operator<=>(const HandResult& a, const HandResult& b) {
    if (auto cmp = a.rank <=> b.rank; cmp != 0) return cmp;
    auto pa = a.primary();
    auto pb = b.primary();
    if (auto cmp = std::lexicographical_compare_three_way(pa.begin(), pa.end(), pb.begin(), pb.end()); cmp != 0) {
        return cmp;
    }
    auto ka = a.kicker_ranks();
    auto kb = b.kicker_ranks();
    return std::lexicographical_compare_three_way(ka.begin(), ka.end(), kb.begin(), kb.end());
}

bool operator==(const HandResult& a, const HandResult& b) {
    return (a <=> b) == 0;
}

HandResult evaluate_five_card_hand(std::span<const Card> cards) {
    if (cards.size() != 5) {
        throw std::invalid_argument("Expected 5 cards, got " + std::to_string(cards.size()));
    }
    if (!all_distinct(cards)) {
        throw std::invalid_argument("Duplicate cards in hand: " + cards_to_string(cards));
    }

    // Fréquences par valeur (index 2..14)
    std::array<int, 15> counts{};
    bool is_flush = true;
    for (const Card& c : cards) {
        ++counts[rank_value(c.rank)];
        if (c.suit != cards[0].suit) is_flush = false;
    }

    // Regroupement par multiplicité, chaque groupe en ordre décroissant de valeur
    std::array<int, 5> quads{}, trips{}, pairs{}, singles{};
    int n_quads = 0, n_trips = 0, n_pairs = 0, n_singles = 0;
    for (int v = 14; v >= 2; --v) {
        switch (counts[v]) {
            case 4: quads[n_quads++] = v; break;
            case 3: trips[n_trips++] = v; break;
            case 2: pairs[n_pairs++] = v; break;
            case 1: singles[n_singles++] = v; break;
            default: break;
        }
    }

    // Quinte : 5 valeurs uniques consécutives, ou la roue {2,3,4,5,A} (haute au Cinq)
    bool is_straight = false;
    int straight_high = 0;
    if (n_singles == 5) {
        if (singles[0] - singles[4] == 4) {
            is_straight = true;
            straight_high = singles[0];
        } else if (singles[0] == 14 && singles[1] == 5 && singles[4] == 2) {
            is_straight = true;
            straight_high = 5;
        }
    }

    HandResult result;

    if (is_straight && is_flush) {
        result.rank = straight_high == 14 ? FiveCardHandRank::ROYAL_FLUSH : FiveCardHandRank::STRAIGHT_FLUSH;
        result.add_primary(to_rank(straight_high));
        return result;
    }

    if (n_quads == 1) {
        result.rank = FiveCardHandRank::FOUR_OF_A_KIND;
        result.add_primary(to_rank(quads[0]));
        result.add_kicker(to_rank(singles[0]));
        return result;
    }

    if (n_trips == 1) {
        if (n_pairs == 1) {
            result.rank = FiveCardHandRank::FULL_HOUSE;
            result.add_primary(to_rank(trips[0]));
            result.add_primary(to_rank(pairs[0]));
            return result;
        }
        result.rank = FiveCardHandRank::THREE_OF_A_KIND;
        result.add_primary(to_rank(trips[0]));
        for (int i = 0; i < n_singles; ++i) result.add_kicker(to_rank(singles[i]));
        return result;
    }

    if (is_flush) {
        result.rank = FiveCardHandRank::FLUSH;
        for (int i = 0; i < n_singles; ++i) result.add_primary(to_rank(singles[i]));
        return result;
    }

    if (is_straight) {
        result.rank = FiveCardHandRank::STRAIGHT;
        result.add_primary(to_rank(straight_high));
        return result;
    }

    if (n_pairs == 2) {
        result.rank = FiveCardHandRank::TWO_PAIR;
        result.add_primary(to_rank(pairs[0]));
        result.add_primary(to_rank(pairs[1]));
        result.add_kicker(to_rank(singles[0]));
        return result;
    }

    if (n_pairs == 1) {
        result.rank = pairs[0] >= TENS_THRESHOLD ? FiveCardHandRank::PAIR_TENS_OR_BETTER
                                                 : FiveCardHandRank::PAIR_BELOW_TENS;
        result.add_primary(to_rank(pairs[0]));
        for (int i = 0; i < n_singles; ++i) result.add_kicker(to_rank(singles[i]));
        return result;
    }

    result.rank = FiveCardHandRank::HIGH_CARD;
    result.add_primary(to_rank(singles[0]));
    for (int i = 1; i < n_singles; ++i) result.add_kicker(to_rank(singles[i]));
    return result;
}

std::string to_string(FiveCardHandRank rank) {
    auto it = FIVE_CARD_RANK_NAMES.find(rank);
    if (it == FIVE_CARD_RANK_NAMES.end()) {
        return "unknown";
    }
    return it->second;
}

FiveCardHandRank five_card_rank_from_string(const std::string& name) {
    for (const auto& [rank, rank_name] : FIVE_CARD_RANK_NAMES) {
        if (rank_name == name) return rank;
    }
    throw std::invalid_argument("Unknown five-card hand rank: '" + name + "'");
}

} // namespace lir
