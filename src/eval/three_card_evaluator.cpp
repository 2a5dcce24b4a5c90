#include "eval/three_card_evaluator.hpp"
#include "core/bitboard.hpp"
#include <map>
#include <stdexcept>
#include <utility> // Pour std::swap

namespace lir {

namespace {

const std::map<ThreeCardHandRank, std::string> THREE_CARD_RANK_NAMES = {
    {ThreeCardHandRank::HIGH_CARD, "high_card"},
    {ThreeCardHandRank::PAIR, "pair"},
    {ThreeCardHandRank::FLUSH, "flush"},
    {ThreeCardHandRank::STRAIGHT, "straight"},
    {ThreeCardHandRank::THREE_OF_A_KIND, "three_of_a_kind"},
    {ThreeCardHandRank::STRAIGHT_FLUSH, "straight_flush"},
    {ThreeCardHandRank::MINI_ROYAL, "mini_royal"}
};

} // namespace

ThreeCardHandRank evaluate_three_card_hand(std::span<const Card> cards) {
    if (cards.size() != 3) {
        throw std::invalid_argument("Expected 3 cards, got " + std::to_string(cards.size()));
    }
    if (!all_distinct(cards)) {
        throw std::invalid_argument("Duplicate cards in hand: " + cards_to_string(cards));
    }

    int v0 = rank_value(cards[0].rank);
    int v1 = rank_value(cards[1].rank);
    int v2 = rank_value(cards[2].rank);

    // Réseau de tri à 3 comparateurs : v0 <= v1 <= v2
    if (v0 > v1) std::swap(v0, v1);
    if (v1 > v2) std::swap(v1, v2);
    if (v0 > v1) std::swap(v0, v1);

    const bool is_flush = cards[0].suit == cards[1].suit && cards[1].suit == cards[2].suit;

    // Adjacence propre au 3 cartes : consécutives, ou la roue A-2-3 {2,3,14}
    const bool is_straight = (v1 == v0 + 1 && v2 == v1 + 1) || (v0 == 2 && v1 == 3 && v2 == 14);

    if (is_straight && is_flush) {
        if (v0 == 12 && v1 == 13 && v2 == 14) {
            return ThreeCardHandRank::MINI_ROYAL;
        }
        return ThreeCardHandRank::STRAIGHT_FLUSH;
    }
    if (v0 == v2) {
        return ThreeCardHandRank::THREE_OF_A_KIND;
    }
    if (is_straight) {
        return ThreeCardHandRank::STRAIGHT;
    }
    if (is_flush) {
        return ThreeCardHandRank::FLUSH;
    }
    if (v0 == v1 || v1 == v2) {
        return ThreeCardHandRank::PAIR;
    }
    return ThreeCardHandRank::HIGH_CARD;
}

std::string to_string(ThreeCardHandRank rank) {
    auto it = THREE_CARD_RANK_NAMES.find(rank);
    if (it == THREE_CARD_RANK_NAMES.end()) {
        return "unknown";
    }
    return it->second;
}

ThreeCardHandRank three_card_rank_from_string(const std::string& name) {
    for (const auto& [rank, rank_name] : THREE_CARD_RANK_NAMES) {
        if (rank_name == name) return rank;
    }
    throw std::invalid_argument("Unknown three-card hand rank: '" + name + "'");
}

} // namespace lir
