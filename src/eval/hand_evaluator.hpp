#ifndef LIR_HAND_EVALUATOR_HPP
#define LIR_HAND_EVALUATOR_HPP

#include <array>
#include <compare>
#include <cstdint>
#include <span>
#include <string>

#include "core/cards.hpp"

namespace lir {

// Rangs des mains à 5 cartes, valeurs explicites (pire -> meilleure).
// Les paires sont séparées au seuil du Dix : seules les paires de Dix ou mieux paient.
enum class FiveCardHandRank : uint8_t {
    HIGH_CARD = 0,
    PAIR_BELOW_TENS = 1,
    PAIR_TENS_OR_BETTER = 2,
    TWO_PAIR = 3,
    THREE_OF_A_KIND = 4,
    STRAIGHT = 5,
    FLUSH = 6,
    FULL_HOUSE = 7,
    FOUR_OF_A_KIND = 8,
    STRAIGHT_FLUSH = 9,
    ROYAL_FLUSH = 10
};

constexpr int NUM_FIVE_CARD_RANKS = 11;

/**
 * @brief Résultat d'évaluation d'une main de 5 cartes.
 *
 * primary_cards : rangs qui définissent la catégorie (ex. brelan puis paire pour un full).
 * kickers       : rangs restants, triés par ordre décroissant.
 * Capacité fixe, aucune allocation.
 */
struct HandResult {
    FiveCardHandRank rank = FiveCardHandRank::HIGH_CARD;
    std::array<Rank, 5> primary_cards{};
    uint8_t num_primary = 0;
    std::array<Rank, 4> kickers{};
    uint8_t num_kickers = 0;

    std::span<const Rank> primary() const { return {primary_cards.data(), num_primary}; }
    std::span<const Rank> kicker_ranks() const { return {kickers.data(), num_kickers}; }

    void add_primary(Rank r) { primary_cards[num_primary++] = r; }
    void add_kicker(Rank r) { kickers[num_kickers++] = r; }
};

// Ordre total : rang, puis primary_cards puis kickers (lexicographique).
std::strong_ordering operator<=>(const HandResult& a, const HandResult& b);
bool operator==(const HandResult& a, const HandResult& b);

/**
 * @brief Évalue exactement 5 cartes distinctes.
 * @throws std::invalid_argument si le nombre de cartes n'est pas 5 ou si une carte est en double.
 * Fonction pure, sûre en concurrence.
 */
HandResult evaluate_five_card_hand(std::span<const Card> cards);

// Noms en minuscules ("flush", "pair_tens_or_better", ...), format d'export stable
std::string to_string(FiveCardHandRank rank);
FiveCardHandRank five_card_rank_from_string(const std::string& name);

} // namespace lir

#endif // LIR_HAND_EVALUATOR_HPP
