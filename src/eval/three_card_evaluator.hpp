#ifndef LIR_THREE_CARD_EVALUATOR_HPP
#define LIR_THREE_CARD_EVALUATOR_HPP

#include <cstdint>
#include <span>
#include <string>

#include "core/cards.hpp"

namespace lir {

// Rangs du bonus 3 cartes (pire -> meilleure). MINI_ROYAL = Q-K-A assortis.
enum class ThreeCardHandRank : uint8_t {
    HIGH_CARD = 1,
    PAIR = 2,
    FLUSH = 3,
    STRAIGHT = 4,
    THREE_OF_A_KIND = 5,
    STRAIGHT_FLUSH = 6,
    MINI_ROYAL = 7
};

constexpr int NUM_THREE_CARD_RANKS = 7;

/**
 * @brief Classe exactement 3 cartes distinctes pour le pari bonus.
 * A-2-3 est une quinte, K-A-2 n'en est pas une.
 * @throws std::invalid_argument si le nombre de cartes n'est pas 3 ou en cas de doublon.
 */
ThreeCardHandRank evaluate_three_card_hand(std::span<const Card> cards);

std::string to_string(ThreeCardHandRank rank);
ThreeCardHandRank three_card_rank_from_string(const std::string& name);

} // namespace lir

#endif // LIR_THREE_CARD_EVALUATOR_HPP
