#ifndef LIR_BITBOARD_HPP
#define LIR_BITBOARD_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <span>
#include <bit> // Pour std::popcount / std::countr_zero

#include "core/cards.hpp"

namespace lir {

// Ensemble de cartes sous forme de masque 52 bits (bit = card_index)
using Bitboard = uint64_t;

constexpr Bitboard EMPTY_BOARD = 0ULL;
constexpr int NUM_CARDS = 52;
constexpr Bitboard FULL_DECK = (1ULL << NUM_CARDS) - 1;

inline void set_card(Bitboard& board, Card c) {
    board |= (1ULL << card_index(c));
}

inline bool test_card(Bitboard board, Card c) {
    return (board & (1ULL << card_index(c))) != 0;
}

inline int count_set_bits(Bitboard board) {
    return std::popcount(board);
}

// Extraire la carte du bit le moins significatif et l'enlever (board non vide)
inline Card pop_lsb(Bitboard& board) {
    int lsb_index = std::countr_zero(board);
    board &= (board - 1);
    return card_from_index(lsb_index);
}

// Fonctions de conversion
std::string board_to_string(Bitboard board);
std::vector<Card> board_to_cards(Bitboard board);
Bitboard cards_to_board(std::span<const Card> cards);

/**
 * @brief Vérifie que toutes les cartes sont distinctes.
 * Utilisé par les évaluateurs pour rejeter les mains invalides sans allocation.
 */
bool all_distinct(std::span<const Card> cards);

} // namespace lir

#endif // LIR_BITBOARD_HPP
