#include "core/bitboard.hpp"
#include "core/cards.hpp"

namespace lir {

std::string board_to_string(Bitboard board) {
    // L'ordre des bits donne un affichage stable (couleur puis rang)
    return cards_to_string(board_to_cards(board));
}

std::vector<Card> board_to_cards(Bitboard board) {
    std::vector<Card> cards;
    cards.reserve(count_set_bits(board)); // Pré-allouer
    board &= FULL_DECK;
    while (board != 0) {
        cards.push_back(pop_lsb(board));
    }
    return cards;
}

Bitboard cards_to_board(std::span<const Card> cards) {
    Bitboard board = EMPTY_BOARD;
    for (Card c : cards) {
        set_card(board, c);
    }
    return board;
}

bool all_distinct(std::span<const Card> cards) {
    Bitboard seen = EMPTY_BOARD;
    for (Card c : cards) {
        if (test_card(seen, c)) return false;
        set_card(seen, c);
    }
    return true;
}

} // namespace lir
