#include "core/cards.hpp"
#include <cctype>
#include <sstream> // Pour le découpage de "Ah Kd Qs"
#include <stdexcept>
#include <string_view>

namespace lir {

namespace {

// Symboles indexés par rank_value - 2 et par valeur de Suit
constexpr std::string_view RANK_SYMBOLS = "23456789TJQKA";
constexpr std::string_view SUIT_SYMBOLS = "cdhs";

static_assert(RANK_SYMBOLS.size() == NUM_RANKS);
static_assert(SUIT_SYMBOLS.size() == NUM_SUITS);

} // namespace

Card card_from_index(int index) {
    if (index < 0 || index >= NUM_RANKS * NUM_SUITS) {
        throw std::invalid_argument("Invalid card index: " + std::to_string(index));
    }
    return make_card(static_cast<Rank>(index % NUM_RANKS + 2), static_cast<Suit>(index / NUM_RANKS));
}

// Lecture tolérante à la casse : 'a' == 'A', 'H' == 'h'
Rank rank_from_char(char r) {
    const auto pos = RANK_SYMBOLS.find(static_cast<char>(std::toupper(static_cast<unsigned char>(r))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Unknown rank symbol '" + std::string(1, r) + "'");
    }
    return static_cast<Rank>(pos + 2);
}

Suit suit_from_char(char s) {
    const auto pos = SUIT_SYMBOLS.find(static_cast<char>(std::tolower(static_cast<unsigned char>(s))));
    if (pos == std::string_view::npos) {
        throw std::invalid_argument("Unknown suit symbol '" + std::string(1, s) + "'");
    }
    return static_cast<Suit>(pos);
}

std::string to_string(Rank r) {
    const int idx = rank_value(r) - 2;
    if (idx < 0 || idx >= NUM_RANKS) return "?";
    return std::string(1, RANK_SYMBOLS[idx]);
}

std::string to_string(Suit s) {
    const auto idx = static_cast<size_t>(s);
    if (idx >= SUIT_SYMBOLS.size()) return "?";
    return std::string(1, SUIT_SYMBOLS[idx]);
}

std::string to_string(Card c) {
    return to_string(c.rank) + to_string(c.suit);
}

// Exactement deux caractères, rang puis couleur ("Td")
Card card_from_string(const std::string& s) {
    if (s.size() != 2) {
        throw std::invalid_argument("Card text must be two characters (rank, suit), got '" + s + "'");
    }
    return make_card(rank_from_char(s[0]), suit_from_char(s[1]));
}

std::string cards_to_string(std::span<const Card> cards) {
    std::string out;
    out.reserve(cards.size() * 3);
    for (size_t i = 0; i < cards.size(); ++i) {
        if (i > 0) out += ' ';
        out += to_string(cards[i]);
    }
    return out;
}

std::vector<Card> cards_from_string(const std::string& s) {
    std::vector<Card> cards;
    std::istringstream iss(s);
    std::string token;
    while (iss >> token) {
        cards.push_back(card_from_string(token));
    }
    return cards;
}

} // namespace lir
