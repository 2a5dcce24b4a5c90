#ifndef LIR_CARDS_HPP
#define LIR_CARDS_HPP

#include <cstdint>
#include <string>
#include <vector>
#include <span>
#include <stdexcept> // Pour std::invalid_argument

namespace lir {

// Enum pour les couleurs (suits), sans ordre de jeu
enum class Suit : uint8_t { CLUBS = 0, DIAMONDS = 1, HEARTS = 2, SPADES = 3 };

// Enum pour les rangs : valeurs explicites 2..14, l'As vaut 14 (ACE-high)
enum class Rank : uint8_t {
    TWO = 2, THREE = 3, FOUR = 4, FIVE = 5, SIX = 6, SEVEN = 7, EIGHT = 8,
    NINE = 9, TEN = 10, JACK = 11, QUEEN = 12, KING = 13, ACE = 14
};

constexpr int NUM_RANKS = 13;
constexpr int NUM_SUITS = 4;

constexpr int rank_value(Rank r) { return static_cast<int>(r); }

// Valeur ACE-low : l'As vaut 1, utilisé uniquement pour la roue (A-2-3-4-5)
constexpr int rank_low_value(Rank r) { return r == Rank::ACE ? 1 : static_cast<int>(r); }

// Comparaison en mode ACE-low : <0, 0 ou >0
constexpr int compare_ace_low(Rank a, Rank b) { return rank_low_value(a) - rank_low_value(b); }

/**
 * @brief Carte immuable (rang, couleur).
 * L'égalité porte sur les deux champs, l'ordre uniquement sur le rang :
 * deux cartes de même rang ne sont ni < ni > l'une de l'autre mais restent différentes.
 */
struct Card {
    Rank rank = Rank::TWO;
    Suit suit = Suit::CLUBS;

    constexpr bool operator==(const Card& other) const { return rank == other.rank && suit == other.suit; }
    constexpr bool operator!=(const Card& other) const { return !(*this == other); }
    constexpr bool operator<(const Card& other) const { return rank < other.rank; }
    constexpr bool operator>(const Card& other) const { return rank > other.rank; }
};

constexpr Card make_card(Rank r, Suit s) { return Card{r, s}; }
constexpr Rank get_rank(Card c) { return c.rank; }
constexpr Suit get_suit(Card c) { return c.suit; }

// Index 0-51 = suit * 13 + (rank - 2), utilisé par les bitboards
constexpr int card_index(Card c) {
    return static_cast<int>(c.suit) * NUM_RANKS + (static_cast<int>(c.rank) - 2);
}

Card card_from_index(int index);

// Fonctions de conversion string <-> Card/Rank/Suit
std::string to_string(Suit s);
std::string to_string(Rank r);
std::string to_string(Card c);

Card card_from_string(const std::string& s);
Rank rank_from_char(char r);
Suit suit_from_char(char s);

// Format texte stable : "Ah Kd Qs" (séparateur espace)
std::string cards_to_string(std::span<const Card> cards);
std::vector<Card> cards_from_string(const std::string& s);

} // namespace lir

#endif // LIR_CARDS_HPP
