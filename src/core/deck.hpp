#ifndef LIR_CORE_DECK_HPP
#define LIR_CORE_DECK_HPP

#include "core/cards.hpp"
#include <array>
#include <vector>
#include <span>
#include <random>
#include <cstdint>
#include <stdexcept> // Pour std::runtime_error

namespace lir {

// Levée quand on demande plus de cartes qu'il n'en reste ; le deck n'est pas modifié.
class DeckEmptyError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Composition restante par valeur de rang (index 2..14, les index 0 et 1 restent à 0)
using RankCounts = std::array<int, 15>;

/**
 * @brief Paquet de 52 cartes : séquence restante + séquence distribuée.
 *
 * Invariant : get_cards_remaining() + get_cards_dealt() == 52.
 * Les cartes distribuées occupent le début du tableau interne, les restantes la fin,
 * ce qui permet de rendre des vues (std::span) sans allocation.
 */
class Deck {
public:
    Deck();
    ~Deck() = default;

    // Fisher-Yates sur les cartes restantes uniquement.
    void shuffle(std::mt19937_64& rng);

    // Distribue n cartes de façon atomique. La vue reste valide jusqu'au prochain shuffle.
    std::span<const Card> deal(int n);

    // Variante sans allocation pour le chemin chaud : remplit `out` entièrement.
    void deal_into(std::span<Card> out);

    // O(1) : 52 restantes, 0 distribuée, sans re-mélange.
    void reset();

    int get_cards_remaining() const { return NUM_DECK_CARDS - next_card_index_; }
    int get_cards_dealt() const { return next_card_index_; }
    std::span<const Card> get_dealt_cards() const;
    std::span<const Card> get_remaining_cards() const;

    RankCounts remaining_rank_counts() const;

    // Impose un ordre précis (tests, paquets truqués). Remet aussi le deck à zéro.
    void set_cards_for_testing(const std::vector<Card>& specific_deck);

    static constexpr int NUM_DECK_CARDS = 52;

private:
    std::array<Card, NUM_DECK_CARDS> cards_;
    int next_card_index_ = 0;
};

/**
 * @brief Tirage uniforme dans [0, bound) sans biais, à partir de la sortie brute 64 bits.
 * std::uniform_int_distribution n'est pas portable d'une bibliothèque standard à l'autre,
 * ce tirage garantit la même permutation pour une graine donnée sur toutes les plateformes.
 */
uint64_t bounded_random(std::mt19937_64& rng, uint64_t bound);

} // namespace lir

#endif // LIR_CORE_DECK_HPP
