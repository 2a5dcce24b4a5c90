#ifndef LIR_HAND_ANALYSIS_H
#define LIR_HAND_ANALYSIS_H

#include "core/cards.hpp"
#include <optional>
#include <span>

namespace lir {

/**
 * @brief Photographie des caractéristiques d'une main partielle (3 ou 4 cartes).
 *
 * Calculée à chaque point de décision à partir des seules cartes visibles,
 * consommée par la stratégie puis jetée.
 */
struct HandAnalysis {
    // Compteurs
    int high_cards = 0;            // Cartes Dix ou plus
    int suited_cards = 0;          // Taille du plus grand groupe de même couleur
    int connected_cards = 0;       // Cartes dans la meilleure fenêtre de quinte
    int gaps = 0;                  // Trous dans cette fenêtre
    int suited_high_cards = 0;     // Cartes hautes du groupe assorti
    int straight_flush_spread = 0; // Écart min-max + 1 du groupe assorti, 0 hors tirage quinte flush

    // Mains faites
    bool has_paying_hand = false;  // Paire de Dix ou mieux, deux paires, brelan
    bool has_pair = false;         // Exactement une paire
    bool has_high_pair = false;
    bool has_trips = false;
    bool has_two_pair = false;
    std::optional<Rank> pair_rank; // Renseigné seulement pour une paire simple

    // Tirages
    bool is_flush_draw = false;
    bool is_straight_draw = false;
    bool is_open_straight_draw = false;
    bool is_inside_straight_draw = false;
    bool is_straight_flush_draw = false;
    bool is_royal_draw = false;
    bool is_excluded_sf_consecutive = false; // A-2-3 ou 2-3-4 assortis
};

/**
 * @brief Analyse les 3 cartes du joueur (décision Bet 1).
 * @throws std::invalid_argument si cards.size() != 3.
 */
HandAnalysis analyze_three_cards(std::span<const Card> cards);

/**
 * @brief Analyse 3 cartes joueur + 1 carte commune (décision Bet 2).
 * @throws std::invalid_argument si cards.size() != 4.
 */
HandAnalysis analyze_four_cards(std::span<const Card> cards);

} // namespace lir

#endif // LIR_HAND_ANALYSIS_H
