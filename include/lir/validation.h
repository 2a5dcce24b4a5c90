#ifndef LIR_VALIDATION_H
#define LIR_VALIDATION_H

#include "lir/aggregation.h"
#include "lir/statistics.h"
#include <map>
#include <string>
#include <vector>

namespace lir {

// Probabilités exactes d'une main de 5 cartes (C(52,5) = 2 598 960), paires regroupées
const std::map<std::string, double>& theoretical_hand_probabilities();

constexpr double THEORETICAL_HOUSE_EDGE = 0.035;

// Seuils d'alerte
constexpr double WARNING_CHI_SQUARE_P = 0.001;
constexpr double WARNING_EV_DEVIATION = 0.20;

struct ChiSquareResult {
    double statistic = 0.0;
    double p_value = 1.0;
    int degrees_of_freedom = 0;
    bool is_valid = true;   // p_value > seuil de signification
};

struct ValidationReport {
    ChiSquareResult chi_square;
    std::map<std::string, double> observed_frequencies;   // Proportions observées
    std::map<std::string, double> expected_frequencies;
    double ev_actual = 0.0;
    double ev_theoretical = 0.0;
    double ev_deviation_pct = 0.0;                        // |écart relatif|, 0.2 = 20 %
    double session_win_rate = 0.0;
    ConfidenceInterval session_win_rate_ci;
    std::vector<std::string> warnings;
    bool is_valid = true;
};

// pair_tens_or_better et pair_below_tens fusionnées en "pair"
std::map<std::string, int> normalize_hand_frequencies(const std::map<std::string, int>& frequencies);

/**
 * @brief Test d'adéquation du khi-deux contre les probabilités théoriques.
 *
 * Les fréquences doivent être normalisées ; les catégories inconnues sont
 * ignorées. std::invalid_argument si aucune observation.
 */
ChiSquareResult calculate_chi_square(const std::map<std::string, int>& observed,
                                     double significance_level = 0.05);

/**
 * @brief Confronte un agrégat à la théorie.
 *
 * Khi-deux sur les fréquences de mains, écart de l'EV par main à
 * -THEORETICAL_HOUSE_EDGE * base_bet, intervalle de Wilson sur le taux de
 * sessions gagnantes. Invalide si le khi-deux échoue, si sa p-value passe
 * sous WARNING_CHI_SQUARE_P ou si le taux de sessions gagnantes sort de
 * [0.1, 0.9].
 */
ValidationReport validate_simulation(const AggregateStatistics& stats,
                                     double significance_level = 0.05,
                                     double base_bet = 1.0);

} // namespace lir

#endif // LIR_VALIDATION_H
