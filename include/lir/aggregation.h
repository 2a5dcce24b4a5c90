#ifndef LIR_AGGREGATION_H
#define LIR_AGGREGATION_H

#include "lir/session.h"
#include <map>
#include <span>
#include <string>
#include <vector>

namespace lir {

/**
 * @brief Statistiques agrégées sur un ensemble de sessions.
 *
 * SessionResult ne sépare pas les gains principaux et bonus : sans fréquences
 * de mains, le bonus est supposé à l'équilibre (bonus_won = bonus_wagered).
 */
struct AggregateStatistics {
    int total_sessions = 0;
    int winning_sessions = 0;
    int losing_sessions = 0;
    int push_sessions = 0;
    double session_win_rate = 0.0;

    long long total_hands = 0;

    double total_wagered = 0.0;
    double total_won = 0.0;
    double net_result = 0.0;
    double expected_value_per_hand = 0.0;

    double main_wagered = 0.0;
    double main_won = 0.0;
    double main_ev_per_hand = 0.0;

    double bonus_wagered = 0.0;
    double bonus_won = 0.0;
    double bonus_ev_per_hand = 0.0;

    std::map<std::string, int> hand_frequencies;
    std::map<std::string, double> hand_frequency_pct;

    double session_profit_mean = 0.0;
    double session_profit_std = 0.0;     // Écart-type d'échantillon (n - 1)
    double session_profit_median = 0.0;
    double session_profit_min = 0.0;
    double session_profit_max = 0.0;

    std::vector<double> session_profits; // Conservés pour merge_aggregates
};

// std::invalid_argument si results est vide
AggregateStatistics aggregate_results(std::span<const SessionResult> results);

AggregateStatistics aggregate_with_hand_frequencies(std::span<const SessionResult> results,
                                                    const std::map<std::string, int>& hand_frequencies);

// Fusion de deux agrégats (résultats de plusieurs lots)
AggregateStatistics merge_aggregates(const AggregateStatistics& a, const AggregateStatistics& b);

} // namespace lir

#endif // LIR_AGGREGATION_H
