#ifndef LIR_RISK_OF_RUIN_H
#define LIR_RISK_OF_RUIN_H

#include "lir/session.h"
#include "lir/statistics.h"
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace lir {

struct RiskOfRuinConfig {
    std::vector<int> bankroll_units = {20, 40, 60, 80, 100}; // Multiples de la mise de base
    std::optional<double> base_bet;    // Absent : total misé / (mains * 3)
    int simulations_per_level = 10000;
    int max_sessions_per_simulation = 10000;
    double confidence_level = 0.95;
    uint64_t random_seed = 42;
    bool include_analytical = true;

    void validate() const;
};

struct RiskOfRuinResult {
    int bankroll_units = 0;
    double ruin_probability = 0.0;
    ConfidenceInterval confidence_interval;   // Wilson sur le nombre de ruines
    double half_bankroll_risk = 0.0;          // Bankroll tombée à 50 %
    double quarter_bankroll_risk = 0.0;       // Bankroll tombée à 75 %
    int sessions_simulated = 0;

    bool operator==(const RiskOfRuinResult&) const = default;
};

struct RiskOfRuinReport {
    double base_bet = 0.0;
    double starting_bankroll = 0.0;
    std::vector<RiskOfRuinResult> results;     // Par niveau croissant
    double mean_session_profit = 0.0;
    double session_profit_std = 0.0;
    std::vector<double> analytical_estimates;  // Vide sans include_analytical
};

// Ruine du joueur, approximation normale : exp(-2 mu B / sigma^2), 1 si mu <= 0
double analytical_ruin_probability(double mean_profit, double std_profit, double bankroll);

/**
 * @brief Risque de ruine par niveau de bankroll.
 *
 * Chaque trajectoire rejoue des profits de session tirés avec remise parmi
 * les sessions observées, jusqu'à la ruine (bankroll <= 0) ou
 * max_sessions_per_simulation sessions. Les franchissements de 75 % et
 * 50 % de la bankroll sont comptés une fois par trajectoire.
 *
 * std::invalid_argument avec moins de 10 sessions, une configuration
 * invalide ou une mise de base non positive.
 */
RiskOfRuinReport calculate_risk_of_ruin(std::span<const SessionResult> results,
                                        const RiskOfRuinConfig& config = {});

std::string format_risk_of_ruin_report(const RiskOfRuinReport& report);

} // namespace lir

#endif // LIR_RISK_OF_RUIN_H
