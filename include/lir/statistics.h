#ifndef LIR_STATISTICS_H
#define LIR_STATISTICS_H

#include "lir/aggregation.h"
#include "lir/session.h"
#include <map>
#include <span>
#include <utility>
#include <vector>

namespace lir {

// ─────────────────────────────────────────────────────────────
// Lois usuelles (quantiles et queues)
// ─────────────────────────────────────────────────────────────

// Quantile de la loi normale centrée réduite, p dans ]0, 1[
double normal_quantile(double p);

// Quantile de la loi de Student à df degrés de liberté, p dans ]0, 1[
double student_t_quantile(double p, double df);

// P(X >= x) pour X suivant un khi-deux à df degrés de liberté
double chi_square_survival(double x, double df);

// Khi-deux de Pearson : statistique et p-value, df = observed.size() - 1
std::pair<double, double> pearson_chi_square(std::span<const double> observed,
                                             std::span<const double> expected);

// ─────────────────────────────────────────────────────────────
// Intervalles de confiance
// ─────────────────────────────────────────────────────────────

struct ConfidenceInterval {
    double lower = 0.0;
    double upper = 0.0;
    double level = 0.95;

    bool contains(double value) const { return value >= lower && value <= upper; }
    bool operator==(const ConfidenceInterval&) const = default;
};

/**
 * @brief Intervalle de Wilson pour une proportion successes / total.
 *
 * Borné à [0, 1]. std::invalid_argument si total <= 0, si successes sort
 * de [0, total] ou si level sort de ]0, 1[.
 */
ConfidenceInterval wilson_confidence_interval(int successes, int total, double level = 0.95);

// Moyenne ± t(1 - a/2, n - 1) * s / sqrt(n) ; intervalle dégénéré sous deux valeurs
ConfidenceInterval mean_confidence_interval(std::span<const double> data, double level = 0.95);

// ─────────────────────────────────────────────────────────────
// Statistiques descriptives
// ─────────────────────────────────────────────────────────────

inline const std::vector<int> DEFAULT_PERCENTILES = {5, 25, 50, 75, 95};

struct DistributionStats {
    double mean = 0.0;
    double std_dev = 0.0;    // Écart-type d'échantillon (n - 1)
    double variance = 0.0;
    double skewness = 0.0;   // Fisher-Pearson ajusté, 0 sous trois valeurs
    double kurtosis = 0.0;   // Excès de kurtosis ajusté, 0 sous quatre valeurs
    double min = 0.0;
    double max = 0.0;
    std::map<int, double> percentiles;
    double iqr = 0.0;
};

// Percentiles par interpolation linéaire entre rangs (p dans [0, 100])
std::map<int, double> calculate_percentiles(std::span<const double> data,
                                            const std::vector<int>& percentiles = DEFAULT_PERCENTILES);

// std::invalid_argument si data est vide
DistributionStats calculate_distribution_stats(std::span<const double> data,
                                               const std::vector<int>& percentiles = DEFAULT_PERCENTILES);

// ─────────────────────────────────────────────────────────────
// Risque et synthèse
// ─────────────────────────────────────────────────────────────

struct RiskMetrics {
    double prob_any_loss = 0.0;       // profit < 0
    double prob_loss_50pct = 0.0;     // profit <= -50 % de la bankroll de départ
    double prob_loss_100pct = 0.0;    // profit <= -100 % (ruine)
    double max_drawdown_mean = 0.0;
    double max_drawdown_std = 0.0;
};

RiskMetrics calculate_risk_metrics(std::span<const SessionResult> results);

struct DetailedStatistics {
    double session_win_rate = 0.0;
    ConfidenceInterval session_win_rate_ci;
    double ev_per_hand = 0.0;
    ConfidenceInterval ev_per_hand_ci;
    DistributionStats session_profit_distribution;
    double main_game_ev = 0.0;
    double bonus_ev = 0.0;
    RiskMetrics risk_metrics;
    int total_sessions = 0;
    long long total_hands = 0;
};

/**
 * @brief Statistiques détaillées d'un lot de sessions.
 *
 * Avec les sessions, l'intervalle de l'EV par main porte sur l'EV de chaque
 * session et les métriques de risque utilisent les drawdowns. Sans elles,
 * l'intervalle est celui du profit de session ramené au nombre moyen de
 * mains, et seul prob_any_loss est renseigné.
 * std::invalid_argument si l'agrégat ne contient aucune session.
 */
DetailedStatistics calculate_statistics(const AggregateStatistics& aggregate,
                                        std::span<const SessionResult> results = {},
                                        double confidence_level = 0.95);

// Agrège puis calcule ; std::invalid_argument si results est vide
DetailedStatistics calculate_statistics_from_results(std::span<const SessionResult> results,
                                                     double confidence_level = 0.95);

} // namespace lir

#endif // LIR_STATISTICS_H
