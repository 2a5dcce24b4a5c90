#include "lir/risk_of_ruin.h"
#include "lir/simulation_controller.h"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include <algorithm>
#include <cmath>
#include <iterator>
#include <random>
#include <stdexcept>
#include <string>

namespace lir {

namespace {

constexpr size_t MIN_SESSIONS = 10;

struct RuinCounts {
    int ruins = 0;
    int half_losses = 0;
    int quarter_losses = 0;
};

// Trajectoires de bankroll par tirage avec remise des profits observés
RuinCounts run_ruin_simulations(const std::vector<double>& profits, double bankroll,
                                const RiskOfRuinConfig& config, std::mt19937_64& rng) {
    RuinCounts counts;
    std::uniform_int_distribution<size_t> pick(0, profits.size() - 1);
    const double half_threshold = bankroll * 0.5;
    const double quarter_threshold = bankroll * 0.75;

    for (int sim = 0; sim < config.simulations_per_level; ++sim) {
        double current = bankroll;
        bool hit_half = false;
        bool hit_quarter = false;

        for (int s = 0; s < config.max_sessions_per_simulation; ++s) {
            current += profits[pick(rng)];

            if (!hit_quarter && current <= quarter_threshold) {
                hit_quarter = true;
                ++counts.quarter_losses;
            }
            if (!hit_half && current <= half_threshold) {
                hit_half = true;
                ++counts.half_losses;
            }
            if (current <= 0.0) {
                ++counts.ruins;
                break;
            }
        }
    }
    return counts;
}

double infer_base_bet(std::span<const SessionResult> results) {
    double wagered = 0.0;
    long long hands = 0;
    for (const auto& r : results) {
        wagered += r.total_wagered;
        hands += r.hands_played;
    }
    // Trois mises de base par main
    return hands > 0 ? wagered / (static_cast<double>(hands) * 3.0) : 1.0;
}

} // namespace

void RiskOfRuinConfig::validate() const {
    if (bankroll_units.empty()) {
        throw std::invalid_argument("bankroll_units must not be empty");
    }
    if (std::any_of(bankroll_units.begin(), bankroll_units.end(), [](int u) { return u <= 0; })) {
        throw std::invalid_argument("All bankroll units must be positive integers");
    }
    if (simulations_per_level <= 0 || max_sessions_per_simulation <= 0) {
        throw std::invalid_argument("simulation counts must be positive");
    }
    if (!(confidence_level > 0.0 && confidence_level < 1.0)) {
        throw std::invalid_argument("confidence_level must be between 0 and 1 (exclusive), got " +
                                    std::to_string(confidence_level));
    }
    if (base_bet && *base_bet <= 0.0) {
        throw std::invalid_argument("base_bet must be positive");
    }
}

double analytical_ruin_probability(double mean_profit, double std_profit, double bankroll) {
    if (std_profit == 0.0) return mean_profit > 0.0 ? 0.0 : 1.0;
    if (mean_profit <= 0.0) return 1.0;

    const double exponent = -2.0 * mean_profit * bankroll / (std_profit * std_profit);
    if (exponent < -700.0) return 0.0;
    return std::exp(exponent);
}

RiskOfRuinReport calculate_risk_of_ruin(std::span<const SessionResult> results, const RiskOfRuinConfig& config) {
    if (results.empty()) {
        throw std::invalid_argument("session results must not be empty");
    }
    if (results.size() < MIN_SESSIONS) {
        throw std::invalid_argument("At least 10 session results required for reliable risk estimation");
    }
    config.validate();

    RiskOfRuinReport report;
    report.base_bet = config.base_bet ? *config.base_bet : infer_base_bet(results);
    if (report.base_bet <= 0.0) {
        throw std::invalid_argument("base_bet must be positive");
    }
    report.starting_bankroll = results.front().starting_bankroll;

    std::vector<double> profits;
    profits.reserve(results.size());
    for (const auto& r : results) profits.push_back(r.session_profit);

    const DistributionStats profit_stats = calculate_distribution_stats(profits, {});
    report.mean_session_profit = profit_stats.mean;
    report.session_profit_std = profit_stats.std_dev;

    std::vector<int> levels = config.bankroll_units;
    std::sort(levels.begin(), levels.end());

    for (size_t i = 0; i < levels.size(); ++i) {
        const int units = levels[i];
        const double bankroll = report.base_bet * units;

        // Flux indépendant par niveau
        std::mt19937_64 rng(derive_unit_seed(config.random_seed, i));
        const RuinCounts counts = run_ruin_simulations(profits, bankroll, config, rng);

        RiskOfRuinResult level;
        level.bankroll_units = units;
        level.sessions_simulated = config.simulations_per_level;
        const double sims = static_cast<double>(config.simulations_per_level);
        level.ruin_probability = counts.ruins / sims;
        level.half_bankroll_risk = counts.half_losses / sims;
        level.quarter_bankroll_risk = counts.quarter_losses / sims;
        level.confidence_interval =
            wilson_confidence_interval(counts.ruins, config.simulations_per_level, config.confidence_level);
        report.results.push_back(level);

        if (config.include_analytical) {
            report.analytical_estimates.push_back(
                analytical_ruin_probability(report.mean_session_profit, report.session_profit_std, bankroll));
        }

        spdlog::debug("Ruine à {} unités ({:.2f}) : {:.4f} sur {} trajectoires", units, bankroll,
                      level.ruin_probability, level.sessions_simulated);
    }
    return report;
}

std::string format_risk_of_ruin_report(const RiskOfRuinReport& report) {
    std::string out;
    auto it = std::back_inserter(out);
    fmt::format_to(it, "Risk of Ruin Analysis\n{}\n", std::string(50, '='));
    fmt::format_to(it, "Base Bet: ${:.2f}\n", report.base_bet);
    fmt::format_to(it, "Starting Bankroll: ${:.2f}\n", report.starting_bankroll);
    fmt::format_to(it, "Mean Session Profit: ${:.2f}\n", report.mean_session_profit);
    fmt::format_to(it, "Session Profit Std Dev: ${:.2f}\n", report.session_profit_std);
    fmt::format_to(it, "\nRisk by Bankroll Level:\n{}\n", std::string(50, '-'));

    for (size_t i = 0; i < report.results.size(); ++i) {
        const RiskOfRuinResult& r = report.results[i];
        fmt::format_to(it, "\nBankroll: {} units (${:.2f})\n", r.bankroll_units, report.base_bet * r.bankroll_units);
        fmt::format_to(it, "  Ruin Probability: {:.2f}% ({:.0f}% CI: {:.2f}% - {:.2f}%)\n",
                       r.ruin_probability * 100.0, r.confidence_interval.level * 100.0,
                       r.confidence_interval.lower * 100.0, r.confidence_interval.upper * 100.0);
        fmt::format_to(it, "  50% Loss Risk: {:.2f}%\n", r.half_bankroll_risk * 100.0);
        fmt::format_to(it, "  25% Loss Risk: {:.2f}%\n", r.quarter_bankroll_risk * 100.0);
        fmt::format_to(it, "  Simulations: {}\n", r.sessions_simulated);
        if (i < report.analytical_estimates.size()) {
            fmt::format_to(it, "  Analytical Estimate: {:.2f}%\n", report.analytical_estimates[i] * 100.0);
        }
    }
    return out;
}

} // namespace lir
