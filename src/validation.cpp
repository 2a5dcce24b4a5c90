#include "lir/validation.h"
#include "spdlog/spdlog.h"
#include "spdlog/fmt/fmt.h"
#include <cmath>
#include <stdexcept>

namespace lir {

namespace {

constexpr double TOTAL_FIVE_CARD_HANDS = 2598960.0;
constexpr double EXTREME_WIN_RATE_LOW = 0.1;
constexpr double EXTREME_WIN_RATE_HIGH = 0.9;

long long total_count(const std::map<std::string, int>& frequencies) {
    long long total = 0;
    for (const auto& [name, count] : frequencies) total += count;
    return total;
}

} // namespace

const std::map<std::string, double>& theoretical_hand_probabilities() {
    static const std::map<std::string, double> probabilities = {
        {"royal_flush", 4 / TOTAL_FIVE_CARD_HANDS},
        {"straight_flush", 36 / TOTAL_FIVE_CARD_HANDS},
        {"four_of_a_kind", 624 / TOTAL_FIVE_CARD_HANDS},
        {"full_house", 3744 / TOTAL_FIVE_CARD_HANDS},
        {"flush", 5108 / TOTAL_FIVE_CARD_HANDS},
        {"straight", 10200 / TOTAL_FIVE_CARD_HANDS},
        {"three_of_a_kind", 54912 / TOTAL_FIVE_CARD_HANDS},
        {"two_pair", 123552 / TOTAL_FIVE_CARD_HANDS},
        {"pair", 1098240 / TOTAL_FIVE_CARD_HANDS},
        {"high_card", 1302540 / TOTAL_FIVE_CARD_HANDS}
    };
    return probabilities;
}

std::map<std::string, int> normalize_hand_frequencies(const std::map<std::string, int>& frequencies) {
    std::map<std::string, int> normalized = frequencies;
    int pairs = 0;
    for (const char* name : {"pair_tens_or_better", "pair_below_tens"}) {
        auto it = normalized.find(name);
        if (it == normalized.end()) continue;
        pairs += it->second;
        normalized.erase(it);
    }
    if (pairs > 0) normalized["pair"] += pairs;
    return normalized;
}

ChiSquareResult calculate_chi_square(const std::map<std::string, int>& observed, double significance_level) {
    if (observed.empty()) {
        throw std::invalid_argument("Cannot perform chi-square test with empty frequencies");
    }
    const long long total = total_count(observed);
    if (total == 0) {
        throw std::invalid_argument("Cannot perform chi-square test with zero total observations");
    }

    std::vector<double> observed_counts;
    std::vector<double> expected_counts;
    for (const auto& [name, prob] : theoretical_hand_probabilities()) {
        const auto it = observed.find(name);
        observed_counts.push_back(it == observed.end() ? 0.0 : static_cast<double>(it->second));
        expected_counts.push_back(prob * static_cast<double>(total));
    }

    const auto [statistic, p_value] = pearson_chi_square(observed_counts, expected_counts);

    ChiSquareResult result;
    result.statistic = statistic;
    result.p_value = p_value;
    result.degrees_of_freedom = static_cast<int>(observed_counts.size()) - 1;
    result.is_valid = p_value > significance_level;
    return result;
}

ValidationReport validate_simulation(const AggregateStatistics& stats, double significance_level, double base_bet) {
    ValidationReport report;
    const std::map<std::string, int> normalized = normalize_hand_frequencies(stats.hand_frequencies);
    const long long total_hands = total_count(normalized);

    bool severe = false;
    if (total_hands > 0) {
        report.chi_square = calculate_chi_square(normalized, significance_level);
        if (report.chi_square.p_value < WARNING_CHI_SQUARE_P) {
            report.warnings.push_back(fmt::format(
                "Chi-square p-value ({:.6f}) is very low, suggesting non-random distribution",
                report.chi_square.p_value));
            severe = true;
        }
    } else {
        report.warnings.emplace_back("No hand frequency data available for chi-square test");
    }

    for (const auto& [name, prob] : theoretical_hand_probabilities()) {
        report.expected_frequencies[name] = prob;
        const auto it = normalized.find(name);
        report.observed_frequencies[name] =
            total_hands > 0 && it != normalized.end() ? static_cast<double>(it->second) / total_hands : 0.0;
    }

    report.ev_theoretical = -THEORETICAL_HOUSE_EDGE * base_bet;
    report.ev_actual = stats.expected_value_per_hand;
    if (std::fabs(report.ev_theoretical) > 1e-10) {
        report.ev_deviation_pct = std::fabs((report.ev_actual - report.ev_theoretical) / report.ev_theoretical);
    } else {
        report.ev_deviation_pct = std::fabs(report.ev_actual) > 1e-10 ? std::fabs(report.ev_actual) : 0.0;
    }
    if (report.ev_deviation_pct > WARNING_EV_DEVIATION) {
        report.warnings.push_back(fmt::format("EV deviation ({:.1f}%) exceeds threshold ({:.1f}%)",
                                              report.ev_deviation_pct * 100.0, WARNING_EV_DEVIATION * 100.0));
    }

    report.session_win_rate = stats.session_win_rate;
    if (stats.total_sessions > 0) {
        report.session_win_rate_ci = wilson_confidence_interval(stats.winning_sessions, stats.total_sessions);
        if (stats.session_win_rate < EXTREME_WIN_RATE_LOW || stats.session_win_rate > EXTREME_WIN_RATE_HIGH) {
            report.warnings.push_back(fmt::format("Session win rate ({:.1f}%) is unusually extreme",
                                                  stats.session_win_rate * 100.0));
            severe = true;
        }
    }

    report.is_valid = report.chi_square.is_valid && !severe;
    for (const auto& warning : report.warnings) spdlog::warn("Validation : {}", warning);
    return report;
}

} // namespace lir
