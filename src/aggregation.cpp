#include "lir/aggregation.h"
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace lir {

namespace {

std::map<std::string, double> frequency_percentages(const std::map<std::string, int>& frequencies) {
    std::map<std::string, double> pct;
    long long total = 0;
    for (const auto& [name, count] : frequencies) total += count;
    if (total == 0) return pct;
    for (const auto& [name, count] : frequencies) {
        pct[name] = static_cast<double>(count) / static_cast<double>(total) * 100.0;
    }
    return pct;
}

// Moyenne, écart-type, médiane, min et max des profits de session
void fill_profit_statistics(AggregateStatistics& stats) {
    const auto& profits = stats.session_profits;
    if (profits.empty()) return;

    const double n = static_cast<double>(profits.size());
    stats.session_profit_mean = std::accumulate(profits.begin(), profits.end(), 0.0) / n;

    if (profits.size() > 1) {
        double sq = 0.0;
        for (double p : profits) sq += (p - stats.session_profit_mean) * (p - stats.session_profit_mean);
        stats.session_profit_std = std::sqrt(sq / (n - 1.0));
    } else {
        stats.session_profit_std = 0.0;
    }

    std::vector<double> sorted = profits;
    std::sort(sorted.begin(), sorted.end());
    const size_t mid = sorted.size() / 2;
    stats.session_profit_median = sorted.size() % 2 == 1 ? sorted[mid] : (sorted[mid - 1] + sorted[mid]) / 2.0;
    stats.session_profit_min = sorted.front();
    stats.session_profit_max = sorted.back();
}

void fill_per_hand_ev(AggregateStatistics& stats) {
    const double hands = static_cast<double>(stats.total_hands);
    stats.expected_value_per_hand = stats.total_hands > 0 ? stats.net_result / hands : 0.0;
    stats.main_ev_per_hand = stats.total_hands > 0 ? (stats.main_won - stats.main_wagered) / hands : 0.0;
    stats.bonus_ev_per_hand = stats.total_hands > 0 ? (stats.bonus_won - stats.bonus_wagered) / hands : 0.0;
}

} // namespace

AggregateStatistics aggregate_results(std::span<const SessionResult> results) {
    if (results.empty()) {
        throw std::invalid_argument("Cannot aggregate empty results list");
    }

    AggregateStatistics stats;
    stats.total_sessions = static_cast<int>(results.size());
    stats.session_profits.reserve(results.size());

    for (const auto& r : results) {
        switch (r.outcome) {
            case SessionOutcome::WIN: ++stats.winning_sessions; break;
            case SessionOutcome::LOSS: ++stats.losing_sessions; break;
            case SessionOutcome::PUSH: ++stats.push_sessions; break;
        }
        stats.total_hands += r.hands_played;
        stats.main_wagered += r.total_wagered;
        stats.bonus_wagered += r.total_bonus_wagered;
        stats.net_result += r.session_profit;
        stats.session_profits.push_back(r.session_profit);
    }
    stats.session_win_rate = static_cast<double>(stats.winning_sessions) / stats.total_sessions;

    // net = gagné - misé
    stats.total_wagered = stats.main_wagered + stats.bonus_wagered;
    stats.total_won = stats.net_result + stats.total_wagered;
    stats.bonus_won = stats.bonus_wagered;
    stats.main_won = stats.total_won - stats.bonus_won;

    fill_per_hand_ev(stats);
    fill_profit_statistics(stats);
    return stats;
}

AggregateStatistics aggregate_with_hand_frequencies(std::span<const SessionResult> results,
                                                    const std::map<std::string, int>& hand_frequencies) {
    AggregateStatistics stats = aggregate_results(results);
    stats.hand_frequencies = hand_frequencies;
    stats.hand_frequency_pct = frequency_percentages(hand_frequencies);
    return stats;
}

AggregateStatistics merge_aggregates(const AggregateStatistics& a, const AggregateStatistics& b) {
    AggregateStatistics stats;
    stats.total_sessions = a.total_sessions + b.total_sessions;
    stats.winning_sessions = a.winning_sessions + b.winning_sessions;
    stats.losing_sessions = a.losing_sessions + b.losing_sessions;
    stats.push_sessions = a.push_sessions + b.push_sessions;
    stats.session_win_rate = stats.total_sessions > 0
        ? static_cast<double>(stats.winning_sessions) / stats.total_sessions : 0.0;

    stats.total_hands = a.total_hands + b.total_hands;
    stats.total_wagered = a.total_wagered + b.total_wagered;
    stats.total_won = a.total_won + b.total_won;
    stats.net_result = a.net_result + b.net_result;
    stats.main_wagered = a.main_wagered + b.main_wagered;
    stats.main_won = a.main_won + b.main_won;
    stats.bonus_wagered = a.bonus_wagered + b.bonus_wagered;
    stats.bonus_won = a.bonus_won + b.bonus_won;
    fill_per_hand_ev(stats);

    stats.hand_frequencies = a.hand_frequencies;
    for (const auto& [name, count] : b.hand_frequencies) {
        stats.hand_frequencies[name] += count;
    }
    stats.hand_frequency_pct = frequency_percentages(stats.hand_frequencies);

    stats.session_profits = a.session_profits;
    stats.session_profits.insert(stats.session_profits.end(), b.session_profits.begin(), b.session_profits.end());
    fill_profit_statistics(stats);
    return stats;
}

} // namespace lir
