#include "lir/chair_position.h"
#include "lir/statistics.h"
#include <map>
#include <stdexcept>

namespace lir {

namespace {

void record_session(SeatStatistics& seat, const SessionResult& session) {
    switch (session.outcome) {
        case SessionOutcome::WIN: ++seat.wins; break;
        case SessionOutcome::LOSS: ++seat.losses; break;
        case SessionOutcome::PUSH: ++seat.pushes; break;
    }
    ++seat.total_rounds;
    seat.total_profit += session.session_profit;
}

void test_seat_independence(ChairPositionAnalysis& analysis, double significance_level) {
    const auto& seats = analysis.seat_statistics;
    if (seats.size() < 2) return;

    std::vector<double> observed;
    double total_wins = 0.0;
    for (const auto& s : seats) {
        observed.push_back(s.wins);
        total_wins += s.wins;
    }
    if (total_wins == 0.0) return;

    const std::vector<double> expected(seats.size(), total_wins / static_cast<double>(seats.size()));
    const auto [statistic, p_value] = pearson_chi_square(observed, expected);
    analysis.chi_square_statistic = statistic;
    analysis.chi_square_p_value = p_value;
    analysis.is_position_independent = p_value > significance_level;
}

} // namespace

ChairPositionAnalysis analyze_chair_positions(std::span<const TableSessionResult> results,
                                              double confidence_level,
                                              double significance_level) {
    if (results.empty()) {
        throw std::invalid_argument("Cannot analyze empty results list");
    }

    std::map<int, SeatStatistics> seats;
    for (const auto& table : results) {
        if (!table.seat_sessions.empty()) {
            for (const auto& [seat_number, sessions] : table.seat_sessions) {
                for (const auto& seat_session : sessions) {
                    record_session(seats[seat_number], seat_session.session_result);
                }
            }
        } else {
            for (const auto& seat_result : table.seat_results) {
                record_session(seats[seat_result.seat_number], seat_result.session_result);
            }
        }
    }
    if (seats.empty()) {
        throw std::invalid_argument("No seat data found in results");
    }

    ChairPositionAnalysis analysis;
    for (auto& [seat_number, seat] : seats) {
        seat.seat_number = seat_number;
        if (seat.total_rounds > 0) {
            seat.win_rate = static_cast<double>(seat.wins) / seat.total_rounds;
            const ConfidenceInterval ci = wilson_confidence_interval(seat.wins, seat.total_rounds, confidence_level);
            seat.win_rate_ci_lower = ci.lower;
            seat.win_rate_ci_upper = ci.upper;
            seat.expected_value = seat.total_profit / seat.total_rounds;
        }
        analysis.seat_statistics.push_back(seat);
    }

    test_seat_independence(analysis, significance_level);
    return analysis;
}

} // namespace lir
