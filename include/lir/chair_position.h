#ifndef LIR_CHAIR_POSITION_H
#define LIR_CHAIR_POSITION_H

#include "lir/table_session.h"
#include <span>
#include <vector>

namespace lir {

struct SeatStatistics {
    int seat_number = 0;        // 1-based
    int total_rounds = 0;       // Sessions jouées à ce siège
    int wins = 0;
    int losses = 0;
    int pushes = 0;
    double win_rate = 0.0;
    double win_rate_ci_lower = 0.0;
    double win_rate_ci_upper = 0.0;
    double expected_value = 0.0; // Profit moyen par session
    double total_profit = 0.0;
};

struct ChairPositionAnalysis {
    std::vector<SeatStatistics> seat_statistics;   // Par siège croissant
    double chi_square_statistic = 0.0;
    double chi_square_p_value = 1.0;
    bool is_position_independent = true;
};

/**
 * @brief Résultats par siège et test d'indépendance de la position.
 *
 * Une table en mode remplacement contribue toutes ses sessions par siège
 * (seat_sessions), sinon une session par siège (seat_results). Le test du
 * khi-deux compare les victoires par siège à une répartition uniforme ;
 * sous deux sièges ou sans victoire, la position est réputée indépendante.
 * std::invalid_argument si results est vide ou sans siège.
 */
ChairPositionAnalysis analyze_chair_positions(std::span<const TableSessionResult> results,
                                              double confidence_level = 0.95,
                                              double significance_level = 0.05);

} // namespace lir

#endif // LIR_CHAIR_POSITION_H
