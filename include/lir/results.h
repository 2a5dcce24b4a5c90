#ifndef LIR_RESULTS_H
#define LIR_RESULTS_H

#include "lir/game_engine.h"
#include <map>
#include <optional>
#include <span>
#include <string>

namespace lir {

/**
 * @brief Enregistrement sérialisable d'une main.
 *
 * Encodage texte stable : cartes "Ah Kd Qs", décisions "ride" / "pull",
 * rangs en minuscules ("flush", "mini_royal").
 */
struct HandRecord {
    int hand_id = 0;
    int session_id = 0;
    std::string cards_player;
    std::string cards_community;
    std::string decision_bet1;
    std::string decision_bet2;
    std::string final_hand_rank;
    double base_bet = 0.0;
    double bets_at_risk = 0.0;
    double main_payout = 0.0;
    double bonus_bet = 0.0;
    std::optional<std::string> bonus_hand_rank;
    double bonus_payout = 0.0;
    double bankroll_after = 0.0;

    static HandRecord from_game_result(const GameHandResult& result, int session_id, double bankroll_after);

    bool operator==(const HandRecord&) const = default;
};

// Nombre de mains par rang final (nom en minuscules) ; seuls les rangs observés apparaissent
std::map<std::string, int> count_hand_distribution(std::span<const HandRecord> records);
std::map<std::string, int> count_hand_distribution(std::span<const GameHandResult> results);

} // namespace lir

#endif // LIR_RESULTS_H
