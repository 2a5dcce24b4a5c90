#include "lir/results.h"

namespace lir {

HandRecord HandRecord::from_game_result(const GameHandResult& result, int session_id, double bankroll_after) {
    HandRecord record;
    record.hand_id = result.hand_id;
    record.session_id = session_id;
    record.cards_player = cards_to_string(result.player_cards);
    record.cards_community = cards_to_string(result.community_cards);
    record.decision_bet1 = decision_to_string(result.decision_bet1);
    record.decision_bet2 = decision_to_string(result.decision_bet2);
    record.final_hand_rank = to_string(result.final_hand_rank);
    record.base_bet = result.base_bet;
    record.bets_at_risk = result.bets_at_risk;
    record.main_payout = result.main_payout;
    record.bonus_bet = result.bonus_bet;
    if (result.bonus_hand_rank) {
        record.bonus_hand_rank = to_string(*result.bonus_hand_rank);
    }
    record.bonus_payout = result.bonus_payout;
    record.bankroll_after = bankroll_after;
    return record;
}

std::map<std::string, int> count_hand_distribution(std::span<const HandRecord> records) {
    std::map<std::string, int> distribution;
    for (const auto& record : records) {
        ++distribution[record.final_hand_rank];
    }
    return distribution;
}

std::map<std::string, int> count_hand_distribution(std::span<const GameHandResult> results) {
    std::map<std::string, int> distribution;
    for (const auto& result : results) {
        ++distribution[to_string(result.final_hand_rank)];
    }
    return distribution;
}

} // namespace lir
