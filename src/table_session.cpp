#include "lir/table_session.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace lir {

void TableSessionConfig::validate() const {
    session.validate();
    if (table_total_rounds && *table_total_rounds <= 0) {
        throw std::invalid_argument("table_total_rounds must be positive if set");
    }
}

TableSession::TableSession(TableSessionConfig config,
                           Table& table,
                           BettingSystem& betting_system,
                           std::shared_ptr<const BonusStrategy> bonus_strategy)
    : config_(std::move(config)),
      table_(table),
      betting_system_(betting_system),
      bonus_strategy_(std::move(bonus_strategy))
{
    config_.validate();
    seats_.reserve(table_.get_num_seats());
    for (int i = 0; i < table_.get_num_seats(); ++i) {
        seats_.emplace_back(config_.session.starting_bankroll);
    }
    betting_system_.reset();
}

SeatSessionResult TableSession::build_seat_result(int seat_idx, StopReason reason) const {
    const SeatState& seat = seats_[seat_idx];
    SeatSessionResult result;
    result.seat_number = seat_idx + 1;
    result.session_result = make_session_result(seat.bankroll, reason, hands_this_session(seat),
                                                seat.total_wagered, seat.total_bonus_wagered);
    return result;
}

void TableSession::reset_seat(SeatState& seat) {
    std::vector<SeatSessionResult> history = std::move(seat.completed_sessions);
    seat = SeatState(config_.session.starting_bankroll, rounds_played_);
    seat.completed_sessions = std::move(history);
}

void TableSession::check_seat_stop_condition(int seat_idx) {
    SeatState& seat = seats_[seat_idx];
    if (seat.stop_reason) {
        return;
    }

    const auto reason = check_stop_conditions(config_.session, seat.bankroll, hands_this_session(seat));
    if (!reason) {
        return;
    }

    if (seat_replacement_mode()) {
        // Nouveau joueur au même siège
        seat.completed_sessions.push_back(build_seat_result(seat_idx, *reason));
        reset_seat(seat);
        spdlog::debug("Siège {} remplacé au tour {} ({})", seat_idx + 1, rounds_played_, stop_reason_to_string(*reason));
    } else {
        seat.stop_reason = reason;
        spdlog::debug("Siège {} arrêté au tour {} ({})", seat_idx + 1, rounds_played_, stop_reason_to_string(*reason));
    }
}

bool TableSession::should_stop() {
    if (stop_reason_) {
        return true;
    }

    if (seat_replacement_mode()) {
        if (rounds_played_ >= *config_.table_total_rounds) {
            stop_reason_ = StopReason::TABLE_ROUNDS_COMPLETE;
            spdlog::debug("Table terminée après {} tours", rounds_played_);
            return true;
        }
        return false;
    }

    for (int i = 0; i < static_cast<int>(seats_.size()); ++i) {
        check_seat_stop_condition(i);
    }
    const bool all_stopped = std::all_of(seats_.begin(), seats_.end(),
                                         [](const SeatState& s) { return s.stop_reason.has_value(); });
    if (all_stopped) {
        // Raison de la table : celle du dernier siège
        stop_reason_ = seats_.back().stop_reason;
        spdlog::debug("Table terminée après {} tours : {}", rounds_played_, stop_reason_to_string(*stop_reason_));
        return true;
    }
    return false;
}

TableRoundResult TableSession::play_round() {
    if (stop_reason_) {
        throw std::logic_error("Cannot play round: table session is already complete");
    }

    if (seat_replacement_mode()) {
        for (int i = 0; i < static_cast<int>(seats_.size()); ++i) {
            check_seat_stop_condition(i);
        }
    }

    auto active = std::find_if(seats_.begin(), seats_.end(),
                               [](const SeatState& s) { return !s.stop_reason.has_value(); });
    const SeatState& lead = active != seats_.end() ? *active : seats_.front();
    const int lead_idx = static_cast<int>(&lead - seats_.data());

    BettingContext betting_ctx;
    betting_ctx.bankroll = lead.bankroll.get_balance();
    betting_ctx.starting_bankroll = config_.session.starting_bankroll;
    betting_ctx.session_profit = lead.bankroll.get_session_profit();
    betting_ctx.last_result = lead.last_result;
    betting_ctx.streak = lead.streak;
    betting_ctx.hands_played = rounds_played_;
    const double base_bet = betting_system_.get_bet(betting_ctx);
    const double bonus_bet = next_bonus_bet(config_.session, bonus_strategy_.get(), lead.bankroll, rounds_played_,
                                            lead.streak, lead.bonus_streak, base_bet);

    StrategyContext strategy_ctx;
    strategy_ctx.session_profit = lead.bankroll.get_session_profit();
    strategy_ctx.hands_played = rounds_played_;
    strategy_ctx.streak = lead.streak;
    strategy_ctx.bankroll = lead.bankroll.get_balance();

    TableRoundResult round = table_.play_round(rounds_played_, base_bet, bonus_bet, strategy_ctx);

    for (const SeatHandResult& seat_result : round.seat_results) {
        SeatState& seat = seats_[seat_result.seat_number - 1];
        // Siège arrêté : cartes distribuées, aucune mise
        if (seat.stop_reason) {
            continue;
        }
        const GameHandResult& hand = seat_result.hand;
        seat.total_wagered += hand.bets_at_risk;
        seat.total_bonus_wagered += bonus_bet;
        seat.bankroll.apply_result(hand.net_result);
        seat.last_result = hand.net_result;
        seat.streak = calculate_new_streak(seat.streak, hand.net_result);
        if (bonus_bet > 0.0) {
            seat.bonus_streak = calculate_new_streak(seat.bonus_streak,
                                                     hand.bonus_payout > 0.0 ? hand.bonus_payout : -bonus_bet);
        }
    }
    ++rounds_played_;

    betting_system_.record_result(round.seat_results[lead_idx].hand.net_result);

    if (seat_replacement_mode()) {
        for (int i = 0; i < static_cast<int>(seats_.size()); ++i) {
            check_seat_stop_condition(i);
        }
    }

    if (round_callback_) {
        round_callback_(round);
    }
    return round;
}

TableSessionResult TableSession::run_to_completion() {
    while (!should_stop()) {
        play_round();
    }
    return seat_replacement_mode() ? build_seat_replacement_result() : build_classic_result();
}

TableSessionResult TableSession::build_classic_result() const {
    TableSessionResult result;
    result.total_rounds = rounds_played_;
    result.stop_reason = stop_reason_.value_or(StopReason::IN_PROGRESS);
    result.seat_results.reserve(seats_.size());
    for (int i = 0; i < static_cast<int>(seats_.size()); ++i) {
        result.seat_results.push_back(build_seat_result(i, seats_[i].stop_reason.value_or(StopReason::IN_PROGRESS)));
    }
    return result;
}

TableSessionResult TableSession::build_seat_replacement_result() const {
    TableSessionResult result;
    result.total_rounds = rounds_played_;
    result.stop_reason = stop_reason_.value_or(StopReason::IN_PROGRESS);
    for (int i = 0; i < static_cast<int>(seats_.size()); ++i) {
        std::vector<SeatSessionResult> sessions = seats_[i].completed_sessions;
        // Session en cours, si au moins une main a été jouée
        if (hands_this_session(seats_[i]) > 0) {
            sessions.push_back(build_seat_result(i, StopReason::IN_PROGRESS));
        }
        if (!sessions.empty()) {
            result.seat_results.push_back(sessions.back());
        }
        result.seat_sessions.emplace(i + 1, std::move(sessions));
    }
    return result;
}

} // namespace lir
