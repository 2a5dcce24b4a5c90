#include "lir/session.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace lir {

void SessionConfig::validate() const {
    if (starting_bankroll <= 0.0) {
        throw std::invalid_argument("starting_bankroll must be positive, got " + std::to_string(starting_bankroll));
    }
    if (base_bet <= 0.0) {
        throw std::invalid_argument("base_bet must be positive, got " + std::to_string(base_bet));
    }
    if (win_limit && *win_limit <= 0.0) {
        throw std::invalid_argument("win_limit must be positive if set");
    }
    if (loss_limit && *loss_limit <= 0.0) {
        throw std::invalid_argument("loss_limit must be positive if set");
    }
    if (max_hands && *max_hands <= 0) {
        throw std::invalid_argument("max_hands must be positive if set");
    }
    if (bonus_bet < 0.0) {
        throw std::invalid_argument("bonus_bet cannot be negative");
    }
    if (min_bonus_bet < 0.0 || max_bonus_bet < min_bonus_bet) {
        throw std::invalid_argument("bonus bet bounds must satisfy 0 <= min_bonus_bet <= max_bonus_bet");
    }
    // Sans condition d'arrêt la session ne se termine jamais
    if (!win_limit && !loss_limit && !max_hands && !stop_on_insufficient_funds) {
        throw std::invalid_argument("at least one stop condition must be configured");
    }
    if (starting_bankroll < minimum_bet_required()) {
        throw std::invalid_argument("starting_bankroll (" + std::to_string(starting_bankroll)
                                    + ") must cover the minimum bet (" + std::to_string(minimum_bet_required()) + ")");
    }
}

int calculate_new_streak(int current_streak, double result) {
    if (result > 0.0) {
        return current_streak > 0 ? current_streak + 1 : 1;
    }
    if (result < 0.0) {
        return current_streak < 0 ? current_streak - 1 : -1;
    }
    return current_streak;
}

SessionOutcome outcome_from_profit(double profit) {
    if (profit > 0.0) return SessionOutcome::WIN;
    if (profit < 0.0) return SessionOutcome::LOSS;
    return SessionOutcome::PUSH;
}

std::optional<StopReason> check_stop_conditions(const SessionConfig& config,
                                                const BankrollTracker& bankroll,
                                                int hands_played) {
    const double profit = bankroll.get_session_profit();
    if (config.win_limit && profit >= *config.win_limit) {
        return StopReason::WIN_LIMIT;
    }
    if (config.loss_limit && profit <= -*config.loss_limit) {
        return StopReason::LOSS_LIMIT;
    }
    if (config.max_hands && hands_played >= *config.max_hands) {
        return StopReason::MAX_HANDS;
    }
    if (config.stop_on_insufficient_funds && bankroll.get_balance() < config.minimum_bet_required()) {
        return StopReason::INSUFFICIENT_FUNDS;
    }
    // Bankroll épuisée : aucune mise possible, même sans stop_on_insufficient_funds
    if (bankroll.get_balance() <= 0.0) {
        return StopReason::INSUFFICIENT_FUNDS;
    }
    return std::nullopt;
}

SessionResult make_session_result(const BankrollTracker& bankroll,
                                  StopReason stop_reason,
                                  int hands_played,
                                  double total_wagered,
                                  double total_bonus_wagered) {
    SessionResult result;
    result.session_profit = bankroll.get_session_profit();
    result.outcome = outcome_from_profit(result.session_profit);
    result.stop_reason = stop_reason;
    result.hands_played = hands_played;
    result.starting_bankroll = bankroll.get_starting_balance();
    result.final_bankroll = bankroll.get_balance();
    result.total_wagered = total_wagered;
    result.total_bonus_wagered = total_bonus_wagered;
    result.peak_bankroll = bankroll.get_peak_balance();
    result.max_drawdown = bankroll.get_max_drawdown();
    result.max_drawdown_pct = bankroll.get_max_drawdown_pct();
    return result;
}

double next_bonus_bet(const SessionConfig& config,
                      const BonusStrategy* bonus_strategy,
                      const BankrollTracker& bankroll,
                      int hands_played,
                      int main_streak,
                      int bonus_streak,
                      double base_bet) {
    if (bonus_strategy == nullptr) {
        return config.bonus_bet;
    }
    BonusContext ctx;
    ctx.bankroll = bankroll.get_balance();
    ctx.starting_bankroll = config.starting_bankroll;
    ctx.session_profit = bankroll.get_session_profit();
    ctx.hands_played = hands_played;
    ctx.main_streak = main_streak;
    ctx.bonus_streak = bonus_streak;
    ctx.base_bet = base_bet;
    ctx.min_bonus_bet = config.min_bonus_bet;
    ctx.max_bonus_bet = config.max_bonus_bet;
    return bonus_strategy->get_bonus_bet(ctx);
}

Session::Session(SessionConfig config,
                 GameEngine& engine,
                 BettingSystem& betting_system,
                 std::shared_ptr<const BonusStrategy> bonus_strategy)
    : config_(std::move(config)),
      engine_(engine),
      betting_system_(betting_system),
      bonus_strategy_(std::move(bonus_strategy)),
      bankroll_(config_.starting_bankroll)
{
    config_.validate();
    betting_system_.reset();
}

bool Session::should_stop() {
    if (stop_reason_) {
        return true;
    }

    stop_reason_ = check_stop_conditions(config_, bankroll_, hands_played_);
    if (stop_reason_) {
        spdlog::debug("Session terminée après {} mains : {} (profit {})",
                      hands_played_, stop_reason_to_string(*stop_reason_), bankroll_.get_session_profit());
        return true;
    }
    return false;
}

GameHandResult Session::play_hand() {
    if (stop_reason_) {
        throw std::logic_error("Cannot play hand: session is already complete ("
                               + std::string(stop_reason_to_string(*stop_reason_)) + ")");
    }

    BettingContext betting_ctx;
    betting_ctx.bankroll = bankroll_.get_balance();
    betting_ctx.starting_bankroll = config_.starting_bankroll;
    betting_ctx.session_profit = bankroll_.get_session_profit();
    betting_ctx.last_result = last_result_;
    betting_ctx.streak = streak_;
    betting_ctx.hands_played = hands_played_;
    const double base_bet = betting_system_.get_bet(betting_ctx);
    const double bonus_bet = next_bonus_bet(config_, bonus_strategy_.get(), bankroll_, hands_played_,
                                            streak_, bonus_streak_, base_bet);

    StrategyContext strategy_ctx;
    strategy_ctx.session_profit = bankroll_.get_session_profit();
    strategy_ctx.hands_played = hands_played_;
    strategy_ctx.streak = streak_;
    strategy_ctx.bankroll = bankroll_.get_balance();

    const int hand_id = hands_played_;
    GameHandResult result = engine_.play_hand(hand_id, base_bet, bonus_bet, strategy_ctx);

    total_wagered_ += result.bets_at_risk;
    total_bonus_wagered_ += bonus_bet;
    bankroll_.apply_result(result.net_result);
    last_result_ = result.net_result;
    streak_ = calculate_new_streak(streak_, result.net_result);
    if (bonus_bet > 0.0) {
        bonus_streak_ = calculate_new_streak(bonus_streak_, result.bonus_payout > 0.0 ? result.bonus_payout : -bonus_bet);
    }
    ++hands_played_;

    betting_system_.record_result(result.net_result);

    if (hand_callback_) {
        hand_callback_(hand_id, result);
    }
    return result;
}

SessionResult Session::run_to_completion() {
    while (!should_stop()) {
        play_hand();
    }
    return get_result();
}

SessionResult Session::get_result() const {
    return make_session_result(bankroll_, stop_reason_.value_or(StopReason::IN_PROGRESS),
                               hands_played_, total_wagered_, total_bonus_wagered_);
}

} // namespace lir
