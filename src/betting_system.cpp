#include "lir/betting_system.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>

namespace lir {

namespace {

// Jamais plus que la bankroll, 0 si elle est épuisée
double cap_to_bankroll(double bet, const BettingContext& context) {
    if (context.bankroll <= 0.0) return 0.0;
    return std::min(bet, context.bankroll);
}

} // namespace

// --- FlatBetting ---

FlatBetting::FlatBetting(double base_bet)
    : base_bet_(base_bet)
{
    if (base_bet <= 0.0) {
        throw std::invalid_argument("FlatBetting: base_bet must be positive");
    }
}

double FlatBetting::get_bet(const BettingContext& context) {
    return cap_to_bankroll(base_bet_, context);
}

// --- MartingaleBetting ---

MartingaleBetting::MartingaleBetting(double base_bet, double loss_multiplier, double max_bet,
                                     int max_progressions, bool reset_on_win)
    : base_bet_(base_bet),
      loss_multiplier_(loss_multiplier),
      max_bet_(max_bet),
      max_progressions_(max_progressions),
      reset_on_win_(reset_on_win),
      current_bet_(base_bet)
{
    if (base_bet <= 0.0) throw std::invalid_argument("MartingaleBetting: base_bet must be positive");
    if (loss_multiplier <= 1.0) throw std::invalid_argument("MartingaleBetting: loss_multiplier must be greater than 1");
    if (max_bet <= 0.0) throw std::invalid_argument("MartingaleBetting: max_bet must be positive");
    if (max_progressions < 1) throw std::invalid_argument("MartingaleBetting: max_progressions must be at least 1");
}

double MartingaleBetting::get_bet(const BettingContext& context) {
    return cap_to_bankroll(std::min(current_bet_, max_bet_), context);
}

void MartingaleBetting::record_result(double result) {
    if (result < 0.0) {
        if (progressions_ < max_progressions_) {
            current_bet_ *= loss_multiplier_;
            ++progressions_;
        } else {
            // Progression épuisée : on repart de la base
            current_bet_ = base_bet_;
            progressions_ = 0;
        }
    } else if (result > 0.0 && reset_on_win_) {
        current_bet_ = base_bet_;
        progressions_ = 0;
    }
}

void MartingaleBetting::reset() {
    current_bet_ = base_bet_;
    progressions_ = 0;
}

// --- DAlembertBetting ---

DAlembertBetting::DAlembertBetting(double base_bet, double unit, double decrease_unit,
                                   double min_bet, double max_bet)
    : base_bet_(base_bet),
      unit_(unit),
      decrease_unit_(decrease_unit),
      min_bet_(min_bet),
      max_bet_(max_bet),
      current_bet_(base_bet)
{
    if (base_bet <= 0.0) throw std::invalid_argument("DAlembertBetting: base_bet must be positive");
    if (unit <= 0.0 || decrease_unit <= 0.0) throw std::invalid_argument("DAlembertBetting: units must be positive");
    if (min_bet <= 0.0 || min_bet > max_bet) throw std::invalid_argument("DAlembertBetting: min_bet cannot exceed max_bet");
}

double DAlembertBetting::get_bet(const BettingContext& context) {
    return cap_to_bankroll(std::clamp(current_bet_, min_bet_, max_bet_), context);
}

void DAlembertBetting::record_result(double result) {
    if (result < 0.0) {
        current_bet_ = std::min(current_bet_ + unit_, max_bet_);
    } else if (result > 0.0) {
        current_bet_ = std::max(current_bet_ - decrease_unit_, min_bet_);
    }
}

void DAlembertBetting::reset() {
    current_bet_ = base_bet_;
}

std::unique_ptr<BettingSystem> create_betting_system(const BettingSystemConfig& config, double base_bet) {
    if (config.type == "flat") {
        return std::make_unique<FlatBetting>(base_bet);
    }
    if (config.type == "martingale") {
        return std::make_unique<MartingaleBetting>(base_bet, config.loss_multiplier, config.max_bet,
                                                   config.max_progressions, config.reset_on_win);
    }
    if (config.type == "dalembert") {
        return std::make_unique<DAlembertBetting>(base_bet, config.unit, config.decrease_unit,
                                                  config.min_bet, config.max_bet);
    }
    spdlog::error("Système de mise inconnu : {}", config.type);
    throw std::invalid_argument("Unknown betting system: '" + config.type + "'");
}

} // namespace lir
