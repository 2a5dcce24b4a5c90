#include "lir/bankroll_tracker.h"
#include <algorithm>
#include <stdexcept>
#include <string>

namespace lir {

BankrollTracker::BankrollTracker(double starting_amount, bool record_history)
    : starting_(starting_amount),
      balance_(starting_amount),
      peak_(starting_amount),
      peak_at_max_drawdown_(starting_amount),
      record_history_(record_history)
{
    if (starting_amount < 0.0) {
        throw std::invalid_argument("Starting amount cannot be negative: " + std::to_string(starting_amount));
    }
}

void BankrollTracker::apply_result(double amount) {
    balance_ += amount;
    if (record_history_) {
        history_.push_back(balance_);
    }
    if (balance_ > peak_) {
        peak_ = balance_;
    }
    const double current_dd = peak_ - balance_;
    if (current_dd > max_drawdown_) {
        max_drawdown_ = current_dd;
        peak_at_max_drawdown_ = peak_;
    }
}

double BankrollTracker::get_max_drawdown_pct() const {
    if (peak_at_max_drawdown_ == 0.0) {
        return 0.0;
    }
    return max_drawdown_ / peak_at_max_drawdown_ * 100.0;
}

double BankrollTracker::get_current_drawdown() const {
    return std::max(0.0, peak_ - balance_);
}

} // namespace lir
