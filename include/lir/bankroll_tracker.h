#ifndef LIR_BANKROLL_TRACKER_H
#define LIR_BANKROLL_TRACKER_H

#include <vector>

namespace lir {

/**
 * @brief Solde courant, plus haut historique et drawdown maximal.
 *
 * Le pic ne fait que croître ; max_drawdown = max dans le temps de (pic - solde).
 * Le pourcentage de drawdown se rapporte au pic en vigueur au moment du drawdown
 * maximal, pas au pic historique.
 * L'historique (solde après chaque opération) est désactivé par défaut.
 */
class BankrollTracker {
public:
    explicit BankrollTracker(double starting_amount, bool record_history = false);

    void apply_result(double amount);

    double get_balance() const { return balance_; }
    double get_starting_balance() const { return starting_; }
    double get_session_profit() const { return balance_ - starting_; }
    double get_peak_balance() const { return peak_; }
    double get_max_drawdown() const { return max_drawdown_; }
    double get_max_drawdown_pct() const;
    double get_current_drawdown() const;
    const std::vector<double>& get_history() const { return history_; }

private:
    double starting_;
    double balance_;
    double peak_;
    double max_drawdown_ = 0.0;
    double peak_at_max_drawdown_;
    bool record_history_;
    std::vector<double> history_;
};

} // namespace lir

#endif // LIR_BANKROLL_TRACKER_H
