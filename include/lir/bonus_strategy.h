#ifndef LIR_BONUS_STRATEGY_H
#define LIR_BONUS_STRATEGY_H

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lir {

// État de session consulté pour fixer la mise bonus
struct BonusContext {
    double bankroll = 0.0;
    double starting_bankroll = 0.0;
    double session_profit = 0.0;
    int hands_played = 0;
    int main_streak = 0;
    int bonus_streak = 0;
    double base_bet = 0.0;
    double min_bonus_bet = 0.0;
    double max_bonus_bet = 0.0;
};

// Politique de mise bonus. 0 = pas de pari bonus pour cette main.
class BonusStrategy {
public:
    virtual ~BonusStrategy() = default;
    virtual double get_bonus_bet(const BonusContext& context) const = 0;
};

// Sous le minimum de table -> 0 ; au-dessus du maximum -> plafonné
double clamp_bonus_bet(double bet, const BonusContext& context);

class NeverBonusStrategy : public BonusStrategy {
public:
    double get_bonus_bet(const BonusContext&) const override { return 0.0; }
};

class AlwaysBonusStrategy : public BonusStrategy {
public:
    explicit AlwaysBonusStrategy(double amount);
    double get_bonus_bet(const BonusContext& context) const override;

private:
    double amount_;
};

// Montant fixe ou fraction de la mise de base (exactement l'un des deux)
class StaticBonusStrategy : public BonusStrategy {
public:
    static StaticBonusStrategy with_amount(double amount);
    static StaticBonusStrategy with_ratio(double ratio);

    double get_bonus_bet(const BonusContext& context) const override;

private:
    StaticBonusStrategy(std::optional<double> amount, std::optional<double> ratio);

    std::optional<double> amount_;
    std::optional<double> ratio_;
};

// Palier de profit : [min_profit, max_profit) -> bet_amount
struct BonusTier {
    double min_profit = 0.0;
    std::optional<double> max_profit;
    double bet_amount = 0.0;
};

/**
 * @brief Mise bonus conditionnée par l'état de la bankroll.
 *
 * Pas de mise si le profit est sous min_session_profit, si le ratio
 * bankroll / départ est sous min_bankroll_ratio, ou si la baisse depuis
 * le départ dépasse max_drawdown (fraction 0-1). Sinon base_amount,
 * remplacé par le palier correspondant, puis par profit_percentage × profit
 * quand la session est gagnante.
 */
struct BankrollConditionalParams {
    double base_amount = 0.0;
    std::optional<double> min_session_profit;
    std::optional<double> min_bankroll_ratio;
    std::optional<double> profit_percentage;
    std::optional<double> max_drawdown;
    std::vector<BonusTier> scaling_tiers;
};

class BankrollConditionalBonusStrategy : public BonusStrategy {
public:
    explicit BankrollConditionalBonusStrategy(BankrollConditionalParams params);
    double get_bonus_bet(const BonusContext& context) const override;

private:
    BankrollConditionalParams params_;
};

// Sélection : "never", "always", "static", "bankroll_conditional"
struct BonusBetConfig {
    std::string type = "never";
    double amount = 0.0;                  // always / static (montant)
    std::optional<double> ratio;          // static (fraction de la mise de base)
    double min_bonus_bet = 1.0;
    double max_bonus_bet = 25.0;
    BankrollConditionalParams conditional;
};

std::shared_ptr<const BonusStrategy> create_bonus_strategy(const BonusBetConfig& config);

} // namespace lir

#endif // LIR_BONUS_STRATEGY_H
