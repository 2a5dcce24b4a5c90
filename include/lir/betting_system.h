#ifndef LIR_BETTING_SYSTEM_H
#define LIR_BETTING_SYSTEM_H

#include <memory>
#include <optional>
#include <string>

namespace lir {

struct BettingContext {
    double bankroll = 0.0;
    double starting_bankroll = 0.0;
    double session_profit = 0.0;
    std::optional<double> last_result; // Absent avant la première main
    int streak = 0;
    int hands_played = 0;
};

/**
 * @brief Progression de mise : fixe la mise de base de la main suivante.
 * Objet à état, propre à une session (jamais partagé entre workers).
 * La mise rendue ne dépasse jamais la bankroll disponible.
 */
class BettingSystem {
public:
    virtual ~BettingSystem() = default;

    virtual double get_bet(const BettingContext& context) = 0;
    virtual void record_result(double result) = 0;
    virtual void reset() = 0;
    virtual std::string get_name() const = 0;
};

class FlatBetting : public BettingSystem {
public:
    explicit FlatBetting(double base_bet);

    double get_bet(const BettingContext& context) override;
    void record_result(double) override {}
    void reset() override {}
    std::string get_name() const override { return "flat"; }

    double get_base_bet() const { return base_bet_; }

private:
    double base_bet_;
};

// Double (loss_multiplier) après une perte, revient à la base après un gain
class MartingaleBetting : public BettingSystem {
public:
    MartingaleBetting(double base_bet, double loss_multiplier = 2.0, double max_bet = 500.0,
                      int max_progressions = 6, bool reset_on_win = true);

    double get_bet(const BettingContext& context) override;
    void record_result(double result) override;
    void reset() override;
    std::string get_name() const override { return "martingale"; }

private:
    double base_bet_;
    double loss_multiplier_;
    double max_bet_;
    int max_progressions_;
    bool reset_on_win_;
    double current_bet_;
    int progressions_ = 0;
};

// +unit après une perte, -decrease_unit après un gain, borné à [min_bet, max_bet]
class DAlembertBetting : public BettingSystem {
public:
    DAlembertBetting(double base_bet, double unit = 5.0, double decrease_unit = 5.0,
                     double min_bet = 5.0, double max_bet = 500.0);

    double get_bet(const BettingContext& context) override;
    void record_result(double result) override;
    void reset() override;
    std::string get_name() const override { return "dalembert"; }

private:
    double base_bet_;
    double unit_;
    double decrease_unit_;
    double min_bet_;
    double max_bet_;
    double current_bet_;
};

// Sélection : "flat", "martingale", "dalembert"
struct BettingSystemConfig {
    std::string type = "flat";
    double loss_multiplier = 2.0;
    int max_progressions = 6;
    bool reset_on_win = true;
    double unit = 5.0;
    double decrease_unit = 5.0;
    double min_bet = 5.0;
    double max_bet = 500.0;
};

std::unique_ptr<BettingSystem> create_betting_system(const BettingSystemConfig& config, double base_bet);

} // namespace lir

#endif // LIR_BETTING_SYSTEM_H
