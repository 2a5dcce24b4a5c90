#ifndef LIR_SESSION_H
#define LIR_SESSION_H

#include "lir/bankroll_tracker.h"
#include "lir/betting_system.h"
#include "lir/bonus_strategy.h"
#include "lir/common_types.h"
#include "lir/game_engine.h"
#include <functional>
#include <memory>
#include <optional>

namespace lir {

/**
 * @brief Paramètres d'une session : bankroll, mises et conditions d'arrêt.
 *
 * bonus_bet est la mise bonus fixe ; avec une BonusStrategy elle reste la
 * mise réservée pour le contrôle de fonds insuffisants, et les bornes
 * min_bonus_bet / max_bonus_bet encadrent la mise choisie par la stratégie.
 */
struct SessionConfig {
    double starting_bankroll = 0.0;
    double base_bet = 0.0;
    std::optional<double> win_limit;
    std::optional<double> loss_limit;   // Valeur positive : perte maximale tolérée
    std::optional<int> max_hands;
    bool stop_on_insufficient_funds = true;
    double bonus_bet = 0.0;
    double min_bonus_bet = 1.0;
    double max_bonus_bet = 25.0;

    // Lève std::invalid_argument au premier champ incohérent
    void validate() const;

    // Mise totale d'une main : 3 cercles + bonus
    double minimum_bet_required() const { return base_bet * 3.0 + bonus_bet; }
};

// Bilan d'une session terminée
struct SessionResult {
    SessionOutcome outcome = SessionOutcome::PUSH;
    StopReason stop_reason = StopReason::IN_PROGRESS;
    int hands_played = 0;
    double starting_bankroll = 0.0;
    double final_bankroll = 0.0;
    double session_profit = 0.0;
    double total_wagered = 0.0;
    double total_bonus_wagered = 0.0;
    double peak_bankroll = 0.0;
    double max_drawdown = 0.0;
    double max_drawdown_pct = 0.0;

    bool operator==(const SessionResult&) const = default;
};

// Série en cours : >0 victoires consécutives, <0 défaites, inchangée sur un push
int calculate_new_streak(int current_streak, double result);

SessionOutcome outcome_from_profit(double profit);

// Première condition d'arrêt atteinte, dans l'ordre win, loss, max_hands, fonds.
// Une bankroll nulle ou négative arrête toujours la session (INSUFFICIENT_FUNDS).
std::optional<StopReason> check_stop_conditions(const SessionConfig& config,
                                                const BankrollTracker& bankroll,
                                                int hands_played);

// Pour Session et TableSession : figer l'état d'une bankroll dans un SessionResult
SessionResult make_session_result(const BankrollTracker& bankroll,
                                  StopReason stop_reason,
                                  int hands_played,
                                  double total_wagered,
                                  double total_bonus_wagered);

// Mise bonus de la prochaine main : bonus_bet fixe, ou choix de la stratégie bonus si fournie
double next_bonus_bet(const SessionConfig& config,
                      const BonusStrategy* bonus_strategy,
                      const BankrollTracker& bankroll,
                      int hands_played,
                      int main_streak,
                      int bonus_streak,
                      double base_bet);

using HandCallback = std::function<void(int hand_id, const GameHandResult& result)>;

/**
 * @brief Boucle séquentielle d'une session sur un GameEngine.
 *
 * Ordre de contrôle d'arrêt : win_limit, loss_limit, max_hands, fonds
 * insuffisants. Une seule raison est retenue.
 * Le moteur et le système de mise appartiennent à l'appelant et doivent
 * survivre à la session ; le système de mise est réinitialisé à la construction.
 */
class Session {
public:
    Session(SessionConfig config,
            GameEngine& engine,
            BettingSystem& betting_system,
            std::shared_ptr<const BonusStrategy> bonus_strategy = nullptr);

    bool should_stop();

    // Joue une main ; std::logic_error si la session est déjà terminée
    GameHandResult play_hand();

    SessionResult run_to_completion();

    void set_hand_callback(HandCallback callback) { hand_callback_ = std::move(callback); }

    bool is_complete() const { return stop_reason_.has_value(); }
    std::optional<StopReason> get_stop_reason() const { return stop_reason_; }
    int get_hands_played() const { return hands_played_; }
    int get_streak() const { return streak_; }
    double get_total_wagered() const { return total_wagered_; }
    double get_total_bonus_wagered() const { return total_bonus_wagered_; }
    const BankrollTracker& get_bankroll() const { return bankroll_; }
    const SessionConfig& get_config() const { return config_; }

    SessionResult get_result() const;

private:
    SessionConfig config_;
    GameEngine& engine_;
    BettingSystem& betting_system_;
    std::shared_ptr<const BonusStrategy> bonus_strategy_;
    HandCallback hand_callback_;

    BankrollTracker bankroll_;
    int hands_played_ = 0;
    int streak_ = 0;
    int bonus_streak_ = 0;
    std::optional<double> last_result_;
    double total_wagered_ = 0.0;
    double total_bonus_wagered_ = 0.0;
    std::optional<StopReason> stop_reason_;
};

} // namespace lir

#endif // LIR_SESSION_H
