#ifndef LIR_TABLE_SESSION_H
#define LIR_TABLE_SESSION_H

#include "lir/session.h"
#include "lir/table.h"
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace lir {

// Paramètres par siège (SessionConfig) + mode de remplacement de siège
struct TableSessionConfig {
    SessionConfig session;
    std::optional<int> table_total_rounds; // Défini : mode remplacement de siège

    void validate() const;
};

struct SeatSessionResult {
    int seat_number = 0;   // 1-based
    SessionResult session_result;

    bool operator==(const SeatSessionResult&) const = default;
};

/**
 * @brief Bilan d'une table.
 * seat_results : une session par siège (la dernière en mode remplacement).
 * seat_sessions : toutes les sessions par siège, vide hors mode remplacement.
 */
struct TableSessionResult {
    std::vector<SeatSessionResult> seat_results;
    int total_rounds = 0;
    StopReason stop_reason = StopReason::IN_PROGRESS;
    std::map<int, std::vector<SeatSessionResult>> seat_sessions;
};

using RoundCallback = std::function<void(const TableRoundResult& round)>;

/**
 * @brief Session multi-joueurs sur une Table, en pas synchronisé.
 *
 * Chaque tour distribue tous les sièges. Un siège arrêté ne mise plus mais
 * reste assis : son hands_played suit l'horloge de la table. La table
 * s'arrête quand tous les sièges sont arrêtés ; en mode remplacement, un
 * siège arrêté enregistre sa session et repart avec une bankroll neuve,
 * jusqu'à table_total_rounds tours.
 * La mise de base et la mise bonus du tour sont fixées sur le premier siège actif.
 */
class TableSession {
public:
    TableSession(TableSessionConfig config,
                 Table& table,
                 BettingSystem& betting_system,
                 std::shared_ptr<const BonusStrategy> bonus_strategy = nullptr);

    bool should_stop();

    // std::logic_error si la table est déjà terminée
    TableRoundResult play_round();

    TableSessionResult run_to_completion();

    void set_round_callback(RoundCallback callback) { round_callback_ = std::move(callback); }

    int get_rounds_played() const { return rounds_played_; }
    bool is_complete() const { return stop_reason_.has_value(); }
    bool seat_replacement_mode() const { return config_.table_total_rounds.has_value(); }
    std::optional<StopReason> get_stop_reason() const { return stop_reason_; }

private:
    struct SeatState {
        explicit SeatState(double starting_bankroll, int start_round = 0)
            : bankroll(starting_bankroll), session_start_round(start_round) {}

        BankrollTracker bankroll;
        double total_wagered = 0.0;
        double total_bonus_wagered = 0.0;
        std::optional<double> last_result;
        int streak = 0;
        int bonus_streak = 0;
        std::optional<StopReason> stop_reason;
        int session_start_round = 0;
        std::vector<SeatSessionResult> completed_sessions;
    };

    int hands_this_session(const SeatState& seat) const { return rounds_played_ - seat.session_start_round; }
    SeatSessionResult build_seat_result(int seat_idx, StopReason reason) const;
    void check_seat_stop_condition(int seat_idx);
    void reset_seat(SeatState& seat);

    TableSessionResult build_classic_result() const;
    TableSessionResult build_seat_replacement_result() const;

    TableSessionConfig config_;
    Table& table_;
    BettingSystem& betting_system_;
    std::shared_ptr<const BonusStrategy> bonus_strategy_;
    RoundCallback round_callback_;

    std::vector<SeatState> seats_;
    int rounds_played_ = 0;
    std::optional<StopReason> stop_reason_;
};

} // namespace lir

#endif // LIR_TABLE_SESSION_H
