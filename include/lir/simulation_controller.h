#ifndef LIR_SIMULATION_CONTROLLER_H
#define LIR_SIMULATION_CONTROLLER_H

#include "lir/aggregation.h"
#include "lir/betting_system.h"
#include "lir/bonus_strategy.h"
#include "lir/game_engine.h"
#include "lir/session.h"
#include "lir/strategy.h"
#include "lir/table_session.h"
#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace lir {

/**
 * @brief Configuration complète d'un lot de simulation (déjà chargée et validée
 * par l'appelant ; validate() revérifie les invariants).
 */
struct SimulationConfig {
    // Lot
    int num_sessions = 1;
    std::optional<int> hands_per_session = 100;
    uint64_t random_seed = 42;
    int workers = 0;                       // 0 : std::thread::hardware_concurrency()

    // Bankroll et arrêts
    double starting_bankroll = 500.0;
    double base_bet = 5.0;
    std::optional<double> win_limit;
    std::optional<double> loss_limit;
    bool stop_on_insufficient_funds = true;
    BettingSystemConfig betting_system;

    // Jeu
    StrategyConfig strategy;
    std::string main_paytable = "standard";
    BonusBetConfig bonus;
    std::string bonus_paytable = "paytable_b";
    int progressive_payout = 1000;         // paytable_c uniquement
    DealerConfig dealer;

    // Table : plusieurs sièges ou remplacement de siège -> unité = TableSession
    int num_seats = 1;
    std::optional<int> table_total_rounds;

    bool track_hand_distribution = false;  // Compte les rangs finaux de chaque main distribuée

    void validate() const;
    bool table_mode() const { return num_seats > 1 || table_total_rounds.has_value(); }
    SessionConfig make_session_config() const;
};

// Échec de la plus petite unité en erreur (indépendant de l'ordonnancement) ; le lot est abandonné
class SimulationError : public std::runtime_error {
public:
    SimulationError(int unit_index, const std::string& message)
        : std::runtime_error("Simulation unit " + std::to_string(unit_index) + " failed: " + message),
          unit_index_(unit_index) {}

    int get_unit_index() const { return unit_index_; }

private:
    int unit_index_;
};

// Graine de l'unité i, fonction pure de (global_seed, i) : mélange SplitMix64
uint64_t derive_unit_seed(uint64_t global_seed, uint64_t unit_index);

// Appelé depuis les threads de travail, ordre non garanti
using ProgressCallback = std::function<void(int completed_units, int total_units)>;

struct SimulationResults {
    std::vector<SessionResult> session_results;      // Ordre des unités, sièges à plat en mode table
    std::vector<TableSessionResult> table_results;   // Mode table uniquement
    std::map<std::string, int> hand_distribution;    // Si track_hand_distribution
    std::chrono::system_clock::time_point start_time;
    std::chrono::system_clock::time_point end_time;
    long long total_hands = 0;

    AggregateStatistics aggregate() const;
};

/**
 * @brief Répartit num_sessions unités indépendantes sur un pool de threads.
 *
 * Chaque unité construit son moteur, son paquet, sa bankroll et son système
 * de mise à partir de derive_unit_seed(random_seed, i). Les tables de paiement
 * et les stratégies sont construites une fois et partagées en lecture seule.
 * Les résultats sont rangés par indice d'unité : le résultat ne dépend pas du
 * nombre de threads.
 */
class SimulationController {
public:
    explicit SimulationController(SimulationConfig config, ProgressCallback progress_callback = {});

    SimulationResults run();

    int resolved_worker_count() const;
    const SimulationConfig& get_config() const { return config_; }

private:
    struct UnitOutput {
        std::vector<SessionResult> sessions;
        std::optional<TableSessionResult> table;
        std::map<std::string, int> hand_distribution;
    };

    UnitOutput run_unit(int unit_index) const;
    UnitOutput run_single_seat_unit(std::mt19937_64& rng) const;
    UnitOutput run_table_unit(std::mt19937_64& rng) const;

    SimulationConfig config_;
    ProgressCallback progress_callback_;

    // Partagés entre workers, immuables
    MainPaytable main_paytable_;
    std::optional<BonusPaytable> bonus_paytable_;
    std::shared_ptr<const Strategy> strategy_;
    std::shared_ptr<const BonusStrategy> bonus_strategy_;
};

} // namespace lir

#endif // LIR_SIMULATION_CONTROLLER_H
