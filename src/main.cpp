#include "lir/simulation_controller.h"
#include "lir/aggregation.h"
#include "lir/chair_position.h"
#include "lir/risk_of_ruin.h"
#include "lir/statistics.h"
#include "lir/validation.h"
#include "spdlog/spdlog.h"

#include <iostream>   // std::cerr
#include <string>     // std::string
#include <exception>  // std::exception
#include <chrono>     // std::chrono::duration
#include <mutex>      // std::mutex

namespace {

void log_summary(const std::string& label, const lir::SimulationResults& results)
{
    const lir::AggregateStatistics stats = results.aggregate();
    const double seconds = std::chrono::duration<double>(results.end_time - results.start_time).count();

    spdlog::info("[{}] {} sessions, {} mains ({:.0f} mains/s)", label, stats.total_sessions, stats.total_hands,
                 seconds > 0.0 ? static_cast<double>(stats.total_hands) / seconds : 0.0);
    spdlog::info("[{}] Sessions gagnantes : {} / perdantes : {} / nulles : {} (taux {:.1f} %)", label,
                 stats.winning_sessions, stats.losing_sessions, stats.push_sessions, stats.session_win_rate * 100.0);
    spdlog::info("[{}] Misé {:.2f}, net {:.2f}, EV par main {:.4f}", label,
                 stats.total_wagered, stats.net_result, stats.expected_value_per_hand);
    spdlog::info("[{}] Profit de session : moyenne {:.2f}, écart-type {:.2f}, médiane {:.2f}, min {:.2f}, max {:.2f}",
                 label, stats.session_profit_mean, stats.session_profit_std, stats.session_profit_median,
                 stats.session_profit_min, stats.session_profit_max);

    for (const auto& [rank, pct] : stats.hand_frequency_pct)
        spdlog::debug("[{}]   {:<20} {:6.3f} %", label, rank, pct);

    const lir::DetailedStatistics detailed = lir::calculate_statistics(stats, results.session_results);
    spdlog::info("[{}] Taux de gain IC 95 % [{:.3f}, {:.3f}], EV par main IC 95 % [{:.4f}, {:.4f}]", label,
                 detailed.session_win_rate_ci.lower, detailed.session_win_rate_ci.upper,
                 detailed.ev_per_hand_ci.lower, detailed.ev_per_hand_ci.upper);
    spdlog::info("[{}] Asymétrie {:.3f}, kurtosis {:.3f}, P(perte) {:.3f}, P(ruine) {:.3f}, drawdown moyen {:.2f}",
                 label, detailed.session_profit_distribution.skewness, detailed.session_profit_distribution.kurtosis,
                 detailed.risk_metrics.prob_any_loss, detailed.risk_metrics.prob_loss_100pct,
                 detailed.risk_metrics.max_drawdown_mean);
}

// Fréquences de mains contre la théorie
void log_validation(const std::string& label, const lir::SimulationResults& results, double base_bet)
{
    const lir::ValidationReport report = lir::validate_simulation(results.aggregate(), 0.05, base_bet);
    spdlog::info("[{}] Khi-deux {:.2f} ({} ddl, p = {:.4f}), écart d'EV {:.1f} % : {}", label,
                 report.chi_square.statistic, report.chi_square.degrees_of_freedom, report.chi_square.p_value,
                 report.ev_deviation_pct * 100.0, report.is_valid ? "valide" : "suspect");
}

void log_chair_positions(const std::string& label, const lir::SimulationResults& results)
{
    const lir::ChairPositionAnalysis analysis = lir::analyze_chair_positions(results.table_results);
    for (const auto& seat : analysis.seat_statistics)
        spdlog::info("[{}] Siège {} : {} sessions, gain {:.1f} % [{:.1f}, {:.1f}], EV {:.2f}", label,
                     seat.seat_number, seat.total_rounds, seat.win_rate * 100.0, seat.win_rate_ci_lower * 100.0,
                     seat.win_rate_ci_upper * 100.0, seat.expected_value);
    spdlog::info("[{}] Indépendance de la position : p = {:.4f} ({})", label, analysis.chi_square_p_value,
                 analysis.is_position_independent ? "oui" : "non");
}

} // namespace

int main(int /*argc*/, char* /*argv*/[])
{
    // ─────────────────────────────────────────────────────────────
    // Logging
    // ─────────────────────────────────────────────────────────────
    spdlog::set_level(spdlog::level::info);
    spdlog::info("Démarrage du simulateur Let It Ride…");

    // ─────────────────────────────────────────────────────────────
    // Paramètres généraux
    // ─────────────────────────────────────────────────────────────
    const int      num_sessions      = 1000;
    const int      hands_per_session = 200;
    const uint64_t random_seed       = 42;
    const double   starting_bankroll = 500.0;
    const double   base_bet          = 5.0;
    const double   win_limit         = 250.0;
    const double   loss_limit        = 200.0;

    try
    {
        // 1. Joueur seul, stratégie de base, bonus fixe sur la table B
        lir::SimulationConfig config;
        config.num_sessions = num_sessions;
        config.hands_per_session = hands_per_session;
        config.random_seed = random_seed;
        config.starting_bankroll = starting_bankroll;
        config.base_bet = base_bet;
        config.win_limit = win_limit;
        config.loss_limit = loss_limit;
        config.strategy.type = "basic";
        config.bonus.type = "always";
        config.bonus.amount = 1.0;
        config.bonus_paytable = "paytable_b";
        config.track_hand_distribution = true;

        std::mutex progress_mutex;
        int last_reported = 0;
        lir::SimulationController controller(config, [&](int done, int total) {
            // Appelé depuis les workers : affichage indicatif uniquement
            std::lock_guard<std::mutex> lock(progress_mutex);
            if (done * 10 / total > last_reported) {
                last_reported = done * 10 / total;
                spdlog::debug("Progression : {}/{}", done, total);
            }
        });
        const lir::SimulationResults basic_results = controller.run();
        log_summary("basic", basic_results);
        log_validation("basic", basic_results, base_bet);

        // Risque de ruine rééchantillonné depuis les sessions jouées
        lir::RiskOfRuinConfig ruin_config;
        ruin_config.base_bet = base_bet;
        ruin_config.simulations_per_level = 2000;
        ruin_config.max_sessions_per_simulation = 2000;
        ruin_config.random_seed = random_seed;
        spdlog::info("\n{}", lir::format_risk_of_ruin_report(
                                   lir::calculate_risk_of_ruin(basic_results.session_results, ruin_config)));

        // 2. Table de 6 sièges, stratégie prudente, défausse du croupier
        lir::SimulationConfig table_config = config;
        table_config.num_sessions = num_sessions / 10;
        table_config.num_seats = 6;
        table_config.strategy.type = "conservative";
        table_config.dealer.discard_enabled = true;
        table_config.dealer.discard_cards = 3;
        table_config.track_hand_distribution = false;

        lir::SimulationController table_controller(table_config);
        const lir::SimulationResults table_results = table_controller.run();
        log_summary("table x6", table_results);
        log_chair_positions("table x6", table_results);
        spdlog::info("Tours joués par la première table : {}",
                     table_results.table_results.empty() ? 0 : table_results.table_results.front().total_rounds);

        // 3. Martingale sur le même flux aléatoire
        lir::SimulationConfig martingale_config = config;
        martingale_config.betting_system.type = "martingale";
        martingale_config.bonus.type = "never";
        martingale_config.track_hand_distribution = false;

        lir::SimulationController martingale_controller(martingale_config);
        log_summary("martingale", martingale_controller.run());
    }
    catch (const std::exception& e)
    {
        spdlog::critical("Erreur critique : {}", e.what());
        std::cerr << "Erreur critique : " << e.what() << '\n';
        return 1;
    }

    spdlog::info("Exécution terminée.");
    return 0;
}
