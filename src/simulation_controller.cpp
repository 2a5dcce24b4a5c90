#include "lir/simulation_controller.h"
#include "lir/paytable.h"
#include "lir/table.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <atomic>
#include <mutex>
#include <thread>
#include <utility>

namespace lir {

namespace {

SimulationConfig validated(SimulationConfig config) {
    config.validate();
    return config;
}

bool bonus_enabled(const SimulationConfig& config) {
    return config.bonus.type != "never";
}

} // namespace

void SimulationConfig::validate() const {
    if (num_sessions < 1) {
        throw std::invalid_argument("num_sessions must be at least 1, got " + std::to_string(num_sessions));
    }
    if (hands_per_session && *hands_per_session <= 0) {
        throw std::invalid_argument("hands_per_session must be positive if set");
    }
    if (workers < 0) {
        throw std::invalid_argument("workers cannot be negative (0 = hardware concurrency)");
    }
    if (num_seats < MIN_SEATS || num_seats > MAX_SEATS) {
        throw std::invalid_argument("num_seats must be between 1 and 6, got " + std::to_string(num_seats));
    }
    if (table_total_rounds && *table_total_rounds <= 0) {
        throw std::invalid_argument("table_total_rounds must be positive if set");
    }
    if (progressive_payout < 0) {
        throw std::invalid_argument("progressive_payout cannot be negative");
    }
    validate_dealer_config(dealer);
    make_session_config().validate();
}

SessionConfig SimulationConfig::make_session_config() const {
    SessionConfig session;
    session.starting_bankroll = starting_bankroll;
    session.base_bet = base_bet;
    session.win_limit = win_limit;
    session.loss_limit = loss_limit;
    session.max_hands = hands_per_session;
    session.stop_on_insufficient_funds = stop_on_insufficient_funds;
    session.min_bonus_bet = bonus.min_bonus_bet;
    session.max_bonus_bet = bonus.max_bonus_bet;

    // Mise bonus réservée pour le contrôle de fonds : montant fixe quand il est connu
    if (bonus.type == "always" || (bonus.type == "static" && !bonus.ratio)) {
        session.bonus_bet = bonus.amount;
    } else if (bonus.type == "static") {
        session.bonus_bet = base_bet * *bonus.ratio;
    }
    return session;
}

uint64_t derive_unit_seed(uint64_t global_seed, uint64_t unit_index) {
    uint64_t z = global_seed + 0x9E3779B97F4A7C15ULL * (unit_index + 1);
    z = (z ^ (z >> 30)) * 0xBF58476D1CE4E5B9ULL;
    z = (z ^ (z >> 27)) * 0x94D049BB133111EBULL;
    return z ^ (z >> 31);
}

AggregateStatistics SimulationResults::aggregate() const {
    if (hand_distribution.empty()) {
        return aggregate_results(session_results);
    }
    return aggregate_with_hand_frequencies(session_results, hand_distribution);
}

SimulationController::SimulationController(SimulationConfig config, ProgressCallback progress_callback)
    : config_(validated(std::move(config))),
      progress_callback_(std::move(progress_callback)),
      main_paytable_(main_paytable_by_name(config_.main_paytable)),
      strategy_(create_strategy(config_.strategy))
{
    if (bonus_enabled(config_)) {
        bonus_paytable_.emplace(bonus_paytable_by_name(config_.bonus_paytable, config_.progressive_payout));
        bonus_strategy_ = create_bonus_strategy(config_.bonus);
    }
}

int SimulationController::resolved_worker_count() const {
    if (config_.workers > 0) {
        return config_.workers;
    }
    return static_cast<int>(std::max(1u, std::thread::hardware_concurrency()));
}

SimulationController::UnitOutput SimulationController::run_single_seat_unit(std::mt19937_64& rng) const {
    UnitOutput out;
    const BonusPaytable* bonus_paytable = bonus_paytable_ ? &*bonus_paytable_ : nullptr;

    GameEngine engine(strategy_, main_paytable_, bonus_paytable, rng, config_.dealer);
    auto betting_system = create_betting_system(config_.betting_system, config_.base_bet);
    Session session(config_.make_session_config(), engine, *betting_system, bonus_strategy_);

    if (config_.track_hand_distribution) {
        session.set_hand_callback([&out](int, const GameHandResult& hand) {
            ++out.hand_distribution[to_string(hand.final_hand_rank)];
        });
    }
    out.sessions.push_back(session.run_to_completion());
    return out;
}

SimulationController::UnitOutput SimulationController::run_table_unit(std::mt19937_64& rng) const {
    UnitOutput out;
    const BonusPaytable* bonus_paytable = bonus_paytable_ ? &*bonus_paytable_ : nullptr;

    Table table(strategy_, main_paytable_, bonus_paytable, rng, config_.num_seats, config_.dealer);
    auto betting_system = create_betting_system(config_.betting_system, config_.base_bet);
    TableSessionConfig table_config;
    table_config.session = config_.make_session_config();
    table_config.table_total_rounds = config_.table_total_rounds;
    TableSession table_session(table_config, table, *betting_system, bonus_strategy_);

    if (config_.track_hand_distribution) {
        table_session.set_round_callback([&out](const TableRoundResult& round) {
            for (const auto& seat : round.seat_results) {
                ++out.hand_distribution[to_string(seat.hand.final_hand_rank)];
            }
        });
    }

    TableSessionResult result = table_session.run_to_completion();

    // Sièges à plat, dans l'ordre des sièges
    if (result.seat_sessions.empty()) {
        for (const auto& seat : result.seat_results) {
            out.sessions.push_back(seat.session_result);
        }
    } else {
        for (const auto& [seat_number, sessions] : result.seat_sessions) {
            for (const auto& seat : sessions) {
                out.sessions.push_back(seat.session_result);
            }
        }
    }
    out.table = std::move(result);
    return out;
}

SimulationController::UnitOutput SimulationController::run_unit(int unit_index) const {
    std::mt19937_64 rng(derive_unit_seed(config_.random_seed, static_cast<uint64_t>(unit_index)));
    return config_.table_mode() ? run_table_unit(rng) : run_single_seat_unit(rng);
}

SimulationResults SimulationController::run() {
    SimulationResults results;
    results.start_time = std::chrono::system_clock::now();

    const int total_units = config_.num_sessions;
    const int num_workers = std::min(resolved_worker_count(), total_units);
    spdlog::info("Simulation : {} unités ({}), {} workers, graine {}",
                 total_units, config_.table_mode() ? "table" : "session", num_workers, config_.random_seed);

    std::vector<UnitOutput> outputs(total_units);
    std::atomic<int> next_unit{0};
    std::atomic<int> completed{0};
    std::atomic<int> lowest_failed_unit{total_units};
    std::mutex error_mutex;
    std::optional<SimulationError> first_error;

    // Chaque unité écrit uniquement sa propre case de outputs.
    // Après un échec, seules les unités d'indice inférieur sont encore lancées :
    // l'erreur remontée est celle de la plus petite unité en échec.
    auto worker = [&]() {
        while (true) {
            const int unit = next_unit.fetch_add(1);
            if (unit >= total_units || unit >= lowest_failed_unit.load()) {
                break;
            }
            try {
                outputs[unit] = run_unit(unit);
                const int done = completed.fetch_add(1) + 1;
                if (progress_callback_) {
                    progress_callback_(done, total_units);
                }
            } catch (const std::exception& e) {
                std::lock_guard<std::mutex> lock(error_mutex);
                if (!first_error || unit < first_error->get_unit_index()) {
                    first_error.emplace(unit, e.what());
                    lowest_failed_unit.store(unit);
                }
                break;
            }
        }
    };

    std::vector<std::thread> threads;
    threads.reserve(num_workers);
    for (int i = 0; i < num_workers; ++i) {
        threads.emplace_back(worker);
    }
    for (auto& t : threads) {
        t.join();
    }

    if (first_error) {
        spdlog::error("Lot abandonné : {}", first_error->what());
        throw *first_error;
    }

    for (auto& out : outputs) {
        results.session_results.insert(results.session_results.end(), out.sessions.begin(), out.sessions.end());
        if (out.table) {
            results.table_results.push_back(std::move(*out.table));
        }
        for (const auto& [name, count] : out.hand_distribution) {
            results.hand_distribution[name] += count;
        }
    }
    for (const auto& r : results.session_results) {
        results.total_hands += r.hands_played;
    }

    results.end_time = std::chrono::system_clock::now();
    const auto elapsed = std::chrono::duration<double>(results.end_time - results.start_time).count();
    spdlog::info("Simulation terminée : {} sessions, {} mains en {:.2f} s",
                 results.session_results.size(), results.total_hands, elapsed);
    return results;
}

} // namespace lir
