#include <catch2/catch_test_macros.hpp>
#include "lir/table.h"
#include "lir/table_session.h"
#include "lir/paytable.h"
#include "lir/strategy.h"
#include "test_helpers.hpp"
#include <memory>
#include <random>
#include <stdexcept>
#include <vector>

using namespace lir;

namespace {

// Siège 1 : paire d'As ; siège 2 : hauteur Dame ; communes Qc 3s
const char* TWO_SEAT_DEAL = "As Ah Kd 2c 7d 9h Qc 3s";

TableSessionConfig table_config(double bankroll = 500.0) {
    TableSessionConfig config;
    config.session.starting_bankroll = bankroll;
    config.session.base_bet = 5.0;
    config.session.max_hands = 100;
    return config;
}

} // namespace

TEST_CASE("Table Round", "[table]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(9);

    SECTION("Seats are dealt in order and share the community cards") {
        Table table(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng, 2);
        table.set_deck_preparer(test::fixed_deck(TWO_SEAT_DEAL));
        const TableRoundResult round = table.play_round(4, 5.0, 0.0, StrategyContext{});

        REQUIRE(round.round_id == 4);
        REQUIRE(round.seat_results.size() == 2);
        REQUIRE(round.seat_results[0].seat_number == 1);
        REQUIRE(round.seat_results[1].seat_number == 2);
        REQUIRE(round.community_cards[0] == card_from_string("Qc"));
        REQUIRE(round.community_cards[1] == card_from_string("3s"));
        REQUIRE(round.dealer_discards.empty());

        const GameHandResult& seat1 = round.seat_results[0].hand;
        const GameHandResult& seat2 = round.seat_results[1].hand;
        REQUIRE(seat1.player_cards[0] == card_from_string("As"));
        REQUIRE(seat1.final_hand_rank == FiveCardHandRank::PAIR_TENS_OR_BETTER);
        REQUIRE(seat1.net_result == 15.0);
        REQUIRE(seat2.player_cards[0] == card_from_string("2c"));
        REQUIRE(seat2.final_hand_rank == FiveCardHandRank::HIGH_CARD);
        REQUIRE(seat2.net_result == -15.0);
        REQUIRE(seat1.community_cards == seat2.community_cards);
    }

    SECTION("Full table with dealer discard deals distinct cards") {
        Table table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, MAX_SEATS, DealerConfig{true, 3});
        for (int r = 0; r < 20; ++r) {
            const TableRoundResult round = table.play_round(r, 5.0, 0.0, StrategyContext{});
            REQUIRE(round.dealer_discards.size() == 3);
            REQUIRE(table.last_discarded_cards() == round.dealer_discards);

            std::vector<Card> all(round.dealer_discards);
            all.push_back(round.community_cards[0]);
            all.push_back(round.community_cards[1]);
            for (const auto& seat : round.seat_results) {
                all.insert(all.end(), seat.hand.player_cards.begin(), seat.hand.player_cards.end());
            }
            REQUIRE(all.size() == 23);
            REQUIRE(all_distinct(all));
        }
    }

    SECTION("Deck too short for the table") {
        Table table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, MAX_SEATS, DealerConfig{true, 40});
        REQUIRE_THROWS_AS(table.play_round(0, 5.0, 0.0, StrategyContext{}), DeckEmptyError);
    }

    SECTION("Seat count bounds") {
        REQUIRE_THROWS_AS(Table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, 0), std::invalid_argument);
        REQUIRE_THROWS_AS(Table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, 7), std::invalid_argument);
        REQUIRE_THROWS_AS(Table(nullptr, main_table, nullptr, rng, 2), std::invalid_argument);
    }
}

TEST_CASE("Table Session Lockstep", "[table][session]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(21);
    FlatBetting flat(5.0);

    SECTION("All seats play the same number of rounds") {
        Table table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, 6);
        TableSessionConfig config = table_config(1000.0);
        config.session.max_hands = 50;

        TableSession session(config, table, flat);
        int rounds_seen = 0;
        session.set_round_callback([&](const TableRoundResult& round) {
            REQUIRE(round.round_id == rounds_seen);
            REQUIRE(round.seat_results.size() == 6);
            ++rounds_seen;
        });
        const TableSessionResult result = session.run_to_completion();

        REQUIRE(result.total_rounds == 50);
        REQUIRE(rounds_seen == 50);
        REQUIRE(result.stop_reason == StopReason::MAX_HANDS);
        REQUIRE(result.seat_results.size() == 6);
        REQUIRE(result.seat_sessions.empty());
        for (int i = 0; i < 6; ++i) {
            REQUIRE(result.seat_results[i].seat_number == i + 1);
            REQUIRE(result.seat_results[i].session_result.hands_played == result.total_rounds);
            REQUIRE(result.seat_results[i].session_result.stop_reason == StopReason::MAX_HANDS);
        }
    }

    SECTION("Stopped seats stop wagering") {
        Table table(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng, 2);
        table.set_deck_preparer(test::fixed_deck(TWO_SEAT_DEAL));
        TableSessionConfig config = table_config();
        config.session.win_limit = 30.0;
        config.session.loss_limit = 60.0;

        TableSession session(config, table, flat);
        const TableSessionResult result = session.run_to_completion();

        REQUIRE(result.total_rounds == 4);
        // Raison de la table : celle du dernier siège
        REQUIRE(result.stop_reason == StopReason::LOSS_LIMIT);

        const SessionResult& winner = result.seat_results[0].session_result;
        REQUIRE(winner.stop_reason == StopReason::WIN_LIMIT);
        REQUIRE(winner.session_profit == 30.0);
        REQUIRE(winner.total_wagered == 30.0);
        REQUIRE(winner.hands_played == 4);

        const SessionResult& loser = result.seat_results[1].session_result;
        REQUIRE(loser.stop_reason == StopReason::LOSS_LIMIT);
        REQUIRE(loser.session_profit == -60.0);
        REQUIRE(loser.total_wagered == 60.0);
        REQUIRE(loser.hands_played == 4);
    }

    SECTION("A broke seat stops without the funds check") {
        Table table(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng, 2);
        table.set_deck_preparer(test::fixed_deck(TWO_SEAT_DEAL));
        TableSessionConfig config = table_config(35.0);
        config.session.max_hands = 10;
        config.session.stop_on_insufficient_funds = false;

        TableSession session(config, table, flat);
        const TableSessionResult result = session.run_to_completion();

        REQUIRE(result.total_rounds == 10);
        const SessionResult& winner = result.seat_results[0].session_result;
        REQUIRE(winner.stop_reason == StopReason::MAX_HANDS);
        REQUIRE(winner.session_profit == 150.0);

        const SessionResult& broke = result.seat_results[1].session_result;
        REQUIRE(broke.stop_reason == StopReason::INSUFFICIENT_FUNDS);
        REQUIRE(broke.final_bankroll == -10.0);
        REQUIRE(broke.total_wagered == 45.0);
    }

    SECTION("No round after completion") {
        Table table(std::make_shared<BasicStrategy>(), main_table, nullptr, rng, 2);
        TableSessionConfig config = table_config();
        config.session.max_hands = 3;

        TableSession session(config, table, flat);
        session.run_to_completion();
        REQUIRE(session.is_complete());
        REQUIRE(session.get_rounds_played() == 3);
        REQUIRE_FALSE(session.seat_replacement_mode());
        REQUIRE_THROWS_AS(session.play_round(), std::logic_error);
    }
}

TEST_CASE("Table Session Seat Replacement", "[table][session]") {
    const MainPaytable main_table = standard_main_paytable();
    std::mt19937_64 rng(21);
    FlatBetting flat(5.0);

    Table table(std::make_shared<AlwaysRideStrategy>(), main_table, nullptr, rng, 2);
    table.set_deck_preparer(test::fixed_deck(TWO_SEAT_DEAL));
    TableSessionConfig config = table_config();
    config.session.win_limit = 30.0;
    config.session.loss_limit = 30.0;
    config.table_total_rounds = 5;

    TableSession session(config, table, flat);
    REQUIRE(session.seat_replacement_mode());
    const TableSessionResult result = session.run_to_completion();

    REQUIRE(result.total_rounds == 5);
    REQUIRE(result.stop_reason == StopReason::TABLE_ROUNDS_COMPLETE);
    REQUIRE(result.seat_sessions.size() == 2);

    SECTION("Winning seat is replaced every two rounds") {
        const auto& sessions = result.seat_sessions.at(1);
        REQUIRE(sessions.size() == 3);
        REQUIRE(sessions[0].session_result.stop_reason == StopReason::WIN_LIMIT);
        REQUIRE(sessions[0].session_result.hands_played == 2);
        REQUIRE(sessions[0].session_result.starting_bankroll == 500.0);
        REQUIRE(sessions[1].session_result.stop_reason == StopReason::WIN_LIMIT);
        REQUIRE(sessions[1].session_result.final_bankroll == 530.0);
        // Session ouverte à la fin de la table
        REQUIRE(sessions[2].session_result.stop_reason == StopReason::IN_PROGRESS);
        REQUIRE(sessions[2].session_result.hands_played == 1);
        REQUIRE(sessions[2].session_result.session_profit == 15.0);
    }

    SECTION("Losing seat is replaced as well") {
        const auto& sessions = result.seat_sessions.at(2);
        REQUIRE(sessions.size() == 3);
        REQUIRE(sessions[0].session_result.stop_reason == StopReason::LOSS_LIMIT);
        REQUIRE(sessions[0].session_result.session_profit == -30.0);
        REQUIRE(sessions[2].session_result.stop_reason == StopReason::IN_PROGRESS);
    }

    SECTION("Seat results hold the last session of each seat") {
        REQUIRE(result.seat_results.size() == 2);
        REQUIRE(result.seat_results[0] == result.seat_sessions.at(1).back());
        REQUIRE(result.seat_results[1] == result.seat_sessions.at(2).back());
    }
}

TEST_CASE("Table Session Config Validation", "[table][session]") {
    TableSessionConfig config = table_config();
    REQUIRE_NOTHROW(config.validate());
    config.table_total_rounds = 0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    config.table_total_rounds = 10;
    config.session.base_bet = 0.0;
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
}
