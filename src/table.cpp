#include "lir/table.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace lir {

Table::Table(std::shared_ptr<const Strategy> strategy,
             const MainPaytable& main_paytable,
             const BonusPaytable* bonus_paytable,
             std::mt19937_64& rng,
             int num_seats,
             DealerConfig dealer_config)
    : strategy_(std::move(strategy)),
      main_paytable_(main_paytable),
      bonus_paytable_(bonus_paytable),
      rng_(rng),
      num_seats_(num_seats),
      dealer_config_(dealer_config),
      deck_preparer_([](Deck& deck, std::mt19937_64& stream) { deck.shuffle(stream); })
{
    if (!strategy_) {
        throw std::invalid_argument("Table requires a strategy");
    }
    if (num_seats < MIN_SEATS || num_seats > MAX_SEATS) {
        throw std::invalid_argument("num_seats must be between 1 and 6, got " + std::to_string(num_seats));
    }
    validate_dealer_config(dealer_config_);
    seat_cards_.resize(num_seats_);
}

TableRoundResult Table::play_round(int round_id, double base_bet, double bonus_bet, const StrategyContext& context) {
    validate_bets(base_bet, bonus_bet, bonus_paytable_);

    last_discarded_cards_.clear();
    deck_.reset();
    deck_preparer_(deck_, rng_);

    // Les joueurs reçoivent leurs cartes avant toute défausse
    for (auto& cards : seat_cards_) {
        deck_.deal_into(cards);
    }

    if (dealer_config_.discard_enabled) {
        auto discarded = deck_.deal(dealer_config_.discard_cards);
        last_discarded_cards_.assign(discarded.begin(), discarded.end());
    }

    TableRoundResult round;
    round.round_id = round_id;
    deck_.deal_into(round.community_cards);
    round.dealer_discards = last_discarded_cards_;

    round.seat_results.reserve(num_seats_);
    for (int seat = 0; seat < num_seats_; ++seat) {
        SeatHandResult seat_result;
        seat_result.seat_number = seat + 1;
        seat_result.hand = settle_hand(round_id, seat_cards_[seat], round.community_cards, base_bet, bonus_bet,
                                       context, *strategy_, main_paytable_, bonus_paytable_);
        round.seat_results.push_back(std::move(seat_result));
    }

    if (spdlog::default_logger_raw()->should_log(spdlog::level::trace)) {
        spdlog::trace("Tour {} : {} sièges, communes {}", round_id, num_seats_, cards_to_string(round.community_cards));
    }
    return round;
}

} // namespace lir
