#include "lir/game_engine.h"
#include "lir/hand_analysis.h"
#include "spdlog/spdlog.h"
#include <stdexcept>
#include <string>
#include <utility>

namespace lir {

namespace {

// Composition des cartes invisibles pour le joueur : 4 par rang moins les cartes vues
RankCounts unseen_rank_counts(std::span<const Card> visible) {
    RankCounts counts{};
    for (int v = 2; v <= 14; ++v) counts[v] = NUM_SUITS;
    for (const Card& c : visible) --counts[rank_value(c.rank)];
    return counts;
}

} // namespace

void validate_bets(double base_bet, double bonus_bet, const BonusPaytable* bonus_paytable) {
    if (base_bet <= 0.0) {
        throw std::invalid_argument("base_bet must be positive, got " + std::to_string(base_bet));
    }
    if (bonus_bet < 0.0) {
        throw std::invalid_argument("bonus_bet cannot be negative, got " + std::to_string(bonus_bet));
    }
    if (bonus_bet > 0.0 && bonus_paytable == nullptr) {
        throw std::invalid_argument("bonus_bet > 0 requires a bonus paytable to be configured");
    }
}

void validate_dealer_config(const DealerConfig& config) {
    if (config.discard_enabled && config.discard_cards < 1) {
        throw std::invalid_argument("discard_cards must be at least 1 when dealer discard is enabled, got "
                                    + std::to_string(config.discard_cards));
    }
}

GameHandResult settle_hand(int hand_id,
                           const std::array<Card, 3>& player_cards,
                           const std::array<Card, 2>& community_cards,
                           double base_bet,
                           double bonus_bet,
                           StrategyContext context,
                           const Strategy& strategy,
                           const MainPaytable& main_paytable,
                           const BonusPaytable* bonus_paytable) {
    GameHandResult result;
    result.hand_id = hand_id;
    result.player_cards = player_cards;
    result.community_cards = community_cards;
    result.base_bet = base_bet;
    result.bonus_bet = bonus_bet;

    const bool wants_composition = strategy.uses_deck_composition();

    // DECIDE_BET1 : les 3 cartes du joueur uniquement
    if (wants_composition) context.unseen_ranks = unseen_rank_counts(player_cards);
    result.decision_bet1 = strategy.decide_bet1(analyze_three_cards(player_cards), context);

    // DECIDE_BET2 : + première carte commune
    const std::array<Card, 4> four_cards{player_cards[0], player_cards[1], player_cards[2], community_cards[0]};
    if (wants_composition) context.unseen_ranks = unseen_rank_counts(four_cards);
    result.decision_bet2 = strategy.decide_bet2(analyze_four_cards(four_cards), context);

    // EVALUATE
    const std::array<Card, 5> final_cards{player_cards[0], player_cards[1], player_cards[2],
                                          community_cards[0], community_cards[1]};
    result.final_hand_rank = evaluate_five_card_hand(final_cards).rank;

    const int active_circles = 1
        + (result.decision_bet1 == Decision::RIDE ? 1 : 0)
        + (result.decision_bet2 == Decision::RIDE ? 1 : 0);
    result.bets_at_risk = base_bet * active_circles;

    // SETTLE_BONUS : indépendant des décisions du jeu principal
    if (bonus_bet > 0.0 && bonus_paytable != nullptr) {
        result.bonus_hand_rank = evaluate_three_card_hand(player_cards);
        result.bonus_payout = bonus_paytable->payout(*result.bonus_hand_rank, bonus_bet);
    }

    // SETTLE_MAIN
    result.main_payout = main_paytable.payout(result.final_hand_rank, result.bets_at_risk);

    const double main_net = result.main_payout > 0.0 ? result.main_payout : -result.bets_at_risk;
    const double bonus_net = result.bonus_payout > 0.0 ? result.bonus_payout : -bonus_bet;
    result.net_result = main_net + bonus_net;

    if (spdlog::default_logger_raw()->should_log(spdlog::level::trace)) {
        spdlog::trace("Main {} : {} | {} -> {} ({} / {}), net {}", hand_id,
                      cards_to_string(player_cards), cards_to_string(community_cards),
                      to_string(result.final_hand_rank),
                      decision_to_string(result.decision_bet1), decision_to_string(result.decision_bet2),
                      result.net_result);
    }
    return result;
}

GameEngine::GameEngine(std::shared_ptr<const Strategy> strategy,
                       const MainPaytable& main_paytable,
                       const BonusPaytable* bonus_paytable,
                       std::mt19937_64& rng,
                       DealerConfig dealer_config)
    : strategy_(std::move(strategy)),
      main_paytable_(main_paytable),
      bonus_paytable_(bonus_paytable),
      rng_(rng),
      dealer_config_(dealer_config),
      deck_preparer_([](Deck& deck, std::mt19937_64& stream) { deck.shuffle(stream); })
{
    if (!strategy_) {
        throw std::invalid_argument("GameEngine requires a strategy");
    }
    validate_dealer_config(dealer_config_);
}

GameHandResult GameEngine::play_hand(int hand_id, double base_bet, double bonus_bet, const StrategyContext& context) {
    validate_bets(base_bet, bonus_bet, bonus_paytable_);

    // RESET_DECK -> SHUFFLE : paquet complet re-mélangé à chaque main
    last_discarded_cards_.clear();
    deck_.reset();
    deck_preparer_(deck_, rng_);

    // DEAL_PLAYER(3)
    std::array<Card, 3> player_cards;
    deck_.deal_into(player_cards);

    // DEALER_DISCARD(k)
    if (dealer_config_.discard_enabled) {
        auto discarded = deck_.deal(dealer_config_.discard_cards);
        last_discarded_cards_.assign(discarded.begin(), discarded.end());
    }

    // DEAL_COMMUNITY(2)
    std::array<Card, 2> community_cards;
    deck_.deal_into(community_cards);

    return settle_hand(hand_id, player_cards, community_cards, base_bet, bonus_bet, context,
                       *strategy_, main_paytable_, bonus_paytable_);
}

} // namespace lir
