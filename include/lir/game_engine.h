#ifndef LIR_GAME_ENGINE_H
#define LIR_GAME_ENGINE_H

#include "lir/common_types.h"
#include "lir/paytable.h"
#include "lir/strategy.h"
#include "core/deck.hpp"
#include "eval/hand_evaluator.hpp"
#include "eval/three_card_evaluator.hpp"
#include <array>
#include <functional>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace lir {

// Défausse optionnelle du croupier, entre la donne des joueurs et les cartes communes
struct DealerConfig {
    bool discard_enabled = false;
    int discard_cards = 3;
};

// Enregistrement immuable d'une main jouée
struct GameHandResult {
    int hand_id = 0;
    std::array<Card, 3> player_cards{};
    std::array<Card, 2> community_cards{};
    Decision decision_bet1 = Decision::PULL;
    Decision decision_bet2 = Decision::PULL;
    FiveCardHandRank final_hand_rank = FiveCardHandRank::HIGH_CARD;
    double base_bet = 0.0;
    double bets_at_risk = 0.0;   // base_bet × cercles non retirés (le 3e est toujours en jeu)
    double main_payout = 0.0;    // Gain du jeu principal, 0 si la main ne paie pas
    double bonus_bet = 0.0;
    std::optional<ThreeCardHandRank> bonus_hand_rank; // Absent sans pari bonus
    double bonus_payout = 0.0;
    double net_result = 0.0;
};

// Vérifie base_bet > 0, bonus_bet >= 0, et qu'une table bonus existe si bonus_bet > 0
void validate_bets(double base_bet, double bonus_bet, const BonusPaytable* bonus_paytable);

/**
 * @brief Décisions, évaluation et règlement d'une main pour des cartes déjà distribuées.
 *
 * Bet 1 est décidé sur les 3 cartes du joueur, Bet 2 sur ces 3 cartes + la première
 * carte commune : aucune anticipation. Partagé par GameEngine et Table.
 * Gain principal = multiplicateur × mises en jeu ; une main perdante coûte les mises
 * en jeu, un bonus perdant coûte la mise bonus.
 */
GameHandResult settle_hand(int hand_id,
                           const std::array<Card, 3>& player_cards,
                           const std::array<Card, 2>& community_cards,
                           double base_bet,
                           double bonus_bet,
                           StrategyContext context,
                           const Strategy& strategy,
                           const MainPaytable& main_paytable,
                           const BonusPaytable* bonus_paytable);

// Prépare le paquet avant la donne : par défaut Deck::shuffle.
// Injectable pour les tests (paquet truqué).
using DeckPreparer = std::function<void(Deck&, std::mt19937_64&)>;

/**
 * @brief Machine à états d'une main :
 * RESET_DECK -> SHUFFLE -> DEAL_PLAYER(3) -> [DEALER_DISCARD(k)] -> DEAL_COMMUNITY(2)
 * -> DECIDE_BET1 -> DECIDE_BET2 -> EVALUATE -> SETTLE_BONUS -> SETTLE_MAIN.
 *
 * Possède son Deck ; le flux aléatoire et les tables de paiement appartiennent
 * à l'appelant et doivent lui survivre.
 */
class GameEngine {
public:
    GameEngine(std::shared_ptr<const Strategy> strategy,
               const MainPaytable& main_paytable,
               const BonusPaytable* bonus_paytable,
               std::mt19937_64& rng,
               DealerConfig dealer_config = {});

    GameHandResult play_hand(int hand_id, double base_bet, double bonus_bet, const StrategyContext& context);

    // Cartes défaussées lors de la dernière main (audit statistique)
    const std::vector<Card>& last_discarded_cards() const { return last_discarded_cards_; }

    void set_deck_preparer(DeckPreparer preparer) { deck_preparer_ = std::move(preparer); }

    const Strategy& get_strategy() const { return *strategy_; }
    const BonusPaytable* get_bonus_paytable() const { return bonus_paytable_; }

private:
    std::shared_ptr<const Strategy> strategy_;
    const MainPaytable& main_paytable_;
    const BonusPaytable* bonus_paytable_;
    std::mt19937_64& rng_;
    DealerConfig dealer_config_;
    Deck deck_;
    DeckPreparer deck_preparer_;
    std::vector<Card> last_discarded_cards_;
};

// discard_cards >= 1 si la défausse est active. Un paquet trop court pour la donne
// n'est pas détecté ici : Deck::deal lève DeckEmptyError pendant la main.
void validate_dealer_config(const DealerConfig& config);

} // namespace lir

#endif // LIR_GAME_ENGINE_H
