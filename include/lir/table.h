#ifndef LIR_TABLE_H
#define LIR_TABLE_H

#include "lir/game_engine.h"
#include <array>
#include <memory>
#include <random>
#include <vector>

namespace lir {

inline constexpr int MIN_SEATS = 1;
inline constexpr int MAX_SEATS = 6;

// Résultat d'un siège pour un tour de table
struct SeatHandResult {
    int seat_number = 0;    // 1-based
    GameHandResult hand;
};

// Un tour complet : cartes communes partagées par tous les sièges
struct TableRoundResult {
    int round_id = 0;
    std::array<Card, 2> community_cards{};
    std::vector<Card> dealer_discards;   // Vide si la défausse est désactivée
    std::vector<SeatHandResult> seat_results;
};

/**
 * @brief Table multi-sièges distribuant depuis un unique paquet mélangé.
 *
 * Ordre : 3 cartes par siège (siège 1 d'abord), défausse optionnelle,
 * puis 2 cartes communes. Tous les sièges jouent la même stratégie et
 * chaque siège est réglé par settle_hand.
 */
class Table {
public:
    Table(std::shared_ptr<const Strategy> strategy,
          const MainPaytable& main_paytable,
          const BonusPaytable* bonus_paytable,
          std::mt19937_64& rng,
          int num_seats = 1,
          DealerConfig dealer_config = {});

    TableRoundResult play_round(int round_id, double base_bet, double bonus_bet, const StrategyContext& context);

    int get_num_seats() const { return num_seats_; }
    const std::vector<Card>& last_discarded_cards() const { return last_discarded_cards_; }
    void set_deck_preparer(DeckPreparer preparer) { deck_preparer_ = std::move(preparer); }

private:
    std::shared_ptr<const Strategy> strategy_;
    const MainPaytable& main_paytable_;
    const BonusPaytable* bonus_paytable_;
    std::mt19937_64& rng_;
    int num_seats_;
    DealerConfig dealer_config_;
    Deck deck_;
    DeckPreparer deck_preparer_;
    std::vector<Card> last_discarded_cards_;
    std::vector<std::array<Card, 3>> seat_cards_; // Tampon réutilisé d'un tour à l'autre
};

} // namespace lir

#endif // LIR_TABLE_H
