#ifndef LIR_PAYTABLE_H
#define LIR_PAYTABLE_H

#include "eval/hand_evaluator.hpp"
#include "eval/three_card_evaluator.hpp"
#include <array>
#include <map>
#include <stdexcept>
#include <string>

namespace lir {

// Table incomplète ou multiplicateur négatif
class PaytableValidationError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/**
 * @brief Table de paiement du jeu principal (5 cartes).
 * Objet valeur immuable, validé à la construction.
 */
class MainPaytable {
public:
    MainPaytable(std::string name, const std::map<FiveCardHandRank, int>& payouts);

    const std::string& get_name() const { return name_; }
    int multiplier(FiveCardHandRank rank) const { return multipliers_[static_cast<size_t>(rank)]; }

    // Gain (hors mise) pour `bet` misé ; 0 pour une main non payante
    double payout(FiveCardHandRank rank, double bet) const { return multiplier(rank) * bet; }

private:
    std::string name_;
    std::array<int, NUM_FIVE_CARD_RANKS> multipliers_{};
};

// Table de paiement du pari bonus (3 cartes)
class BonusPaytable {
public:
    BonusPaytable(std::string name, const std::map<ThreeCardHandRank, int>& payouts);

    const std::string& get_name() const { return name_; }
    int multiplier(ThreeCardHandRank rank) const { return multipliers_[static_cast<size_t>(rank) - 1]; }
    double payout(ThreeCardHandRank rank, double bet) const { return multiplier(rank) * bet; }

private:
    std::string name_;
    std::array<int, NUM_THREE_CARD_RANKS> multipliers_{};
};

// Tables prédéfinies, construites à la demande (aucun cache global)
MainPaytable standard_main_paytable();
BonusPaytable bonus_paytable_a();
BonusPaytable bonus_paytable_b();
BonusPaytable bonus_paytable_c(int progressive_payout = 1000);

// "standard" ; "paytable_a" / "paytable_b" / "paytable_c"
MainPaytable main_paytable_by_name(const std::string& name);
BonusPaytable bonus_paytable_by_name(const std::string& name, int progressive_payout = 1000);

} // namespace lir

#endif // LIR_PAYTABLE_H
