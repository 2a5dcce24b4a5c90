#ifndef LIR_STRATEGY_H
#define LIR_STRATEGY_H

#include "lir/common_types.h"
#include "lir/hand_analysis.h"
#include "core/deck.hpp" // Pour RankCounts
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace lir {

/**
 * @brief Contexte de session transmis à chaque décision, en lecture seule.
 *
 * unseen_ranks n'est renseigné que si la stratégie le demande
 * (uses_deck_composition) : composition des cartes encore invisibles
 * pour le joueur au point de décision, jamais celle du paquet réel.
 */
struct StrategyContext {
    double session_profit = 0.0;
    int hands_played = 0;
    int streak = 0;        // >0 : victoires consécutives, <0 : défaites consécutives
    double bankroll = 0.0;
    std::optional<RankCounts> unseen_ranks;
};

// Interface de décision aux deux points de contrôle (3 cartes puis 4 cartes).
// Les implémentations sont immuables et partagées entre threads.
class Strategy {
public:
    virtual ~Strategy() = default;

    virtual Decision decide_bet1(const HandAnalysis& analysis, const StrategyContext& context) const = 0;
    virtual Decision decide_bet2(const HandAnalysis& analysis, const StrategyContext& context) const = 0;
    virtual std::string get_name() const = 0;

    virtual bool uses_deck_composition() const { return false; }
};

// Stratégie de base publiée (tableaux de décision optimaux)
class BasicStrategy : public Strategy {
public:
    Decision decide_bet1(const HandAnalysis& analysis, const StrategyContext& context) const override;
    Decision decide_bet2(const HandAnalysis& analysis, const StrategyContext& context) const override;
    std::string get_name() const override { return "basic"; }
};

// Bornes de variance : toujours laisser courir / toujours retirer
class AlwaysRideStrategy : public Strategy {
public:
    Decision decide_bet1(const HandAnalysis&, const StrategyContext&) const override { return Decision::RIDE; }
    Decision decide_bet2(const HandAnalysis&, const StrategyContext&) const override { return Decision::RIDE; }
    std::string get_name() const override { return "always_ride"; }
};

class AlwaysPullStrategy : public Strategy {
public:
    Decision decide_bet1(const HandAnalysis&, const StrategyContext&) const override { return Decision::PULL; }
    Decision decide_bet2(const HandAnalysis&, const StrategyContext&) const override { return Decision::PULL; }
    std::string get_name() const override { return "always_pull"; }
};

// Règle d'une stratégie personnalisée : condition nommée -> décision
struct StrategyRule {
    std::string condition;
    Decision action = Decision::PULL;
};

// Sélection de stratégie : "basic", "always_ride", "always_pull",
// "conservative", "aggressive" ou "custom" (règles fournies).
struct StrategyConfig {
    std::string type = "basic";
    std::vector<StrategyRule> bet1_rules;
    std::vector<StrategyRule> bet2_rules;
};

/**
 * @brief Construit la stratégie décrite par la configuration.
 * Les règles personnalisées sont compilées ici : toute erreur de définition
 * est levée avant le début de la simulation.
 */
std::shared_ptr<const Strategy> create_strategy(const StrategyConfig& config);

} // namespace lir

#endif // LIR_STRATEGY_H
