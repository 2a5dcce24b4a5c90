#include "lir/strategy.h"
#include "lir/custom_strategy.h"
#include "spdlog/spdlog.h"
#include <stdexcept>

namespace lir {

// Bet 1 (3 cartes) : main payante, tirage royal, puis tirages quinte flush à 3 assorties
// selon l'écart (3 hors A-2-3 / 2-3-4, 4 avec une haute, 5 avec deux hautes).
Decision BasicStrategy::decide_bet1(const HandAnalysis& analysis, const StrategyContext& /*context*/) const {
    if (analysis.has_paying_hand) return Decision::RIDE;
    if (analysis.is_royal_draw) return Decision::RIDE;
    if (analysis.is_straight_flush_draw && analysis.suited_cards == 3) {
        const int spread = analysis.straight_flush_spread;
        if (spread == 3 && !analysis.is_excluded_sf_consecutive) return Decision::RIDE;
        if (spread == 4 && analysis.suited_high_cards >= 1) return Decision::RIDE;
        if (spread == 5 && analysis.suited_high_cards >= 2) return Decision::RIDE;
    }
    return Decision::PULL;
}

// Bet 2 (4 cartes) : main payante, 4 à la couleur, quinte ouverte avec une haute,
// quinte ventrale avec 4 cartes hautes.
Decision BasicStrategy::decide_bet2(const HandAnalysis& analysis, const StrategyContext& /*context*/) const {
    if (analysis.has_paying_hand) return Decision::RIDE;
    if (analysis.is_flush_draw && analysis.suited_cards >= 4) return Decision::RIDE;
    if (analysis.is_open_straight_draw && analysis.high_cards >= 1) return Decision::RIDE;
    if (analysis.is_inside_straight_draw && analysis.high_cards >= 4) return Decision::RIDE;
    return Decision::PULL;
}

std::shared_ptr<const Strategy> create_strategy(const StrategyConfig& config) {
    if (config.type == "basic") return std::make_shared<BasicStrategy>();
    if (config.type == "always_ride") return std::make_shared<AlwaysRideStrategy>();
    if (config.type == "always_pull") return std::make_shared<AlwaysPullStrategy>();
    if (config.type == "conservative") return std::make_shared<CustomStrategy>(conservative_strategy());
    if (config.type == "aggressive") return std::make_shared<CustomStrategy>(aggressive_strategy());
    if (config.type == "custom") {
        return std::make_shared<CustomStrategy>(config.bet1_rules, config.bet2_rules);
    }
    spdlog::error("Type de stratégie inconnu : {}", config.type);
    throw std::invalid_argument("Unknown strategy type: '" + config.type + "'");
}

} // namespace lir
