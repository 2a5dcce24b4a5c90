#include "lir/bonus_strategy.h"
#include "spdlog/spdlog.h"
#include <algorithm>
#include <stdexcept>
#include <utility>

namespace lir {

double clamp_bonus_bet(double bet, const BonusContext& context) {
    if (bet <= 0.0 || bet < context.min_bonus_bet) {
        return 0.0;
    }
    return std::min(bet, context.max_bonus_bet);
}

AlwaysBonusStrategy::AlwaysBonusStrategy(double amount)
    : amount_(amount)
{
    if (amount < 0.0) {
        throw std::invalid_argument("AlwaysBonusStrategy: amount must be non-negative");
    }
}

double AlwaysBonusStrategy::get_bonus_bet(const BonusContext& context) const {
    return clamp_bonus_bet(amount_, context);
}

StaticBonusStrategy::StaticBonusStrategy(std::optional<double> amount, std::optional<double> ratio)
    : amount_(amount), ratio_(ratio) {}

StaticBonusStrategy StaticBonusStrategy::with_amount(double amount) {
    if (amount < 0.0) {
        throw std::invalid_argument("StaticBonusStrategy: amount must be non-negative");
    }
    return StaticBonusStrategy(amount, std::nullopt);
}

StaticBonusStrategy StaticBonusStrategy::with_ratio(double ratio) {
    if (ratio < 0.0) {
        throw std::invalid_argument("StaticBonusStrategy: ratio must be non-negative");
    }
    return StaticBonusStrategy(std::nullopt, ratio);
}

double StaticBonusStrategy::get_bonus_bet(const BonusContext& context) const {
    const double bet = amount_ ? *amount_ : context.base_bet * ratio_.value_or(0.0);
    return clamp_bonus_bet(bet, context);
}

BankrollConditionalBonusStrategy::BankrollConditionalBonusStrategy(BankrollConditionalParams params)
    : params_(std::move(params))
{
    if (params_.base_amount < 0.0) {
        throw std::invalid_argument("BankrollConditionalBonusStrategy: base_amount must be non-negative");
    }
    if (params_.profit_percentage && *params_.profit_percentage < 0.0) {
        throw std::invalid_argument("BankrollConditionalBonusStrategy: profit_percentage must be non-negative");
    }
}

double BankrollConditionalBonusStrategy::get_bonus_bet(const BonusContext& context) const {
    if (params_.min_session_profit && context.session_profit < *params_.min_session_profit) {
        return 0.0;
    }
    if (params_.min_bankroll_ratio && context.starting_bankroll > 0.0) {
        if (context.bankroll / context.starting_bankroll < *params_.min_bankroll_ratio) {
            return 0.0;
        }
    }
    if (params_.max_drawdown && context.starting_bankroll > 0.0) {
        const double drawdown = (context.starting_bankroll - context.bankroll) / context.starting_bankroll;
        if (drawdown > *params_.max_drawdown) {
            return 0.0;
        }
    }

    double bet = params_.base_amount;
    for (const auto& tier : params_.scaling_tiers) {
        const bool in_range = context.session_profit >= tier.min_profit
            && (!tier.max_profit || context.session_profit < *tier.max_profit);
        if (in_range) {
            bet = tier.bet_amount;
            break;
        }
    }
    if (params_.profit_percentage && context.session_profit > 0.0) {
        bet = context.session_profit * *params_.profit_percentage;
    }
    return clamp_bonus_bet(bet, context);
}

std::shared_ptr<const BonusStrategy> create_bonus_strategy(const BonusBetConfig& config) {
    if (config.min_bonus_bet < 0.0 || config.max_bonus_bet < config.min_bonus_bet) {
        throw std::invalid_argument("Bonus bet limits must satisfy 0 <= min_bonus_bet <= max_bonus_bet");
    }
    if (config.type == "never") return std::make_shared<NeverBonusStrategy>();
    if (config.type == "always") return std::make_shared<AlwaysBonusStrategy>(config.amount);
    if (config.type == "static") {
        if (config.ratio) {
            return std::make_shared<StaticBonusStrategy>(StaticBonusStrategy::with_ratio(*config.ratio));
        }
        return std::make_shared<StaticBonusStrategy>(StaticBonusStrategy::with_amount(config.amount));
    }
    if (config.type == "bankroll_conditional") {
        return std::make_shared<BankrollConditionalBonusStrategy>(config.conditional);
    }
    spdlog::error("Stratégie bonus inconnue : {}", config.type);
    throw std::invalid_argument("Unknown bonus strategy type: '" + config.type + "'");
}

} // namespace lir
