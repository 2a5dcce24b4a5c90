#ifndef LIR_CUSTOM_STRATEGY_H
#define LIR_CUSTOM_STRATEGY_H

#include "lir/strategy.h"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace lir {

// Erreurs de définition de stratégie, levées à la construction
class StrategyDefinitionError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

// Syntaxe invalide ou nom de champ inconnu
class ConditionParseError : public StrategyDefinitionError {
public:
    using StrategyDefinitionError::StrategyDefinitionError;
};

// Type d'opérande incompatible (booléen comparé à un nombre, compteur utilisé comme prédicat)
class InvalidFieldError : public StrategyDefinitionError {
public:
    using StrategyDefinitionError::StrategyDefinitionError;
};

/**
 * @brief Condition compilée une fois pour toutes.
 *
 * Grammaire :
 *   or_expr    -> and_expr ('or' and_expr)*
 *   and_expr   -> not_expr ('and' not_expr)*
 *   not_expr   -> 'not' not_expr | comparison
 *   comparison -> primary (('>=' | '<=' | '>' | '<' | '==' | '!=') primary)?
 *   primary    -> champ | entier | '(' or_expr ')'
 * "default" seul est toujours vrai.
 *
 * Les champs sont résolus en index dans une table de dispatch fixe :
 * aucune recherche par nom pendant la simulation.
 */
class CompiledCondition {
public:
    explicit CompiledCondition(const std::string& condition);

    bool evaluate(const HandAnalysis& analysis) const;
    const std::string& get_source() const { return source_; }

    // Noms de champs acceptés (booléens puis compteurs)
    static std::vector<std::string> field_names();

private:
    enum class NodeKind : uint8_t { ALWAYS, BOOL_FIELD, INT_FIELD, LITERAL, NOT, AND, OR, COMPARE };
    enum class CompareOp : uint8_t { GE, LE, GT, LT, EQ, NE };

    struct Node {
        NodeKind kind = NodeKind::ALWAYS;
        CompareOp op = CompareOp::EQ;
        int value = 0; // Index de champ ou valeur littérale
        int lhs = -1;
        int rhs = -1;
    };

    class Parser;

    bool eval_bool(int node, const HandAnalysis& analysis) const;
    int eval_int(int node, const HandAnalysis& analysis) const;

    std::string source_;
    std::vector<Node> nodes_;
    int root_ = 0;
};

/**
 * @brief Stratégie à règles ordonnées, première règle vérifiée gagnante.
 * @throws std::invalid_argument si une liste de règles est vide,
 *         ConditionParseError / InvalidFieldError si une condition est invalide.
 */
class CustomStrategy : public Strategy {
public:
    CustomStrategy(const std::vector<StrategyRule>& bet1_rules,
                   const std::vector<StrategyRule>& bet2_rules,
                   std::string name = "custom");

    Decision decide_bet1(const HandAnalysis& analysis, const StrategyContext& context) const override;
    Decision decide_bet2(const HandAnalysis& analysis, const StrategyContext& context) const override;
    std::string get_name() const override { return name_; }

private:
    struct CompiledRule {
        CompiledCondition condition;
        Decision action;
    };

    static std::vector<CompiledRule> compile_rules(const std::vector<StrategyRule>& rules, const char* label);
    static Decision evaluate_rules(const std::vector<CompiledRule>& rules, const HandAnalysis& analysis);

    std::vector<CompiledRule> bet1_rules_;
    std::vector<CompiledRule> bet2_rules_;
    std::string name_;
};

// Préréglages : ne laisser courir que les mains payantes / aussi sur tout tirage
CustomStrategy conservative_strategy();
CustomStrategy aggressive_strategy();

} // namespace lir

#endif // LIR_CUSTOM_STRATEGY_H
