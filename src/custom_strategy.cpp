#include "lir/custom_strategy.h"
#include "spdlog/spdlog.h"
#include <array>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace lir {

namespace {

// Table de dispatch des champs exposés par HandAnalysis
struct FieldSpec {
    const char* name;
    bool is_bool;
    int (*get)(const HandAnalysis&);
};

const std::array<FieldSpec, 17> FIELDS = {{
    // Booléens
    {"has_paying_hand", true, [](const HandAnalysis& a) { return int(a.has_paying_hand); }},
    {"has_pair", true, [](const HandAnalysis& a) { return int(a.has_pair); }},
    {"has_high_pair", true, [](const HandAnalysis& a) { return int(a.has_high_pair); }},
    {"has_trips", true, [](const HandAnalysis& a) { return int(a.has_trips); }},
    {"is_flush_draw", true, [](const HandAnalysis& a) { return int(a.is_flush_draw); }},
    {"is_straight_draw", true, [](const HandAnalysis& a) { return int(a.is_straight_draw); }},
    {"is_open_straight_draw", true, [](const HandAnalysis& a) { return int(a.is_open_straight_draw); }},
    {"is_inside_straight_draw", true, [](const HandAnalysis& a) { return int(a.is_inside_straight_draw); }},
    {"is_straight_flush_draw", true, [](const HandAnalysis& a) { return int(a.is_straight_flush_draw); }},
    {"is_royal_draw", true, [](const HandAnalysis& a) { return int(a.is_royal_draw); }},
    {"is_excluded_sf_consecutive", true, [](const HandAnalysis& a) { return int(a.is_excluded_sf_consecutive); }},
    // Compteurs
    {"high_cards", false, [](const HandAnalysis& a) { return a.high_cards; }},
    {"suited_cards", false, [](const HandAnalysis& a) { return a.suited_cards; }},
    {"connected_cards", false, [](const HandAnalysis& a) { return a.connected_cards; }},
    {"gaps", false, [](const HandAnalysis& a) { return a.gaps; }},
    {"suited_high_cards", false, [](const HandAnalysis& a) { return a.suited_high_cards; }},
    {"straight_flush_spread", false, [](const HandAnalysis& a) { return a.straight_flush_spread; }}
}};

int find_field(const std::string& name) {
    for (size_t i = 0; i < FIELDS.size(); ++i) {
        if (name == FIELDS[i].name) return static_cast<int>(i);
    }
    return -1;
}

std::string to_lower_trimmed(const std::string& s) {
    size_t begin = 0;
    size_t end = s.size();
    while (begin < end && std::isspace(static_cast<unsigned char>(s[begin]))) ++begin;
    while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    std::string out = s.substr(begin, end - begin);
    for (char& c : out) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return out;
}

std::vector<std::string> tokenize(const std::string& condition) {
    std::vector<std::string> tokens;
    size_t i = 0;
    while (i < condition.size()) {
        const char c = condition[i];
        if (std::isspace(static_cast<unsigned char>(c))) {
            ++i;
        } else if ((c == '>' || c == '<' || c == '=' || c == '!') && i + 1 < condition.size() && condition[i + 1] == '=') {
            tokens.push_back(condition.substr(i, 2));
            i += 2;
        } else if (c == '>' || c == '<' || c == '(' || c == ')') {
            tokens.emplace_back(1, c);
            ++i;
        } else if (std::isdigit(static_cast<unsigned char>(c))) {
            size_t j = i;
            while (j < condition.size() && std::isdigit(static_cast<unsigned char>(condition[j]))) ++j;
            tokens.push_back(condition.substr(i, j - i));
            i = j;
        } else if (std::isalpha(static_cast<unsigned char>(c)) || c == '_') {
            size_t j = i;
            while (j < condition.size()
                   && (std::isalnum(static_cast<unsigned char>(condition[j])) || condition[j] == '_')) ++j;
            tokens.push_back(condition.substr(i, j - i));
            i = j;
        } else {
            throw ConditionParseError("Unexpected character '" + std::string(1, c) + "' in condition '" + condition + "'");
        }
    }
    return tokens;
}

bool is_keyword(const std::string& token) {
    return token == "and" || token == "or" || token == "not" || token == "default";
}

} // namespace

// --- Parseur à descente récursive, produit l'arbre typé ---

class CompiledCondition::Parser {
public:
    struct Operand {
        int node;
        bool is_bool;
        std::string text; // Pour les messages d'erreur
    };

    Parser(const std::string& source, std::vector<std::string> tokens, std::vector<Node>& nodes)
        : source_(source), tokens_(std::move(tokens)), nodes_(nodes) {}

    int parse() {
        if (tokens_.empty()) {
            throw ConditionParseError("Empty condition");
        }
        Operand root = or_expr();
        if (pos_ < tokens_.size()) {
            throw ConditionParseError("Unexpected token '" + tokens_[pos_] + "' in condition '" + source_ + "'");
        }
        require_bool(root);
        return root.node;
    }

private:
    const std::string* current() const { return pos_ < tokens_.size() ? &tokens_[pos_] : nullptr; }
    bool current_is(const char* token) const { return current() != nullptr && *current() == token; }

    int add(Node node) {
        nodes_.push_back(node);
        return static_cast<int>(nodes_.size()) - 1;
    }

    void require_bool(const Operand& operand) const {
        if (!operand.is_bool) {
            throw InvalidFieldError("'" + operand.text + "' is numeric and cannot be used as a condition in '" + source_ + "'");
        }
    }

    void require_int(const Operand& operand) const {
        if (operand.is_bool) {
            throw InvalidFieldError("'" + operand.text + "' is boolean and cannot be compared in '" + source_ + "'");
        }
    }

    Operand or_expr() {
        Operand left = and_expr();
        while (current_is("or")) {
            ++pos_;
            Operand right = and_expr();
            require_bool(left);
            require_bool(right);
            left = {add({NodeKind::OR, CompareOp::EQ, 0, left.node, right.node}), true, left.text + " or " + right.text};
        }
        return left;
    }

    Operand and_expr() {
        Operand left = not_expr();
        while (current_is("and")) {
            ++pos_;
            Operand right = not_expr();
            require_bool(left);
            require_bool(right);
            left = {add({NodeKind::AND, CompareOp::EQ, 0, left.node, right.node}), true, left.text + " and " + right.text};
        }
        return left;
    }

    Operand not_expr() {
        if (current_is("not")) {
            ++pos_;
            Operand operand = not_expr();
            require_bool(operand);
            return {add({NodeKind::NOT, CompareOp::EQ, 0, operand.node, -1}), true, "not " + operand.text};
        }
        return comparison();
    }

    Operand comparison() {
        Operand left = primary();
        const std::string* tok = current();
        if (tok == nullptr) return left;

        CompareOp op;
        if (*tok == ">=") op = CompareOp::GE;
        else if (*tok == "<=") op = CompareOp::LE;
        else if (*tok == ">") op = CompareOp::GT;
        else if (*tok == "<") op = CompareOp::LT;
        else if (*tok == "==") op = CompareOp::EQ;
        else if (*tok == "!=") op = CompareOp::NE;
        else return left;

        const std::string op_text = *tok;
        ++pos_;
        Operand right = primary();
        require_int(left);
        require_int(right);
        return {add({NodeKind::COMPARE, op, 0, left.node, right.node}), true,
                left.text + " " + op_text + " " + right.text};
    }

    Operand primary() {
        const std::string* tok = current();
        if (tok == nullptr) {
            throw ConditionParseError("Unexpected end of condition '" + source_ + "'");
        }
        const std::string token = *tok;
        if (token == "(") {
            ++pos_;
            Operand inner = or_expr();
            if (!current_is(")")) {
                throw ConditionParseError("Expected closing parenthesis in condition '" + source_ + "'");
            }
            ++pos_;
            return inner;
        }
        if (std::isdigit(static_cast<unsigned char>(token[0]))) {
            ++pos_;
            int value = 0;
            try {
                value = std::stoi(token);
            } catch (const std::out_of_range&) {
                throw ConditionParseError("Integer literal out of range: " + token);
            }
            return {add({NodeKind::LITERAL, CompareOp::EQ, value, -1, -1}), false, token};
        }
        const bool is_identifier = std::isalpha(static_cast<unsigned char>(token[0])) || token[0] == '_';
        if (!is_identifier || is_keyword(token)) {
            throw ConditionParseError("Unexpected token '" + token + "' in condition '" + source_ + "'");
        }
        const int field = find_field(token);
        if (field < 0) {
            throw ConditionParseError("Unknown field '" + token + "' in condition '" + source_ + "'");
        }
        ++pos_;
        const bool is_bool = FIELDS[field].is_bool;
        return {add({is_bool ? NodeKind::BOOL_FIELD : NodeKind::INT_FIELD, CompareOp::EQ, field, -1, -1}), is_bool, token};
    }

    const std::string& source_;
    std::vector<std::string> tokens_;
    std::vector<Node>& nodes_;
    size_t pos_ = 0;
};

// --- CompiledCondition ---

CompiledCondition::CompiledCondition(const std::string& condition)
    : source_(condition)
{
    const std::string normalized = to_lower_trimmed(condition);
    if (normalized == "default") {
        nodes_.push_back(Node{});
        root_ = 0;
        return;
    }
    Parser parser(source_, tokenize(normalized), nodes_);
    root_ = parser.parse();
}

std::vector<std::string> CompiledCondition::field_names() {
    std::vector<std::string> names;
    names.reserve(FIELDS.size());
    for (const auto& f : FIELDS) names.emplace_back(f.name);
    return names;
}

bool CompiledCondition::evaluate(const HandAnalysis& analysis) const {
    return eval_bool(root_, analysis);
}

bool CompiledCondition::eval_bool(int index, const HandAnalysis& analysis) const {
    const Node& node = nodes_[index];
    switch (node.kind) {
        case NodeKind::ALWAYS: return true;
        case NodeKind::BOOL_FIELD: return FIELDS[node.value].get(analysis) != 0;
        case NodeKind::NOT: return !eval_bool(node.lhs, analysis);
        case NodeKind::AND: return eval_bool(node.lhs, analysis) && eval_bool(node.rhs, analysis);
        case NodeKind::OR: return eval_bool(node.lhs, analysis) || eval_bool(node.rhs, analysis);
        case NodeKind::COMPARE: {
            const int l = eval_int(node.lhs, analysis);
            const int r = eval_int(node.rhs, analysis);
            switch (node.op) {
                case CompareOp::GE: return l >= r;
                case CompareOp::LE: return l <= r;
                case CompareOp::GT: return l > r;
                case CompareOp::LT: return l < r;
                case CompareOp::EQ: return l == r;
                case CompareOp::NE: return l != r;
            }
            return false;
        }
        case NodeKind::INT_FIELD:
        case NodeKind::LITERAL:
            break;
    }
    // Exclu par le typage à la compilation
    throw std::logic_error("Numeric node evaluated as a condition in '" + source_ + "'");
}

int CompiledCondition::eval_int(int index, const HandAnalysis& analysis) const {
    const Node& node = nodes_[index];
    if (node.kind == NodeKind::INT_FIELD) return FIELDS[node.value].get(analysis);
    if (node.kind == NodeKind::LITERAL) return node.value;
    throw std::logic_error("Boolean node evaluated as a number in '" + source_ + "'");
}

// --- CustomStrategy ---

CustomStrategy::CustomStrategy(const std::vector<StrategyRule>& bet1_rules,
                               const std::vector<StrategyRule>& bet2_rules,
                               std::string name)
    : bet1_rules_(compile_rules(bet1_rules, "bet1_rules")),
      bet2_rules_(compile_rules(bet2_rules, "bet2_rules")),
      name_(std::move(name))
{
    spdlog::debug("Stratégie '{}' compilée : {} règles bet1, {} règles bet2.",
                  name_, bet1_rules_.size(), bet2_rules_.size());
}

std::vector<CustomStrategy::CompiledRule> CustomStrategy::compile_rules(const std::vector<StrategyRule>& rules,
                                                                        const char* label) {
    if (rules.empty()) {
        throw std::invalid_argument(std::string(label) + " cannot be empty");
    }
    std::vector<CompiledRule> compiled;
    compiled.reserve(rules.size());
    for (const auto& rule : rules) {
        compiled.push_back({CompiledCondition(rule.condition), rule.action});
    }
    return compiled;
}

Decision CustomStrategy::evaluate_rules(const std::vector<CompiledRule>& rules, const HandAnalysis& analysis) {
    for (const auto& rule : rules) {
        if (rule.condition.evaluate(analysis)) {
            return rule.action;
        }
    }
    throw std::logic_error("No rule matched. Consider adding a 'default' rule as fallback.");
}

Decision CustomStrategy::decide_bet1(const HandAnalysis& analysis, const StrategyContext& /*context*/) const {
    return evaluate_rules(bet1_rules_, analysis);
}

Decision CustomStrategy::decide_bet2(const HandAnalysis& analysis, const StrategyContext& /*context*/) const {
    return evaluate_rules(bet2_rules_, analysis);
}

// --- Préréglages ---

CustomStrategy conservative_strategy() {
    const std::vector<StrategyRule> rules = {
        {"has_paying_hand", Decision::RIDE},
        {"default", Decision::PULL}
    };
    return CustomStrategy(rules, rules, "conservative");
}

CustomStrategy aggressive_strategy() {
    const std::vector<StrategyRule> rules = {
        {"has_paying_hand", Decision::RIDE},
        {"is_flush_draw", Decision::RIDE},
        {"is_straight_draw", Decision::RIDE},
        {"default", Decision::PULL}
    };
    return CustomStrategy(rules, rules, "aggressive");
}

} // namespace lir
