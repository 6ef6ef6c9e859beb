#pragma once

#include <laurel/awards/key_figures.hpp>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace laurel::awards {

// ============================================================================
// CompareOp
// ============================================================================

enum class CompareOp : uint8_t {
    Equal,
    NotEqual,
    Less,
    LessEqual,
    Greater,
    GreaterEqual,
    IsSet,          // Labels only: non-empty
    IsUnset         // Labels only: empty
};

// "==", "!=", "<", "<=", ">", ">=", "set", "unset"
const char* compare_op_symbol(CompareOp op);
std::optional<CompareOp> parse_compare_op(std::string_view symbol);

// ============================================================================
// AwardCondition - One comparison of a key figure against a literal
// ============================================================================

struct AwardCondition {
    KeyFigureId figure = KeyFigureId::WipeoutsCount;
    CompareOp op = CompareOp::GreaterEqual;

    // Operand, the field matching the figure's kind is used
    int count = 0;
    float timer = 0.0f;
    std::string label;

    bool evaluate(const KeyFigures& figures) const;

    // Empty when the condition is well formed
    std::string validate() const;
};

// ============================================================================
// AwardRule - Achievement id plus the conjunction of its conditions
// ============================================================================

struct AwardRule {
    std::string achievement_id;
    std::vector<AwardCondition> conditions;

    // True when every condition holds
    bool evaluate(const KeyFigures& figures) const;
};

// Returns false and fills out_error for an empty id, no conditions, or a
// condition whose operator does not suit its figure's kind
bool validate(const AwardRule& rule, std::string& out_error);

// ============================================================================
// AwardRuleBuilder
// ============================================================================

class AwardRuleBuilder {
public:
    AwardRuleBuilder& id(const std::string& achievement_id);

    // Counters
    AwardRuleBuilder& count(KeyFigureId figure, CompareOp op, int value);
    AwardRuleBuilder& at_least(KeyFigureId figure, int value);
    AwardRuleBuilder& exactly(KeyFigureId figure, int value);

    // Timers
    AwardRuleBuilder& timer(KeyFigureId figure, CompareOp op, float seconds);
    AwardRuleBuilder& below(KeyFigureId figure, float seconds);

    // Labels
    AwardRuleBuilder& label_is(KeyFigureId figure, const std::string& text);
    AwardRuleBuilder& label_is_not(KeyFigureId figure, const std::string& text);
    AwardRuleBuilder& label_set(KeyFigureId figure);

    AwardRuleBuilder& condition(AwardCondition cond);

    AwardRule build() const;

private:
    AwardRule m_rule;
};

inline AwardRuleBuilder award_rule() { return AwardRuleBuilder{}; }

} // namespace laurel::awards
