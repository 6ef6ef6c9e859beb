#include <laurel/awards/award_rule.hpp>
#include <format>

namespace laurel::awards {

namespace {

template<typename T>
bool compare(const T& lhs, CompareOp op, const T& rhs) {
    switch (op) {
        case CompareOp::Equal: return lhs == rhs;
        case CompareOp::NotEqual: return lhs != rhs;
        case CompareOp::Less: return lhs < rhs;
        case CompareOp::LessEqual: return lhs <= rhs;
        case CompareOp::Greater: return lhs > rhs;
        case CompareOp::GreaterEqual: return lhs >= rhs;
        case CompareOp::IsSet:
        case CompareOp::IsUnset:
            break;
    }
    return false;
}

bool is_ordering(CompareOp op) {
    return op == CompareOp::Less || op == CompareOp::LessEqual ||
           op == CompareOp::Greater || op == CompareOp::GreaterEqual;
}

bool is_presence(CompareOp op) {
    return op == CompareOp::IsSet || op == CompareOp::IsUnset;
}

} // anonymous namespace

// ============================================================================
// CompareOp
// ============================================================================

const char* compare_op_symbol(CompareOp op) {
    switch (op) {
        case CompareOp::Equal: return "==";
        case CompareOp::NotEqual: return "!=";
        case CompareOp::Less: return "<";
        case CompareOp::LessEqual: return "<=";
        case CompareOp::Greater: return ">";
        case CompareOp::GreaterEqual: return ">=";
        case CompareOp::IsSet: return "set";
        case CompareOp::IsUnset: return "unset";
    }
    return "?";
}

std::optional<CompareOp> parse_compare_op(std::string_view symbol) {
    if (symbol == "==") return CompareOp::Equal;
    if (symbol == "!=") return CompareOp::NotEqual;
    if (symbol == "<") return CompareOp::Less;
    if (symbol == "<=") return CompareOp::LessEqual;
    if (symbol == ">") return CompareOp::Greater;
    if (symbol == ">=") return CompareOp::GreaterEqual;
    if (symbol == "set") return CompareOp::IsSet;
    if (symbol == "unset") return CompareOp::IsUnset;
    return std::nullopt;
}

// ============================================================================
// AwardCondition
// ============================================================================

bool AwardCondition::evaluate(const KeyFigures& figures) const {
    switch (key_figure_info(figure).kind) {
        case KeyFigureKind::Counter:
            return compare(figures.count(figure), op, count);
        case KeyFigureKind::Timer:
            return compare(figures.timer(figure), op, timer);
        case KeyFigureKind::Label: {
            const auto& current = figures.label(figure);
            if (op == CompareOp::IsSet) return !current.empty();
            if (op == CompareOp::IsUnset) return current.empty();
            return compare(current, op, label);
        }
    }
    return false;
}

std::string AwardCondition::validate() const {
    if (static_cast<size_t>(figure) >= KEY_FIGURE_COUNT) {
        return std::format("Unknown key figure {}", static_cast<int>(figure));
    }

    const auto& info = key_figure_info(figure);
    if (info.kind == KeyFigureKind::Label) {
        if (is_ordering(op)) {
            return std::format("Operator '{}' cannot compare label figure {}", compare_op_symbol(op), info.name);
        }
    } else if (is_presence(op)) {
        return std::format("Operator '{}' only applies to label figures, not {}", compare_op_symbol(op), info.name);
    }
    return {};
}

// ============================================================================
// AwardRule
// ============================================================================

bool AwardRule::evaluate(const KeyFigures& figures) const {
    for (const auto& cond : conditions) {
        if (!cond.evaluate(figures)) {
            return false;
        }
    }
    return !conditions.empty();
}

bool validate(const AwardRule& rule, std::string& out_error) {
    if (rule.achievement_id.empty()) {
        out_error = "Award rule has an empty achievement id";
        return false;
    }
    if (rule.conditions.empty()) {
        out_error = std::format("Award rule {} has no conditions", rule.achievement_id);
        return false;
    }
    for (const auto& cond : rule.conditions) {
        auto error = cond.validate();
        if (!error.empty()) {
            out_error = std::format("Award rule {}: {}", rule.achievement_id, error);
            return false;
        }
    }
    return true;
}

// ============================================================================
// AwardRuleBuilder
// ============================================================================

AwardRuleBuilder& AwardRuleBuilder::id(const std::string& achievement_id) {
    m_rule.achievement_id = achievement_id;
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::count(KeyFigureId figure, CompareOp op, int value) {
    AwardCondition c;
    c.figure = figure;
    c.op = op;
    c.count = value;
    m_rule.conditions.push_back(c);
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::at_least(KeyFigureId figure, int value) {
    return count(figure, CompareOp::GreaterEqual, value);
}

AwardRuleBuilder& AwardRuleBuilder::exactly(KeyFigureId figure, int value) {
    return count(figure, CompareOp::Equal, value);
}

AwardRuleBuilder& AwardRuleBuilder::timer(KeyFigureId figure, CompareOp op, float seconds) {
    AwardCondition c;
    c.figure = figure;
    c.op = op;
    c.timer = seconds;
    m_rule.conditions.push_back(c);
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::below(KeyFigureId figure, float seconds) {
    return timer(figure, CompareOp::Less, seconds);
}

AwardRuleBuilder& AwardRuleBuilder::label_is(KeyFigureId figure, const std::string& text) {
    AwardCondition c;
    c.figure = figure;
    c.op = CompareOp::Equal;
    c.label = text;
    m_rule.conditions.push_back(std::move(c));
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::label_is_not(KeyFigureId figure, const std::string& text) {
    AwardCondition c;
    c.figure = figure;
    c.op = CompareOp::NotEqual;
    c.label = text;
    m_rule.conditions.push_back(std::move(c));
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::label_set(KeyFigureId figure) {
    AwardCondition c;
    c.figure = figure;
    c.op = CompareOp::IsSet;
    m_rule.conditions.push_back(c);
    return *this;
}

AwardRuleBuilder& AwardRuleBuilder::condition(AwardCondition cond) {
    m_rule.conditions.push_back(std::move(cond));
    return *this;
}

AwardRule AwardRuleBuilder::build() const {
    return m_rule;
}

} // namespace laurel::awards
