#include "reldb/parser/ast.hpp"

#include <stdexcept>

namespace reldb::parser {

namespace {

template <typename... Ts>
struct overloaded : Ts... {
    using Ts::operator()...;
};

template <typename... Ts>
overloaded(Ts...) -> overloaded<Ts...>;

std::string literal_text(const catalog::Value& value)
{
    if (value.type() == catalog::ValueType::Text) {
        return "'" + value.as_text() + "'";
    }
    return value.to_string();
}

}  // namespace

std::string_view comparison_op_symbol(ComparisonOp op) noexcept
{
    switch (op) {
    case ComparisonOp::Equal:
        return "=";
    case ComparisonOp::NotEqual:
        return "!=";
    case ComparisonOp::Less:
        return "<";
    case ComparisonOp::Greater:
        return ">";
    case ComparisonOp::LessEqual:
        return "<=";
    case ComparisonOp::GreaterEqual:
        return ">=";
    }
    return "?";
}

std::optional<ComparisonOp> parse_comparison_op(std::string_view symbol) noexcept
{
    if (symbol == "=") {
        return ComparisonOp::Equal;
    }
    if (symbol == "!=" || symbol == "<>") {
        return ComparisonOp::NotEqual;
    }
    if (symbol == "<") {
        return ComparisonOp::Less;
    }
    if (symbol == ">") {
        return ComparisonOp::Greater;
    }
    if (symbol == "<=") {
        return ComparisonOp::LessEqual;
    }
    if (symbol == ">=") {
        return ComparisonOp::GreaterEqual;
    }
    return std::nullopt;
}

ConditionPtr make_comparison(std::string column, ComparisonOp op, catalog::Value value)
{
    auto condition = std::make_unique<Condition>();
    condition->node = Comparison{std::move(column), op, std::move(value)};
    return condition;
}

ConditionPtr make_logical(LogicalOp op, ConditionPtr left, ConditionPtr right)
{
    if (!left || !right) {
        throw std::invalid_argument{"Logical condition requires both operands"};
    }
    auto condition = std::make_unique<Condition>();
    condition->node = Logical{op, std::move(left), std::move(right)};
    return condition;
}

std::string_view join_type_name(JoinType type) noexcept
{
    switch (type) {
    case JoinType::Inner:
        return "INNER";
    case JoinType::Left:
        return "LEFT";
    case JoinType::Right:
        return "RIGHT";
    }
    return "UNKNOWN";
}

std::string_view statement_kind_name(const Statement& statement) noexcept
{
    return std::visit(overloaded{[](const SelectStatement&) -> std::string_view { return "SELECT"; },
                                 [](const InsertStatement&) -> std::string_view { return "INSERT"; },
                                 [](const UpdateStatement&) -> std::string_view { return "UPDATE"; },
                                 [](const DeleteStatement&) -> std::string_view { return "DELETE"; },
                                 [](const CreateTableStatement&) -> std::string_view { return "CREATE TABLE"; },
                                 [](const CreateIndexStatement&) -> std::string_view { return "CREATE INDEX"; },
                                 [](const DropTableStatement&) -> std::string_view { return "DROP TABLE"; }},
                      statement);
}

std::string describe_condition(const Condition& condition)
{
    return std::visit(overloaded{[](const Comparison& comparison) {
                                     return comparison.column + " " + std::string{comparison_op_symbol(comparison.op)}
                                            + " " + literal_text(comparison.value);
                                 },
                                 [](const Logical& logical) {
                                     return "(" + describe_condition(*logical.left)
                                            + (logical.op == LogicalOp::And ? " AND " : " OR ")
                                            + describe_condition(*logical.right) + ")";
                                 }},
                      condition.node);
}

}  // namespace reldb::parser
