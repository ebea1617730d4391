#include "reldb/executor/condition_evaluator.hpp"

#include "reldb/executor/tuple.hpp"

#include <type_traits>

namespace reldb::executor {

bool evaluate_comparison(const catalog::Value& lhs, parser::ComparisonOp op, const catalog::Value& rhs)
{
    switch (op) {
    case parser::ComparisonOp::Equal:
        return catalog::values_equal(lhs, rhs);
    case parser::ComparisonOp::NotEqual:
        return !catalog::values_equal(lhs, rhs);
    default:
        break;
    }

    const auto ordering = catalog::compare_values(lhs, rhs);
    if (!ordering) {
        return false;
    }
    switch (op) {
    case parser::ComparisonOp::Less:
        return *ordering < 0;
    case parser::ComparisonOp::Greater:
        return *ordering > 0;
    case parser::ComparisonOp::LessEqual:
        return *ordering <= 0;
    case parser::ComparisonOp::GreaterEqual:
        return *ordering >= 0;
    default:
        return false;
    }
}

bool evaluate_condition(const parser::Condition& condition, const Tuple& tuple)
{
    return std::visit(
        [&tuple](const auto& node) -> bool {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, parser::Comparison>) {
                return evaluate_comparison(tuple.value_or_null(node.column), node.op, node.value);
            } else {
                const bool left = node.left != nullptr && evaluate_condition(*node.left, tuple);
                const bool right = node.right != nullptr && evaluate_condition(*node.right, tuple);
                return node.op == parser::LogicalOp::And ? (left && right) : (left || right);
            }
        },
        condition.node);
}

}  // namespace reldb::executor
