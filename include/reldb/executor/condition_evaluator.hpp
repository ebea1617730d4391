#pragma once

#include "reldb/catalog/value.hpp"
#include "reldb/parser/ast.hpp"

namespace reldb::executor {

class Tuple;

// '=' treats null as equal to null, '!=' is its negation, ordering operators
// are false whenever the operands cannot be ordered.
[[nodiscard]] bool evaluate_comparison(const catalog::Value& lhs, parser::ComparisonOp op, const catalog::Value& rhs);

// Both sides of AND/OR are always evaluated. Missing columns read as null.
[[nodiscard]] bool evaluate_condition(const parser::Condition& condition, const Tuple& tuple);

}  // namespace reldb::executor
