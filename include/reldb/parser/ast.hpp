#pragma once

#include "reldb/catalog/column.hpp"
#include "reldb/catalog/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>

namespace reldb::parser {

enum class ComparisonOp : std::uint8_t {
    Equal = 0,
    NotEqual,
    Less,
    Greater,
    LessEqual,
    GreaterEqual
};

enum class LogicalOp : std::uint8_t {
    And = 0,
    Or
};

[[nodiscard]] std::string_view comparison_op_symbol(ComparisonOp op) noexcept;
[[nodiscard]] std::optional<ComparisonOp> parse_comparison_op(std::string_view symbol) noexcept;

struct Condition;
using ConditionPtr = std::unique_ptr<Condition>;

// column may be qualified as "table.column".
struct Comparison final {
    std::string column{};
    ComparisonOp op = ComparisonOp::Equal;
    catalog::Value value{};
};

struct Logical final {
    LogicalOp op = LogicalOp::And;
    ConditionPtr left{};
    ConditionPtr right{};
};

struct Condition final {
    std::variant<Comparison, Logical> node{};
};

[[nodiscard]] ConditionPtr make_comparison(std::string column, ComparisonOp op, catalog::Value value);
[[nodiscard]] ConditionPtr make_logical(LogicalOp op, ConditionPtr left, ConditionPtr right);

enum class JoinType : std::uint8_t {
    Inner = 0,
    Left,
    Right
};

[[nodiscard]] std::string_view join_type_name(JoinType type) noexcept;

struct JoinClause final {
    JoinType type = JoinType::Inner;
    std::string table{};
    std::string left_column{};
    std::string right_column{};
};

struct OrderBy final {
    std::string column{};
    bool descending = false;
};

struct SelectStatement final {
    // "*" or column references in select-list order.
    std::vector<std::string> columns{};
    std::string table{};
    std::vector<JoinClause> joins{};
    ConditionPtr where{};
    std::optional<OrderBy> order_by{};
    std::optional<std::size_t> limit{};
};

struct InsertStatement final {
    std::string table{};
    std::optional<std::vector<std::string>> columns{};
    std::vector<catalog::Value> values{};
};

struct UpdateStatement final {
    std::string table{};
    std::vector<std::pair<std::string, catalog::Value>> assignments{};
    ConditionPtr where{};
};

struct DeleteStatement final {
    std::string table{};
    ConditionPtr where{};
};

struct CreateTableStatement final {
    std::string table{};
    std::vector<catalog::Column> columns{};
};

struct CreateIndexStatement final {
    std::string index_name{};
    std::string table{};
    std::string column{};
};

struct DropTableStatement final {
    std::string table{};
};

using Statement = std::variant<SelectStatement,
                               InsertStatement,
                               UpdateStatement,
                               DeleteStatement,
                               CreateTableStatement,
                               CreateIndexStatement,
                               DropTableStatement>;

// "SELECT", "INSERT", ..., "CREATE TABLE".
[[nodiscard]] std::string_view statement_kind_name(const Statement& statement) noexcept;

// Renders a condition back to SQL-like text, fully parenthesised.
[[nodiscard]] std::string describe_condition(const Condition& condition);

}  // namespace reldb::parser
