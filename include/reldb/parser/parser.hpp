#pragma once

#include "reldb/parser/ast.hpp"
#include "reldb/parser/token.hpp"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace reldb::parser {

// Recursive-descent parser over a token sequence. One statement per parse,
// optionally followed by ';'. Every mismatch throws
// std::system_error(Errc::Syntax) naming the expected and found tokens.
class Parser final {
public:
    explicit Parser(std::vector<Token> tokens);

    [[nodiscard]] Statement parse();

private:
    [[nodiscard]] const Token* peek() const noexcept;
    const Token& advance();
    [[nodiscard]] bool at_keyword(std::string_view keyword) const noexcept;
    [[nodiscard]] bool at_punct(std::string_view punct) const noexcept;
    bool accept_keyword(std::string_view keyword);
    bool accept_punct(std::string_view punct);

    void expect_keyword(std::string_view keyword);
    void expect_punct(std::string_view punct);
    void expect_operator(std::string_view symbol);
    std::string expect_identifier(std::string_view what);
    [[noreturn]] void fail_expected(std::string_view expected) const;

    std::string parse_column_reference(std::string_view what);
    catalog::Value parse_literal(std::string_view what);
    std::size_t parse_unsigned(std::string_view what);

    SelectStatement parse_select();
    JoinClause parse_join(JoinType type);
    ConditionPtr parse_condition();
    ConditionPtr parse_comparison();
    OrderBy parse_order_by();
    InsertStatement parse_insert();
    UpdateStatement parse_update();
    DeleteStatement parse_delete();
    Statement parse_create();
    CreateTableStatement parse_create_table();
    catalog::Column parse_column_definition();
    CreateIndexStatement parse_create_index();
    DropTableStatement parse_drop();

    std::vector<Token> tokens_{};
    std::size_t position_ = 0U;
};

[[nodiscard]] Statement parse(std::vector<Token> tokens);
// tokenize + parse.
[[nodiscard]] Statement parse_sql(std::string_view sql);

// Splits a script on top-level ';' tokens. Semicolons inside string literals
// and comments do not split; segments holding no tokens are dropped.
[[nodiscard]] std::vector<std::string> split_statements(std::string_view script);

}  // namespace reldb::parser
