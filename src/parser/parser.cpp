#include "reldb/parser/parser.hpp"

#include "reldb/common/errors.hpp"
#include "reldb/parser/tokenizer.hpp"

#include <cctype>
#include <charconv>
#include <cstdlib>
#include <utility>

namespace reldb::parser {

namespace {

std::string describe_token(const Token* token)
{
    if (token == nullptr) {
        return "end of input";
    }
    if (token->kind == TokenKind::String) {
        return "string '" + token->text + "'";
    }
    return "'" + token->text + "'";
}

catalog::Value number_value(const Token& token)
{
    const auto& text = token.text;
    if (text.find('.') != std::string::npos) {
        return catalog::Value::floating(std::strtod(text.c_str(), nullptr));
    }
    std::int64_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        throw_error(Errc::Syntax, "Integer literal " + text + " is out of range");
    }
    return catalog::Value::integer(parsed);
}

std::optional<catalog::DataType> keyword_data_type(const Token& token)
{
    if (token.kind != TokenKind::Keyword) {
        return std::nullopt;
    }
    return catalog::parse_data_type(token.text);
}

}  // namespace

Parser::Parser(std::vector<Token> tokens)
    : tokens_{std::move(tokens)}
{}

const Token* Parser::peek() const noexcept
{
    return position_ < tokens_.size() ? &tokens_[position_] : nullptr;
}

const Token& Parser::advance()
{
    if (position_ >= tokens_.size()) {
        fail_expected("token");
    }
    return tokens_[position_++];
}

bool Parser::at_keyword(std::string_view keyword) const noexcept
{
    const auto* token = peek();
    return token != nullptr && token->is_keyword(keyword);
}

bool Parser::at_punct(std::string_view punct) const noexcept
{
    const auto* token = peek();
    return token != nullptr && token->is_punct(punct);
}

bool Parser::accept_keyword(std::string_view keyword)
{
    if (!at_keyword(keyword)) {
        return false;
    }
    ++position_;
    return true;
}

bool Parser::accept_punct(std::string_view punct)
{
    if (!at_punct(punct)) {
        return false;
    }
    ++position_;
    return true;
}

void Parser::fail_expected(std::string_view expected) const
{
    throw_error(Errc::Syntax, "Expected " + std::string{expected} + ", got " + describe_token(peek()));
}

void Parser::expect_keyword(std::string_view keyword)
{
    if (!accept_keyword(keyword)) {
        fail_expected(keyword);
    }
}

void Parser::expect_punct(std::string_view punct)
{
    if (!accept_punct(punct)) {
        fail_expected("'" + std::string{punct} + "'");
    }
}

void Parser::expect_operator(std::string_view symbol)
{
    const auto* token = peek();
    if (token == nullptr || !token->is(TokenKind::Operator, symbol)) {
        fail_expected("'" + std::string{symbol} + "'");
    }
    ++position_;
}

std::string Parser::expect_identifier(std::string_view what)
{
    const auto* token = peek();
    if (token == nullptr || token->kind != TokenKind::Identifier) {
        fail_expected(what);
    }
    ++position_;
    return token->text;
}

std::string Parser::parse_column_reference(std::string_view what)
{
    auto name = expect_identifier(what);
    if (accept_punct(".")) {
        name.push_back('.');
        name.append(expect_identifier("column name after '.'"));
    }
    return name;
}

catalog::Value Parser::parse_literal(std::string_view what)
{
    const auto* token = peek();
    if (token == nullptr) {
        fail_expected(what);
    }

    switch (token->kind) {
    case TokenKind::String:
        ++position_;
        return catalog::Value::text(token->text);
    case TokenKind::Number:
        ++position_;
        return number_value(*token);
    case TokenKind::Keyword:
        if (token->text == "NULL") {
            ++position_;
            return catalog::Value::null();
        }
        if (token->text == "TRUE" || token->text == "FALSE") {
            ++position_;
            return catalog::Value::boolean(token->text == "TRUE");
        }
        break;
    case TokenKind::Identifier:
    case TokenKind::Operator:
    case TokenKind::Punct:
        break;
    }
    fail_expected(what);
}

std::size_t Parser::parse_unsigned(std::string_view what)
{
    const auto* token = peek();
    if (token == nullptr || token->kind != TokenKind::Number || token->text.find('.') != std::string::npos
        || token->text.front() == '-') {
        fail_expected(what);
    }
    std::size_t parsed = 0U;
    const auto [ptr, ec] = std::from_chars(token->text.data(), token->text.data() + token->text.size(), parsed);
    if (ec != std::errc{} || ptr != token->text.data() + token->text.size()) {
        throw_error(Errc::Syntax, "Integer literal " + token->text + " is out of range");
    }
    ++position_;
    return parsed;
}

Statement Parser::parse()
{
    const auto* first = peek();
    if (first == nullptr) {
        throw_error(Errc::Syntax, "Empty query");
    }
    if (first->kind != TokenKind::Keyword) {
        fail_expected("statement keyword");
    }

    const auto keyword = first->text;
    Statement statement;
    if (keyword == "SELECT") {
        statement = parse_select();
    } else if (keyword == "INSERT") {
        statement = parse_insert();
    } else if (keyword == "UPDATE") {
        statement = parse_update();
    } else if (keyword == "DELETE") {
        statement = parse_delete();
    } else if (keyword == "CREATE") {
        statement = parse_create();
    } else if (keyword == "DROP") {
        statement = parse_drop();
    } else {
        throw_error(Errc::Syntax, "Unsupported statement: " + keyword);
    }

    accept_punct(";");
    if (const auto* trailing = peek(); trailing != nullptr) {
        throw_error(Errc::Syntax, "Unexpected " + describe_token(trailing) + " after end of statement");
    }
    return statement;
}

SelectStatement Parser::parse_select()
{
    expect_keyword("SELECT");

    SelectStatement select{};
    do {
        if (accept_punct("*")) {
            select.columns.emplace_back("*");
        } else {
            select.columns.push_back(parse_column_reference("column name or '*'"));
        }
    } while (accept_punct(","));

    expect_keyword("FROM");
    select.table = expect_identifier("table name");

    bool seen_where = false;
    while (const auto* token = peek()) {
        if (token->kind != TokenKind::Keyword) {
            break;
        }
        if (token->text == "JOIN") {
            select.joins.push_back(parse_join(JoinType::Inner));
        } else if (token->text == "INNER") {
            ++position_;
            select.joins.push_back(parse_join(JoinType::Inner));
        } else if (token->text == "LEFT" || token->text == "RIGHT") {
            const auto type = token->text == "LEFT" ? JoinType::Left : JoinType::Right;
            ++position_;
            accept_keyword("OUTER");
            select.joins.push_back(parse_join(type));
        } else if (token->text == "WHERE") {
            if (seen_where) {
                throw_error(Errc::Syntax, "Duplicate WHERE clause");
            }
            seen_where = true;
            ++position_;
            select.where = parse_condition();
        } else if (token->text == "ORDER") {
            if (select.order_by) {
                throw_error(Errc::Syntax, "Duplicate ORDER BY clause");
            }
            select.order_by = parse_order_by();
        } else if (token->text == "LIMIT") {
            if (select.limit) {
                throw_error(Errc::Syntax, "Duplicate LIMIT clause");
            }
            ++position_;
            select.limit = parse_unsigned("non-negative integer after LIMIT");
        } else {
            break;
        }
    }
    return select;
}

JoinClause Parser::parse_join(JoinType type)
{
    expect_keyword("JOIN");
    JoinClause join{};
    join.type = type;
    join.table = expect_identifier("table name in JOIN");
    expect_keyword("ON");
    join.left_column = parse_column_reference("column name in JOIN condition");
    expect_operator("=");
    join.right_column = parse_column_reference("column name in JOIN condition");
    return join;
}

// AND and OR share one precedence level and fold left to right.
ConditionPtr Parser::parse_condition()
{
    auto condition = parse_comparison();
    while (true) {
        LogicalOp op{};
        if (accept_keyword("AND")) {
            op = LogicalOp::And;
        } else if (accept_keyword("OR")) {
            op = LogicalOp::Or;
        } else {
            break;
        }
        auto right = parse_comparison();
        condition = make_logical(op, std::move(condition), std::move(right));
    }
    return condition;
}

ConditionPtr Parser::parse_comparison()
{
    auto column = parse_column_reference("column name in condition");

    const auto* token = peek();
    if (token == nullptr || token->kind != TokenKind::Operator) {
        fail_expected("comparison operator");
    }
    const auto op = parse_comparison_op(token->text);
    if (!op) {
        fail_expected("comparison operator");
    }
    ++position_;

    auto value = parse_literal("value in condition");
    return make_comparison(std::move(column), *op, std::move(value));
}

OrderBy Parser::parse_order_by()
{
    expect_keyword("ORDER");
    expect_keyword("BY");
    OrderBy order{};
    order.column = parse_column_reference("column name in ORDER BY");
    if (accept_keyword("DESC")) {
        order.descending = true;
    } else {
        accept_keyword("ASC");
    }
    return order;
}

InsertStatement Parser::parse_insert()
{
    expect_keyword("INSERT");
    expect_keyword("INTO");

    InsertStatement insert{};
    insert.table = expect_identifier("table name");

    if (accept_punct("(")) {
        std::vector<std::string> columns;
        do {
            columns.push_back(expect_identifier("column name"));
        } while (accept_punct(","));
        expect_punct(")");
        insert.columns = std::move(columns);
    }

    expect_keyword("VALUES");
    expect_punct("(");
    do {
        insert.values.push_back(parse_literal("value"));
    } while (accept_punct(","));
    expect_punct(")");
    return insert;
}

UpdateStatement Parser::parse_update()
{
    expect_keyword("UPDATE");

    UpdateStatement update{};
    update.table = expect_identifier("table name");
    expect_keyword("SET");
    do {
        auto column = expect_identifier("column name in SET");
        expect_operator("=");
        auto value = parse_literal("value in SET");
        update.assignments.emplace_back(std::move(column), std::move(value));
    } while (accept_punct(","));

    if (accept_keyword("WHERE")) {
        update.where = parse_condition();
    }
    return update;
}

DeleteStatement Parser::parse_delete()
{
    expect_keyword("DELETE");
    expect_keyword("FROM");

    DeleteStatement remove{};
    remove.table = expect_identifier("table name");
    if (accept_keyword("WHERE")) {
        remove.where = parse_condition();
    }
    return remove;
}

Statement Parser::parse_create()
{
    expect_keyword("CREATE");
    if (at_keyword("TABLE")) {
        return parse_create_table();
    }
    if (at_keyword("INDEX")) {
        return parse_create_index();
    }
    fail_expected("TABLE or INDEX");
}

CreateTableStatement Parser::parse_create_table()
{
    expect_keyword("TABLE");

    CreateTableStatement create{};
    create.table = expect_identifier("table name");
    expect_punct("(");
    do {
        create.columns.push_back(parse_column_definition());
    } while (accept_punct(","));
    expect_punct(")");
    return create;
}

catalog::Column Parser::parse_column_definition()
{
    catalog::Column column{};
    column.name = expect_identifier("column name");

    const auto* type_token = peek();
    const auto data_type = type_token != nullptr ? keyword_data_type(*type_token) : std::nullopt;
    if (!data_type) {
        fail_expected("column type");
    }
    ++position_;
    column.data_type = *data_type;

    if (accept_punct("(")) {
        column.length = parse_unsigned("type length");
        expect_punct(")");
    }

    // Constraints may appear in any order.
    while (true) {
        if (accept_keyword("PRIMARY")) {
            expect_keyword("KEY");
            column.primary_key = true;
        } else if (accept_keyword("UNIQUE")) {
            column.unique = true;
        } else if (accept_keyword("NOT")) {
            expect_keyword("NULL");
            column.nullable = false;
        } else if (accept_keyword("DEFAULT")) {
            column.default_value = parse_literal("default value");
        } else {
            break;
        }
    }
    return column;
}

CreateIndexStatement Parser::parse_create_index()
{
    expect_keyword("INDEX");

    CreateIndexStatement create{};
    create.index_name = expect_identifier("index name");
    expect_keyword("ON");
    create.table = expect_identifier("table name");
    expect_punct("(");
    create.column = expect_identifier("column name");
    expect_punct(")");
    return create;
}

DropTableStatement Parser::parse_drop()
{
    expect_keyword("DROP");
    expect_keyword("TABLE");

    DropTableStatement drop{};
    drop.table = expect_identifier("table name");
    return drop;
}

Statement parse(std::vector<Token> tokens)
{
    Parser parser{std::move(tokens)};
    return parser.parse();
}

Statement parse_sql(std::string_view sql)
{
    return parse(tokenize(sql));
}

std::vector<std::string> split_statements(std::string_view script)
{
    std::vector<std::string> statements;
    const auto push_segment = [&](std::size_t start, std::size_t stop) {
        auto segment = script.substr(start, stop - start);
        while (!segment.empty() && std::isspace(static_cast<unsigned char>(segment.back())) != 0) {
            segment.remove_suffix(1U);
        }
        statements.emplace_back(segment);
    };

    std::size_t start = 0U;
    bool pending = false;
    for (const auto& token : tokenize(script)) {
        if (token.is_punct(";")) {
            if (pending) {
                push_segment(start, token.offset);
            }
            pending = false;
        } else if (!pending) {
            start = token.offset;
            pending = true;
        }
    }
    if (pending) {
        push_segment(start, script.size());
    }
    return statements;
}

}  // namespace reldb::parser
