#include "reldb/common/errors.hpp"
#include "reldb/parser/tokenizer.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>
#include <vector>

using reldb::Errc;
using reldb::parser::Token;
using reldb::parser::TokenKind;
using reldb::parser::tokenize;
using reldb::test::error_code_of;

namespace {

std::vector<std::string> texts(const std::vector<Token>& tokens)
{
    std::vector<std::string> result;
    for (const auto& token : tokens) {
        result.push_back(token.text);
    }
    return result;
}

}  // namespace

TEST_CASE("Tokenizer uppercases keywords and keeps identifiers")
{
    const auto tokens = tokenize("select Name from Users");
    REQUIRE(tokens.size() == 4U);
    CHECK(tokens[0].is_keyword("SELECT"));
    CHECK(tokens[1].kind == TokenKind::Identifier);
    CHECK(tokens[1].text == "Name");
    CHECK(tokens[2].is_keyword("FROM"));
    CHECK(tokens[3].text == "Users");
}

TEST_CASE("Tokenizer records byte offsets")
{
    const auto tokens = tokenize("SELECT  id FROM t");
    REQUIRE(tokens.size() == 4U);
    CHECK(tokens[0].offset == 0U);
    CHECK(tokens[1].offset == 8U);
    CHECK(tokens[2].offset == 11U);
    CHECK(tokens[3].offset == 16U);
}

TEST_CASE("Tokenizer reads numbers including negatives and decimals")
{
    const auto tokens = tokenize("42 -7 3.25 10.");
    REQUIRE(tokens.size() == 4U);
    for (const auto& token : tokens) {
        CHECK(token.kind == TokenKind::Number);
    }
    CHECK(texts(tokens) == std::vector<std::string>{"42", "-7", "3.25", "10."});
}

TEST_CASE("Tokenizer unescapes string literals in either quote style")
{
    const auto tokens = tokenize(R"('it\'s' "say \"hi\"" '')");
    REQUIRE(tokens.size() == 3U);
    CHECK(tokens[0].kind == TokenKind::String);
    CHECK(tokens[0].text == "it's");
    CHECK(tokens[1].text == "say \"hi\"");
    CHECK(tokens[2].text.empty());
}

TEST_CASE("Tokenizer prefers two-character operators")
{
    const auto tokens = tokenize("a<=1 b>=2 c!=3 d<>4 e<5");
    std::vector<std::string> operators;
    for (const auto& token : tokens) {
        if (token.kind == TokenKind::Operator) {
            operators.push_back(token.text);
        }
    }
    CHECK(operators == std::vector<std::string>{"<=", ">=", "!=", "<>", "<"});
}

TEST_CASE("Tokenizer splits qualified names into parts")
{
    const auto tokens = tokenize("users.id, *;");
    CHECK(texts(tokens) == std::vector<std::string>{"users", ".", "id", ",", "*", ";"});
    CHECK(tokens[1].kind == TokenKind::Punct);
}

TEST_CASE("Tokenizer skips line comments")
{
    const auto tokens = tokenize("SELECT -- everything\n* FROM t -- trailing");
    CHECK(texts(tokens) == std::vector<std::string>{"SELECT", "*", "FROM", "t"});
}

TEST_CASE("Tokenizer rejects unexpected characters and open strings")
{
    const auto syntax = reldb::make_error_code(Errc::Syntax);
    CHECK(error_code_of([] { (void)tokenize("SELECT # FROM t"); }) == syntax);
    CHECK(error_code_of([] { (void)tokenize("SELECT 'open FROM t"); }) == syntax);
}

TEST_CASE("Tokenizer handles empty and blank input")
{
    CHECK(tokenize("").empty());
    CHECK(tokenize("  \n\t ").empty());
}
