#include "reldb/parser/tokenizer.hpp"

#include "reldb/common/errors.hpp"

#include <tao/pegtl.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

namespace reldb::parser {

namespace pegtl = tao::pegtl;

namespace {

constexpr std::array<std::string_view, 39> kKeywords{
    "SELECT", "FROM",  "WHERE",  "INSERT",  "INTO",    "VALUES",  "UPDATE", "SET",   "DELETE", "CREATE",
    "TABLE",  "DROP",  "INDEX",  "ON",      "PRIMARY", "KEY",     "UNIQUE", "NOT",   "NULL",   "DEFAULT",
    "AND",    "OR",    "JOIN",   "INNER",   "LEFT",    "RIGHT",   "OUTER",  "ORDER", "BY",     "ASC",
    "DESC",   "LIMIT", "INT",    "VARCHAR", "FLOAT",   "BOOLEAN", "DATETIME", "TRUE", "FALSE"};

namespace lexer {

struct whitespace : pegtl::plus<pegtl::space> {
};

struct comment : pegtl::seq<pegtl::string<'-', '-'>, pegtl::until<pegtl::eolf>> {
};

template <char Quote>
struct quoted
    : pegtl::seq<pegtl::one<Quote>,
                 pegtl::star<pegtl::sor<pegtl::seq<pegtl::one<'\\'>, pegtl::any>, pegtl::not_one<Quote, '\\'>>>,
                 pegtl::one<Quote>> {
};

struct string_literal : pegtl::sor<quoted<'\''>, quoted<'"'>> {
};

// Only reached when string_literal failed to find its closing quote.
struct unterminated_string : pegtl::seq<pegtl::one<'\'', '"'>, pegtl::star<pegtl::any>> {
};

struct number_literal
    : pegtl::seq<pegtl::opt<pegtl::one<'-'>>, pegtl::plus<pegtl::digit>, pegtl::opt<pegtl::one<'.'>, pegtl::star<pegtl::digit>>> {
};

struct word : pegtl::identifier {
};

struct operator_symbol
    : pegtl::sor<pegtl::string<'<', '='>,
                 pegtl::string<'>', '='>,
                 pegtl::string<'!', '='>,
                 pegtl::string<'<', '>'>,
                 pegtl::one<'=', '<', '>', '!'>> {
};

struct punctuation : pegtl::one<'(', ')', ',', ';', '.', '*'> {
};

struct invalid_character : pegtl::any {
};

struct token
    : pegtl::sor<whitespace,
                 comment,
                 string_literal,
                 unterminated_string,
                 number_literal,
                 word,
                 operator_symbol,
                 punctuation,
                 invalid_character> {
};

struct grammar : pegtl::seq<pegtl::star<token>, pegtl::eof> {
};

}  // namespace lexer

std::string uppercase_copy(std::string_view text)
{
    std::string upper;
    upper.reserve(text.size());
    for (const unsigned char ch : text) {
        upper.push_back(static_cast<char>(std::toupper(ch)));
    }
    return upper;
}

// Drops the quotes; a backslash keeps the following character verbatim.
std::string unquote(std::string_view literal)
{
    const auto body = literal.substr(1U, literal.size() - 2U);
    std::string text;
    text.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        if (body[index] == '\\' && index + 1U < body.size()) {
            ++index;
        }
        text.push_back(body[index]);
    }
    return text;
}

template <typename Input>
std::size_t offset_of(const Input& in)
{
    return static_cast<std::size_t>(in.position().byte);
}

template <typename Rule>
struct token_action {
    template <typename Input>
    static void apply(const Input&, std::vector<Token>&)
    {
    }
};

template <>
struct token_action<lexer::string_literal> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::String, unquote(in.string()), offset_of(in)});
    }
};

template <>
struct token_action<lexer::unterminated_string> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>&)
    {
        throw_error(Errc::Syntax, "Unterminated string literal at position " + std::to_string(offset_of(in)));
    }
};

template <>
struct token_action<lexer::number_literal> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::Number, in.string(), offset_of(in)});
    }
};

template <>
struct token_action<lexer::word> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        auto text = in.string();
        auto upper = uppercase_copy(text);
        if (is_reserved_keyword(upper)) {
            tokens.push_back(Token{TokenKind::Keyword, std::move(upper), offset_of(in)});
        } else {
            tokens.push_back(Token{TokenKind::Identifier, std::move(text), offset_of(in)});
        }
    }
};

template <>
struct token_action<lexer::operator_symbol> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::Operator, in.string(), offset_of(in)});
    }
};

template <>
struct token_action<lexer::punctuation> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>& tokens)
    {
        tokens.push_back(Token{TokenKind::Punct, in.string(), offset_of(in)});
    }
};

template <>
struct token_action<lexer::invalid_character> {
    template <typename Input>
    static void apply(const Input& in, std::vector<Token>&)
    {
        throw_error(Errc::Syntax,
                    "Unexpected character '" + in.string() + "' at position " + std::to_string(offset_of(in)));
    }
};

}  // namespace

std::string_view token_kind_name(TokenKind kind) noexcept
{
    switch (kind) {
    case TokenKind::Keyword:
        return "keyword";
    case TokenKind::Identifier:
        return "identifier";
    case TokenKind::String:
        return "string";
    case TokenKind::Number:
        return "number";
    case TokenKind::Operator:
        return "operator";
    case TokenKind::Punct:
        return "punctuation";
    }
    return "unknown";
}

bool is_reserved_keyword(std::string_view upper) noexcept
{
    return std::find(kKeywords.begin(), kKeywords.end(), upper) != kKeywords.end();
}

std::vector<Token> tokenize(std::string_view sql)
{
    pegtl::memory_input in(sql.data(), sql.size(), "sql");
    std::vector<Token> tokens;
    try {
        if (!pegtl::parse<lexer::grammar, token_action>(in, tokens)) {
            throw_error(Errc::Syntax, "Unable to tokenize query");
        }
    } catch (const pegtl::parse_error& error) {
        std::string message = "Unable to tokenize query";
        if (!error.positions().empty()) {
            message += " at position " + std::to_string(error.positions().front().byte);
        }
        throw_error(Errc::Syntax, message);
    }
    return tokens;
}

}  // namespace reldb::parser
