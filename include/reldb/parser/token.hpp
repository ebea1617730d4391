#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace reldb::parser {

enum class TokenKind : std::uint8_t {
    Keyword = 0,
    Identifier,
    String,
    Number,
    Operator,
    Punct
};

struct Token final {
    TokenKind kind = TokenKind::Punct;
    // Keywords are uppercased; string literals hold their unescaped body.
    std::string text{};
    std::size_t offset = 0U;

    [[nodiscard]] bool is(TokenKind expected, std::string_view value) const noexcept
    {
        return kind == expected && text == value;
    }
    [[nodiscard]] bool is_keyword(std::string_view value) const noexcept { return is(TokenKind::Keyword, value); }
    [[nodiscard]] bool is_punct(std::string_view value) const noexcept { return is(TokenKind::Punct, value); }
};

[[nodiscard]] std::string_view token_kind_name(TokenKind kind) noexcept;

// Case-sensitive lookup of an already uppercased word.
[[nodiscard]] bool is_reserved_keyword(std::string_view upper) noexcept;

}  // namespace reldb::parser
