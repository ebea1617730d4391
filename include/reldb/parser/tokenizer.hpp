#pragma once

#include "reldb/parser/token.hpp"

#include <string_view>
#include <vector>

namespace reldb::parser {

// Splits SQL text into tokens, skipping whitespace and "--" comments.
// Throws std::system_error(Errc::Syntax) on an unexpected character or an
// unterminated string literal.
[[nodiscard]] std::vector<Token> tokenize(std::string_view sql);

}  // namespace reldb::parser
