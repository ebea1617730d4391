#pragma once

#include <string>
#include <system_error>

namespace reldb {

enum class Errc {
    Success = 0,
    Syntax,
    Schema,
    Constraint,
    Execution,
    Storage
};

const std::error_category& reldb_error_category() noexcept;
std::error_code make_error_code(Errc value) noexcept;

[[noreturn]] void throw_error(Errc code, const std::string& message);

}  // namespace reldb

namespace std {

template <>
struct is_error_code_enum<reldb::Errc> : true_type {
};

}  // namespace std
