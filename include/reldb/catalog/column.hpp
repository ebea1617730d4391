#pragma once

#include "reldb/catalog/value.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace reldb::catalog {

enum class DataType : std::uint8_t {
    Int = 0,
    Varchar,
    Float,
    Boolean,
    Datetime
};

[[nodiscard]] std::string_view data_type_name(DataType type) noexcept;
[[nodiscard]] std::optional<DataType> parse_data_type(std::string_view name) noexcept;

struct Column final {
    std::string name{};
    DataType data_type = DataType::Int;
    std::optional<std::size_t> length{};
    bool nullable = true;
    bool primary_key = false;
    bool unique = false;
    Value default_value{};

    // Primary key and unique columns each own exactly one index.
    [[nodiscard]] bool requires_index() const noexcept { return primary_key || unique; }

    // Primary keys never hold NULL, whatever the nullable flag says.
    [[nodiscard]] bool accepts_null() const noexcept { return nullable && !primary_key; }
};

// Coerces value to the column's data type. Null passes through unchanged.
// Throws std::system_error(Errc::Constraint) when no coercion exists.
[[nodiscard]] Value convert_value(const Column& column, const Value& value);

// Checks nullability, convertibility and VARCHAR length. Returns the
// converted value so callers store exactly what was validated.
Value validate_value(const Column& column, const Value& value);

// "name TYPE[(n)] [PRIMARY KEY] [UNIQUE] [NOT NULL]"
[[nodiscard]] std::string describe_column(const Column& column);

}  // namespace reldb::catalog
