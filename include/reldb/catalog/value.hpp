#pragma once

#include <compare>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

namespace reldb::catalog {

enum class ValueType : std::uint8_t {
    Null = 0,
    Integer,
    Float,
    Text,
    Boolean,
    Timestamp
};

// Seconds since the Unix epoch, UTC, second precision.
struct Timestamp final {
    std::int64_t seconds = 0;

    friend bool operator==(const Timestamp&, const Timestamp&) = default;
    friend auto operator<=>(const Timestamp&, const Timestamp&) = default;
};

class Value final {
public:
    using Storage = std::variant<std::monostate, std::int64_t, double, std::string, bool, Timestamp>;

    Value() = default;

    static Value null();
    static Value integer(std::int64_t value);
    static Value floating(double value);
    static Value text(std::string value);
    static Value boolean(bool value);
    static Value timestamp(Timestamp value);

    [[nodiscard]] ValueType type() const noexcept;
    [[nodiscard]] bool is_null() const noexcept;
    [[nodiscard]] bool is_numeric() const noexcept;

    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_float() const;
    [[nodiscard]] const std::string& as_text() const;
    [[nodiscard]] bool as_boolean() const;
    [[nodiscard]] Timestamp as_timestamp() const;

    [[nodiscard]] const Storage& storage() const noexcept;

    // Display form; also the VARCHAR coercion of non-text values.
    [[nodiscard]] std::string to_string() const;

private:
    explicit Value(Storage storage);

    Storage storage_{};
};

[[nodiscard]] std::string_view value_type_name(ValueType type) noexcept;

// SQL-style comparison used by WHERE and JOIN. Integers, floats and booleans
// compare numerically, timestamps compare against text that parses as a
// timestamp. Returns nullopt when either side is null or the types are not
// comparable.
[[nodiscard]] std::optional<std::strong_ordering> compare_values(const Value& lhs, const Value& rhs);

// Equality used by '=' and joins: null equals null, otherwise compare_values.
[[nodiscard]] bool values_equal(const Value& lhs, const Value& rhs);

// Total order over every value, used for index keys and sorting. Types rank
// Null < Boolean < numeric < Timestamp < Text; numerics compare by value.
[[nodiscard]] std::strong_ordering total_order(const Value& lhs, const Value& rhs) noexcept;

struct ValueLess final {
    bool operator()(const Value& lhs, const Value& rhs) const noexcept
    {
        return total_order(lhs, rhs) < 0;
    }
};

struct ValueKeyEqual final {
    bool operator()(const Value& lhs, const Value& rhs) const noexcept
    {
        return total_order(lhs, rhs) == 0;
    }
};

struct ValueHash final {
    std::size_t operator()(const Value& value) const noexcept;
};

[[nodiscard]] std::optional<Timestamp> parse_timestamp(std::string_view text);
[[nodiscard]] std::string format_timestamp(Timestamp value);
[[nodiscard]] std::string format_float(double value);

}  // namespace reldb::catalog
