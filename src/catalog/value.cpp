#include "reldb/catalog/value.hpp"

#include <array>
#include <charconv>
#include <chrono>
#include <cstdio>
#include <functional>
#include <utility>

namespace reldb::catalog {

namespace {

bool read_fixed_digits(std::string_view text, std::size_t position, std::size_t count, unsigned& out) noexcept
{
    if (position + count > text.size()) {
        return false;
    }
    unsigned value = 0U;
    for (std::size_t index = position; index < position + count; ++index) {
        const char ch = text[index];
        if (ch < '0' || ch > '9') {
            return false;
        }
        value = value * 10U + static_cast<unsigned>(ch - '0');
    }
    out = value;
    return true;
}

// Parses "YYYY-MM-DD" followed by an optional "<separator>HH:MM:SS".
std::optional<Timestamp> parse_with_layout(std::string_view text, bool with_time, char separator)
{
    const std::size_t expected_size = with_time ? 19U : 10U;
    if (text.size() != expected_size) {
        return std::nullopt;
    }

    unsigned year = 0U;
    unsigned month = 0U;
    unsigned day = 0U;
    if (!read_fixed_digits(text, 0U, 4U, year) || text[4] != '-' || !read_fixed_digits(text, 5U, 2U, month)
        || text[7] != '-' || !read_fixed_digits(text, 8U, 2U, day)) {
        return std::nullopt;
    }
    const std::chrono::year_month_day date{
        std::chrono::year{static_cast<int>(year)}, std::chrono::month{month}, std::chrono::day{day}};
    if (!date.ok()) {
        return std::nullopt;
    }

    unsigned hour = 0U;
    unsigned minute = 0U;
    unsigned second = 0U;
    if (with_time) {
        if (text[10] != separator || !read_fixed_digits(text, 11U, 2U, hour) || text[13] != ':'
            || !read_fixed_digits(text, 14U, 2U, minute) || text[16] != ':'
            || !read_fixed_digits(text, 17U, 2U, second)) {
            return std::nullopt;
        }
        if (hour > 23U || minute > 59U || second > 59U) {
            return std::nullopt;
        }
    }

    const auto point = std::chrono::sys_days{date} + std::chrono::hours{hour} + std::chrono::minutes{minute}
                       + std::chrono::seconds{second};
    Timestamp timestamp{};
    timestamp.seconds = point.time_since_epoch().count();
    return timestamp;
}

constexpr int type_rank(ValueType type) noexcept
{
    switch (type) {
    case ValueType::Null:
        return 0;
    case ValueType::Boolean:
        return 1;
    case ValueType::Integer:
    case ValueType::Float:
        return 2;
    case ValueType::Timestamp:
        return 3;
    case ValueType::Text:
        return 4;
    }
    return 5;
}

template <typename T>
std::strong_ordering order_of(const T& lhs, const T& rhs) noexcept
{
    if (lhs < rhs) {
        return std::strong_ordering::less;
    }
    if (rhs < lhs) {
        return std::strong_ordering::greater;
    }
    return std::strong_ordering::equal;
}

double numeric_value(const Value& value) noexcept
{
    switch (value.type()) {
    case ValueType::Integer:
        return static_cast<double>(std::get<std::int64_t>(value.storage()));
    case ValueType::Float:
        return std::get<double>(value.storage());
    case ValueType::Boolean:
        return std::get<bool>(value.storage()) ? 1.0 : 0.0;
    default:
        return 0.0;
    }
}

bool numeric_like(const Value& value) noexcept
{
    return value.is_numeric() || value.type() == ValueType::Boolean;
}

std::strong_ordering compare_numeric(const Value& lhs, const Value& rhs) noexcept
{
    if (lhs.type() == ValueType::Integer && rhs.type() == ValueType::Integer) {
        return order_of(std::get<std::int64_t>(lhs.storage()), std::get<std::int64_t>(rhs.storage()));
    }
    return order_of(numeric_value(lhs), numeric_value(rhs));
}

}  // namespace

Value::Value(Storage storage)
    : storage_{std::move(storage)}
{}

Value Value::null()
{
    return Value{};
}

Value Value::integer(std::int64_t value)
{
    return Value{Storage{std::in_place_type<std::int64_t>, value}};
}

Value Value::floating(double value)
{
    return Value{Storage{std::in_place_type<double>, value}};
}

Value Value::text(std::string value)
{
    return Value{Storage{std::in_place_type<std::string>, std::move(value)}};
}

Value Value::boolean(bool value)
{
    return Value{Storage{std::in_place_type<bool>, value}};
}

Value Value::timestamp(Timestamp value)
{
    return Value{Storage{std::in_place_type<Timestamp>, value}};
}

ValueType Value::type() const noexcept
{
    switch (storage_.index()) {
    case 1U:
        return ValueType::Integer;
    case 2U:
        return ValueType::Float;
    case 3U:
        return ValueType::Text;
    case 4U:
        return ValueType::Boolean;
    case 5U:
        return ValueType::Timestamp;
    default:
        return ValueType::Null;
    }
}

bool Value::is_null() const noexcept
{
    return std::holds_alternative<std::monostate>(storage_);
}

bool Value::is_numeric() const noexcept
{
    return std::holds_alternative<std::int64_t>(storage_) || std::holds_alternative<double>(storage_);
}

std::int64_t Value::as_integer() const
{
    return std::get<std::int64_t>(storage_);
}

double Value::as_float() const
{
    return std::get<double>(storage_);
}

const std::string& Value::as_text() const
{
    return std::get<std::string>(storage_);
}

bool Value::as_boolean() const
{
    return std::get<bool>(storage_);
}

Timestamp Value::as_timestamp() const
{
    return std::get<Timestamp>(storage_);
}

const Value::Storage& Value::storage() const noexcept
{
    return storage_;
}

std::string Value::to_string() const
{
    switch (type()) {
    case ValueType::Null:
        return "NULL";
    case ValueType::Integer:
        return std::to_string(as_integer());
    case ValueType::Float:
        return format_float(as_float());
    case ValueType::Text:
        return as_text();
    case ValueType::Boolean:
        return as_boolean() ? "true" : "false";
    case ValueType::Timestamp:
        return format_timestamp(as_timestamp());
    }
    return {};
}

std::string_view value_type_name(ValueType type) noexcept
{
    switch (type) {
    case ValueType::Null:
        return "NULL";
    case ValueType::Integer:
        return "INT";
    case ValueType::Float:
        return "FLOAT";
    case ValueType::Text:
        return "TEXT";
    case ValueType::Boolean:
        return "BOOLEAN";
    case ValueType::Timestamp:
        return "DATETIME";
    }
    return "UNKNOWN";
}

std::optional<std::strong_ordering> compare_values(const Value& lhs, const Value& rhs)
{
    if (lhs.is_null() || rhs.is_null()) {
        return std::nullopt;
    }

    if (numeric_like(lhs) && numeric_like(rhs)) {
        return compare_numeric(lhs, rhs);
    }

    if (lhs.type() == ValueType::Text && rhs.type() == ValueType::Text) {
        return order_of(lhs.as_text(), rhs.as_text());
    }

    if (lhs.type() == ValueType::Timestamp && rhs.type() == ValueType::Timestamp) {
        return order_of(lhs.as_timestamp(), rhs.as_timestamp());
    }

    if (lhs.type() == ValueType::Timestamp && rhs.type() == ValueType::Text) {
        if (const auto parsed = parse_timestamp(rhs.as_text()); parsed) {
            return order_of(lhs.as_timestamp(), *parsed);
        }
        return std::nullopt;
    }

    if (lhs.type() == ValueType::Text && rhs.type() == ValueType::Timestamp) {
        if (const auto parsed = parse_timestamp(lhs.as_text()); parsed) {
            return order_of(*parsed, rhs.as_timestamp());
        }
        return std::nullopt;
    }

    return std::nullopt;
}

bool values_equal(const Value& lhs, const Value& rhs)
{
    if (lhs.is_null() || rhs.is_null()) {
        return lhs.is_null() && rhs.is_null();
    }
    const auto ordering = compare_values(lhs, rhs);
    return ordering.has_value() && *ordering == 0;
}

std::strong_ordering total_order(const Value& lhs, const Value& rhs) noexcept
{
    const auto lhs_rank = type_rank(lhs.type());
    const auto rhs_rank = type_rank(rhs.type());
    if (lhs_rank != rhs_rank) {
        return lhs_rank <=> rhs_rank;
    }

    switch (lhs.type()) {
    case ValueType::Null:
        return std::strong_ordering::equal;
    case ValueType::Boolean:
        return order_of(std::get<bool>(lhs.storage()), std::get<bool>(rhs.storage()));
    case ValueType::Integer:
    case ValueType::Float:
        return compare_numeric(lhs, rhs);
    case ValueType::Timestamp:
        return order_of(std::get<Timestamp>(lhs.storage()), std::get<Timestamp>(rhs.storage()));
    case ValueType::Text:
        return order_of(std::get<std::string>(lhs.storage()), std::get<std::string>(rhs.storage()));
    }
    return std::strong_ordering::equal;
}

std::size_t ValueHash::operator()(const Value& value) const noexcept
{
    switch (value.type()) {
    case ValueType::Null:
        return 0U;
    case ValueType::Boolean:
        return std::hash<bool>{}(std::get<bool>(value.storage()));
    case ValueType::Integer:
    case ValueType::Float:
        // Integers hash through double so 1 and 1.0 land in the same bucket.
        return std::hash<double>{}(numeric_value(value));
    case ValueType::Timestamp:
        return std::hash<std::int64_t>{}(std::get<Timestamp>(value.storage()).seconds);
    case ValueType::Text:
        return std::hash<std::string>{}(std::get<std::string>(value.storage()));
    }
    return 0U;
}

std::optional<Timestamp> parse_timestamp(std::string_view text)
{
    if (auto parsed = parse_with_layout(text, true, ' '); parsed) {
        return parsed;
    }
    if (auto parsed = parse_with_layout(text, false, ' '); parsed) {
        return parsed;
    }
    return parse_with_layout(text, true, 'T');
}

std::string format_timestamp(Timestamp value)
{
    const std::chrono::sys_seconds point{std::chrono::seconds{value.seconds}};
    const auto day_point = std::chrono::floor<std::chrono::days>(point);
    const std::chrono::year_month_day date{day_point};
    const std::chrono::hh_mm_ss time{point - day_point};

    std::array<char, 32> buffer{};
    std::snprintf(buffer.data(),
                  buffer.size(),
                  "%04d-%02u-%02u %02d:%02d:%02d",
                  static_cast<int>(date.year()),
                  static_cast<unsigned>(date.month()),
                  static_cast<unsigned>(date.day()),
                  static_cast<int>(time.hours().count()),
                  static_cast<int>(time.minutes().count()),
                  static_cast<int>(time.seconds().count()));
    return std::string{buffer.data()};
}

std::string format_float(double value)
{
    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    if (ec != std::errc{}) {
        return std::to_string(value);
    }
    std::string text{buffer.data(), end};
    if (text.find_first_of(".eEn") == std::string::npos) {
        text.append(".0");
    }
    return text;
}

}  // namespace reldb::catalog
