#include "reldb/catalog/column.hpp"

#include "reldb/common/errors.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <limits>

namespace reldb::catalog {

namespace {

std::string lowercase_copy(std::string_view text)
{
    std::string result;
    result.reserve(text.size());
    for (const unsigned char ch : text) {
        result.push_back(static_cast<char>(std::tolower(ch)));
    }
    return result;
}

std::string_view trim_view(std::string_view text) noexcept
{
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.front())) != 0) {
        text.remove_prefix(1U);
    }
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back())) != 0) {
        text.remove_suffix(1U);
    }
    return text;
}

// Counts code points; UTF-8 continuation bytes are not characters.
std::size_t character_count(std::string_view text) noexcept
{
    return static_cast<std::size_t>(std::count_if(text.begin(), text.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0U) != 0x80U;
    }));
}

[[noreturn]] void throw_conversion(const Column& column, const Value& value, std::string_view reason)
{
    std::string message = "Type error for column '" + column.name + "': cannot convert ";
    message.append(value_type_name(value.type()));
    message.append(" value '");
    message.append(value.to_string());
    message.append("' to ");
    message.append(data_type_name(column.data_type));
    if (!reason.empty()) {
        message.append(" (");
        message.append(reason);
        message.push_back(')');
    }
    throw_error(Errc::Constraint, message);
}

Value to_integer(const Column& column, const Value& value)
{
    switch (value.type()) {
    case ValueType::Integer:
        return value;
    case ValueType::Float: {
        const double number = value.as_float();
        if (!std::isfinite(number) || number >= 9.2233720368547758e18 || number < -9.2233720368547758e18) {
            throw_conversion(column, value, "out of range");
        }
        return Value::integer(static_cast<std::int64_t>(number));
    }
    case ValueType::Boolean:
        return Value::integer(value.as_boolean() ? 1 : 0);
    case ValueType::Text: {
        auto text = trim_view(value.as_text());
        if (!text.empty() && text.front() == '+') {
            text.remove_prefix(1U);
        }
        std::int64_t parsed = 0;
        const auto* begin = text.data();
        const auto* end = text.data() + text.size();
        const auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (text.empty() || ec != std::errc{} || ptr != end) {
            throw_conversion(column, value, "invalid integer literal");
        }
        return Value::integer(parsed);
    }
    case ValueType::Timestamp:
    case ValueType::Null:
        break;
    }
    throw_conversion(column, value, {});
}

Value to_float(const Column& column, const Value& value)
{
    switch (value.type()) {
    case ValueType::Float:
        if (!std::isfinite(value.as_float())) {
            throw_conversion(column, value, "not a finite number");
        }
        return value;
    case ValueType::Integer:
        return Value::floating(static_cast<double>(value.as_integer()));
    case ValueType::Boolean:
        return Value::floating(value.as_boolean() ? 1.0 : 0.0);
    case ValueType::Text: {
        const std::string text{trim_view(value.as_text())};
        if (text.empty()) {
            throw_conversion(column, value, "invalid float literal");
        }
        char* end = nullptr;
        errno = 0;
        const double parsed = std::strtod(text.c_str(), &end);
        if (end != text.c_str() + text.size() || errno == ERANGE) {
            throw_conversion(column, value, "invalid float literal");
        }
        if (!std::isfinite(parsed)) {
            throw_conversion(column, value, "not a finite number");
        }
        return Value::floating(parsed);
    }
    case ValueType::Timestamp:
    case ValueType::Null:
        break;
    }
    throw_conversion(column, value, {});
}

Value to_boolean(const Value& value)
{
    switch (value.type()) {
    case ValueType::Boolean:
        return value;
    case ValueType::Text: {
        const auto lowered = lowercase_copy(value.as_text());
        return Value::boolean(lowered == "true" || lowered == "1" || lowered == "yes" || lowered == "t");
    }
    case ValueType::Integer:
        return Value::boolean(value.as_integer() != 0);
    case ValueType::Float:
        return Value::boolean(value.as_float() != 0.0);
    case ValueType::Timestamp:
        return Value::boolean(true);
    case ValueType::Null:
        break;
    }
    return Value::boolean(false);
}

Value to_timestamp(const Column& column, const Value& value)
{
    if (value.type() == ValueType::Timestamp) {
        return value;
    }
    if (value.type() == ValueType::Text) {
        if (const auto parsed = parse_timestamp(value.as_text()); parsed) {
            return Value::timestamp(*parsed);
        }
        throw_error(Errc::Constraint, "Type error for column '" + column.name + "': cannot parse datetime: " + value.as_text());
    }
    throw_error(Errc::Constraint, "Type error for column '" + column.name + "': invalid datetime value: " + value.to_string());
}

}  // namespace

std::string_view data_type_name(DataType type) noexcept
{
    switch (type) {
    case DataType::Int:
        return "INT";
    case DataType::Varchar:
        return "VARCHAR";
    case DataType::Float:
        return "FLOAT";
    case DataType::Boolean:
        return "BOOLEAN";
    case DataType::Datetime:
        return "DATETIME";
    }
    return "UNKNOWN";
}

std::optional<DataType> parse_data_type(std::string_view name) noexcept
{
    std::string upper;
    upper.reserve(name.size());
    for (const unsigned char ch : name) {
        upper.push_back(static_cast<char>(std::toupper(ch)));
    }
    if (upper == "INT") {
        return DataType::Int;
    }
    if (upper == "VARCHAR") {
        return DataType::Varchar;
    }
    if (upper == "FLOAT") {
        return DataType::Float;
    }
    if (upper == "BOOLEAN") {
        return DataType::Boolean;
    }
    if (upper == "DATETIME") {
        return DataType::Datetime;
    }
    return std::nullopt;
}

Value convert_value(const Column& column, const Value& value)
{
    if (value.is_null()) {
        return value;
    }

    switch (column.data_type) {
    case DataType::Int:
        return to_integer(column, value);
    case DataType::Float:
        return to_float(column, value);
    case DataType::Varchar:
        if (value.type() == ValueType::Text) {
            return value;
        }
        return Value::text(value.to_string());
    case DataType::Boolean:
        return to_boolean(value);
    case DataType::Datetime:
        return to_timestamp(column, value);
    }
    return value;
}

Value validate_value(const Column& column, const Value& value)
{
    if (value.is_null()) {
        if (!column.accepts_null()) {
            throw_error(Errc::Constraint, "Column '" + column.name + "' cannot be NULL");
        }
        return value;
    }

    auto converted = convert_value(column, value);
    if (column.data_type == DataType::Varchar && column.length.has_value()) {
        if (character_count(converted.as_text()) > *column.length) {
            throw_error(Errc::Constraint,
                        "Value exceeds maximum length " + std::to_string(*column.length) + " for column '" + column.name + "'");
        }
    }
    return converted;
}

std::string describe_column(const Column& column)
{
    std::string text = column.name;
    text.push_back(' ');
    text.append(data_type_name(column.data_type));
    if (column.data_type == DataType::Varchar && column.length.has_value()) {
        text.append("(" + std::to_string(*column.length) + ")");
    }
    if (column.primary_key) {
        text.append(" PRIMARY KEY");
    }
    if (column.unique) {
        text.append(" UNIQUE");
    }
    if (!column.nullable) {
        text.append(" NOT NULL");
    }
    if (!column.default_value.is_null()) {
        text.append(" DEFAULT ");
        text.append(column.default_value.to_string());
    }
    return text;
}

}  // namespace reldb::catalog
