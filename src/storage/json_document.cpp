#include "reldb/storage/json_document.hpp"

#include "reldb/common/errors.hpp"

#include <tao/pegtl.hpp>
#include <tao/pegtl/contrib/json.hpp>

#include <array>
#include <charconv>
#include <cmath>
#include <cstdlib>
#include <utility>

namespace reldb::storage {

namespace pegtl = tao::pegtl;

namespace {

struct document : pegtl::must<pegtl::json::text, pegtl::eof> {
};

struct BuildState final {
    std::vector<JsonValue> values{};
    std::vector<std::string> keys{};
};

void append_utf8(std::string& out, std::uint32_t code_point)
{
    if (code_point < 0x80U) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800U) {
        out.push_back(static_cast<char>(0xC0U | (code_point >> 6U)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else if (code_point < 0x10000U) {
        out.push_back(static_cast<char>(0xE0U | (code_point >> 12U)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    } else {
        out.push_back(static_cast<char>(0xF0U | (code_point >> 18U)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 12U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | ((code_point >> 6U) & 0x3FU)));
        out.push_back(static_cast<char>(0x80U | (code_point & 0x3FU)));
    }
}

std::uint32_t read_hex4(std::string_view text, std::size_t position)
{
    std::uint32_t code = 0U;
    static_cast<void>(std::from_chars(text.data() + position, text.data() + position + 4U, code, 16));
    return code;
}

// Input still carries its surrounding quotes; the grammar guarantees every
// escape is well formed.
std::string unescape(std::string_view quoted)
{
    const auto body = quoted.substr(1U, quoted.size() - 2U);
    std::string out;
    out.reserve(body.size());
    for (std::size_t index = 0U; index < body.size(); ++index) {
        const char ch = body[index];
        if (ch != '\\') {
            out.push_back(ch);
            continue;
        }
        const char code = body[++index];
        switch (code) {
        case 'b':
            out.push_back('\b');
            break;
        case 'f':
            out.push_back('\f');
            break;
        case 'n':
            out.push_back('\n');
            break;
        case 'r':
            out.push_back('\r');
            break;
        case 't':
            out.push_back('\t');
            break;
        case 'u': {
            auto code_point = read_hex4(body, index + 1U);
            index += 4U;
            const bool high_surrogate = code_point >= 0xD800U && code_point <= 0xDBFFU;
            if (high_surrogate && index + 6U < body.size() && body.substr(index + 1U, 2U) == "\\u") {
                const auto low = read_hex4(body, index + 3U);
                if (low >= 0xDC00U && low <= 0xDFFFU) {
                    code_point = 0x10000U + ((code_point - 0xD800U) << 10U) + (low - 0xDC00U);
                    index += 6U;
                }
            }
            append_utf8(out, code_point);
            break;
        }
        default:
            out.push_back(code);
            break;
        }
    }
    return out;
}

JsonValue decode_number(const std::string& text)
{
    if (text.find_first_of(".eE") == std::string::npos) {
        std::int64_t parsed = 0;
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), parsed);
        if (ec == std::errc{} && ptr == text.data() + text.size()) {
            return JsonValue::integer(parsed);
        }
    }
    return JsonValue::number(std::strtod(text.c_str(), nullptr));
}

template <typename Rule>
struct json_action {
    template <typename Input>
    static void apply(const Input&, BuildState&)
    {
    }
};

template <>
struct json_action<pegtl::json::null> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        state.values.push_back(JsonValue::null());
    }
};

template <>
struct json_action<pegtl::json::true_> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        state.values.push_back(JsonValue::boolean(true));
    }
};

template <>
struct json_action<pegtl::json::false_> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        state.values.push_back(JsonValue::boolean(false));
    }
};

template <>
struct json_action<pegtl::json::number> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        state.values.push_back(decode_number(in.string()));
    }
};

template <>
struct json_action<pegtl::json::string> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        state.values.push_back(JsonValue::string(unescape(in.string())));
    }
};

template <>
struct json_action<pegtl::json::key> {
    template <typename Input>
    static void apply(const Input& in, BuildState& state)
    {
        state.keys.push_back(unescape(in.string()));
    }
};

template <>
struct json_action<pegtl::json::begin_array> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        state.values.push_back(JsonValue::array());
    }
};

template <>
struct json_action<pegtl::json::array_element> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        auto element = std::move(state.values.back());
        state.values.pop_back();
        state.values.back().push_back(std::move(element));
    }
};

template <>
struct json_action<pegtl::json::begin_object> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        state.values.push_back(JsonValue::object());
    }
};

template <>
struct json_action<pegtl::json::member> {
    template <typename Input>
    static void apply(const Input&, BuildState& state)
    {
        auto member_value = std::move(state.values.back());
        state.values.pop_back();
        auto key = std::move(state.keys.back());
        state.keys.pop_back();
        state.values.back().set(std::move(key), std::move(member_value));
    }
};

void append_number(std::string& out, double value)
{
    if (!std::isfinite(value)) {
        out.append("null");
        return;
    }
    std::array<char, 64> buffer{};
    const auto [end, ec] = std::to_chars(buffer.data(), buffer.data() + buffer.size(), value);
    std::string text{buffer.data(), ec == std::errc{} ? end : buffer.data()};
    if (text.find_first_of(".eE") == std::string::npos) {
        text.append(".0");
    }
    out.append(text);
}

void append_newline(std::string& out, unsigned indent, unsigned depth)
{
    if (indent == 0U) {
        return;
    }
    out.push_back('\n');
    out.append(static_cast<std::size_t>(indent) * depth, ' ');
}

void write_value(std::string& out, const JsonValue& value, unsigned indent, unsigned depth)
{
    switch (value.kind()) {
    case JsonValue::Kind::Null:
        out.append("null");
        return;
    case JsonValue::Kind::Boolean:
        out.append(value.as_boolean() ? "true" : "false");
        return;
    case JsonValue::Kind::Integer:
        out.append(std::to_string(value.as_integer()));
        return;
    case JsonValue::Kind::Number:
        append_number(out, value.as_number());
        return;
    case JsonValue::Kind::String:
        append_json_string(out, value.as_string());
        return;
    case JsonValue::Kind::Array: {
        const auto& elements = value.as_array();
        if (elements.empty()) {
            out.append("[]");
            return;
        }
        out.push_back('[');
        bool first = true;
        for (const auto& element : elements) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            append_newline(out, indent, depth + 1U);
            write_value(out, element, indent, depth + 1U);
        }
        append_newline(out, indent, depth);
        out.push_back(']');
        return;
    }
    case JsonValue::Kind::Object: {
        const auto& members = value.as_object();
        if (members.empty()) {
            out.append("{}");
            return;
        }
        out.push_back('{');
        bool first = true;
        for (const auto& member : members) {
            if (!first) {
                out.push_back(',');
            }
            first = false;
            append_newline(out, indent, depth + 1U);
            append_json_string(out, member.key);
            out.append(indent == 0U ? ":" : ": ");
            write_value(out, member.value, indent, depth + 1U);
        }
        append_newline(out, indent, depth);
        out.push_back('}');
        return;
    }
    }
}

}  // namespace

JsonValue::JsonValue(Storage storage)
    : storage_{std::move(storage)}
{}

JsonValue JsonValue::null()
{
    return JsonValue{};
}

JsonValue JsonValue::boolean(bool value)
{
    return JsonValue{Storage{std::in_place_type<bool>, value}};
}

JsonValue JsonValue::integer(std::int64_t value)
{
    return JsonValue{Storage{std::in_place_type<std::int64_t>, value}};
}

JsonValue JsonValue::number(double value)
{
    return JsonValue{Storage{std::in_place_type<double>, value}};
}

JsonValue JsonValue::string(std::string value)
{
    return JsonValue{Storage{std::in_place_type<std::string>, std::move(value)}};
}

JsonValue JsonValue::array(Array values)
{
    return JsonValue{Storage{std::in_place_type<Array>, std::move(values)}};
}

JsonValue JsonValue::object(Object members)
{
    return JsonValue{Storage{std::in_place_type<Object>, std::move(members)}};
}

JsonValue::Kind JsonValue::kind() const noexcept
{
    return static_cast<Kind>(storage_.index());
}

bool JsonValue::is_null() const noexcept
{
    return std::holds_alternative<std::monostate>(storage_);
}

namespace {

[[noreturn]] void throw_kind_mismatch(JsonValue::Kind expected, JsonValue::Kind actual)
{
    throw_error(Errc::Storage,
                "Expected JSON " + std::string{json_kind_name(expected)} + ", found " + std::string{json_kind_name(actual)});
}

}  // namespace

bool JsonValue::as_boolean() const
{
    if (const auto* value = std::get_if<bool>(&storage_); value != nullptr) {
        return *value;
    }
    throw_kind_mismatch(Kind::Boolean, kind());
}

std::int64_t JsonValue::as_integer() const
{
    if (const auto* value = std::get_if<std::int64_t>(&storage_); value != nullptr) {
        return *value;
    }
    throw_kind_mismatch(Kind::Integer, kind());
}

double JsonValue::as_number() const
{
    if (const auto* value = std::get_if<double>(&storage_); value != nullptr) {
        return *value;
    }
    if (const auto* value = std::get_if<std::int64_t>(&storage_); value != nullptr) {
        return static_cast<double>(*value);
    }
    throw_kind_mismatch(Kind::Number, kind());
}

const std::string& JsonValue::as_string() const
{
    if (const auto* value = std::get_if<std::string>(&storage_); value != nullptr) {
        return *value;
    }
    throw_kind_mismatch(Kind::String, kind());
}

const JsonValue::Array& JsonValue::as_array() const
{
    if (const auto* value = std::get_if<Array>(&storage_); value != nullptr) {
        return *value;
    }
    throw_kind_mismatch(Kind::Array, kind());
}

JsonValue::Array& JsonValue::as_array()
{
    return const_cast<Array&>(std::as_const(*this).as_array());
}

const JsonValue::Object& JsonValue::as_object() const
{
    if (const auto* value = std::get_if<Object>(&storage_); value != nullptr) {
        return *value;
    }
    throw_kind_mismatch(Kind::Object, kind());
}

JsonValue::Object& JsonValue::as_object()
{
    return const_cast<Object&>(std::as_const(*this).as_object());
}

const JsonValue* JsonValue::find(std::string_view key) const
{
    for (const auto& member : as_object()) {
        if (member.key == key) {
            return &member.value;
        }
    }
    return nullptr;
}

const JsonValue& JsonValue::at(std::string_view key) const
{
    if (const auto* value = find(key); value != nullptr) {
        return *value;
    }
    throw_error(Errc::Storage, "Missing JSON member '" + std::string{key} + "'");
}

void JsonValue::set(std::string key, JsonValue value)
{
    auto& members = as_object();
    for (auto& member : members) {
        if (member.key == key) {
            member.value = std::move(value);
            return;
        }
    }
    members.push_back(JsonMember{std::move(key), std::move(value)});
}

void JsonValue::push_back(JsonValue value)
{
    as_array().push_back(std::move(value));
}

std::string_view json_kind_name(JsonValue::Kind kind) noexcept
{
    switch (kind) {
    case JsonValue::Kind::Null:
        return "null";
    case JsonValue::Kind::Boolean:
        return "boolean";
    case JsonValue::Kind::Integer:
        return "integer";
    case JsonValue::Kind::Number:
        return "number";
    case JsonValue::Kind::String:
        return "string";
    case JsonValue::Kind::Array:
        return "array";
    case JsonValue::Kind::Object:
        return "object";
    }
    return "unknown";
}

JsonValue parse_json(std::string_view text, const std::string& source)
{
    pegtl::memory_input in(text.data(), text.size(), source);
    BuildState state{};
    try {
        if (!pegtl::parse<document, json_action>(in, state)) {
            throw_error(Errc::Storage, source + ": malformed JSON document");
        }
    } catch (const pegtl::parse_error& error) {
        std::string message = source + ": malformed JSON document";
        if (!error.positions().empty()) {
            const auto& position = error.positions().front();
            message += " at line " + std::to_string(position.line) + ", column " + std::to_string(position.column);
        }
        throw_error(Errc::Storage, message);
    }

    if (state.values.size() != 1U) {
        throw_error(Errc::Storage, source + ": malformed JSON document");
    }
    return std::move(state.values.front());
}

std::string write_json(const JsonValue& value, unsigned indent)
{
    std::string out;
    write_value(out, value, indent, 0U);
    return out;
}

void append_json_string(std::string& out, std::string_view value)
{
    out.push_back('"');
    for (const unsigned char ch : value) {
        switch (ch) {
        case '"':
            out.append("\\\"");
            break;
        case '\\':
            out.append("\\\\");
            break;
        case '\b':
            out.append("\\b");
            break;
        case '\f':
            out.append("\\f");
            break;
        case '\n':
            out.append("\\n");
            break;
        case '\r':
            out.append("\\r");
            break;
        case '\t':
            out.append("\\t");
            break;
        default:
            if (ch < 0x20U) {
                constexpr char kHex[] = "0123456789ABCDEF";
                out.append("\\u00");
                out.push_back(kHex[(ch >> 4U) & 0x0F]);
                out.push_back(kHex[ch & 0x0F]);
            } else {
                out.push_back(static_cast<char>(ch));
            }
            break;
        }
    }
    out.push_back('"');
}

}  // namespace reldb::storage
