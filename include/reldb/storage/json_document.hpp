#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace reldb::storage {

struct JsonMember;

// Minimal JSON document model used by the snapshot file and the tool output.
// Objects keep their members in insertion order.
class JsonValue final {
public:
    enum class Kind : std::uint8_t {
        Null = 0,
        Boolean,
        Integer,
        Number,
        String,
        Array,
        Object
    };

    using Array = std::vector<JsonValue>;
    using Object = std::vector<JsonMember>;

    JsonValue() = default;

    static JsonValue null();
    static JsonValue boolean(bool value);
    static JsonValue integer(std::int64_t value);
    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue array(Array values = {});
    static JsonValue object(Object members = {});

    [[nodiscard]] Kind kind() const noexcept;
    [[nodiscard]] bool is_null() const noexcept;

    // Typed accessors throw Errc::Storage on a kind mismatch.
    [[nodiscard]] bool as_boolean() const;
    [[nodiscard]] std::int64_t as_integer() const;
    [[nodiscard]] double as_number() const;
    [[nodiscard]] const std::string& as_string() const;
    [[nodiscard]] const Array& as_array() const;
    [[nodiscard]] Array& as_array();
    [[nodiscard]] const Object& as_object() const;
    [[nodiscard]] Object& as_object();

    [[nodiscard]] const JsonValue* find(std::string_view key) const;
    [[nodiscard]] const JsonValue& at(std::string_view key) const;

    // Object only: replaces an existing member or appends a new one.
    void set(std::string key, JsonValue value);
    // Array only.
    void push_back(JsonValue value);

private:
    using Storage = std::variant<std::monostate, bool, std::int64_t, double, std::string, Array, Object>;

    explicit JsonValue(Storage storage);

    Storage storage_{};
};

struct JsonMember final {
    std::string key{};
    JsonValue value{};
};

[[nodiscard]] std::string_view json_kind_name(JsonValue::Kind kind) noexcept;

// Throws std::system_error(Errc::Storage) describing the failing position.
[[nodiscard]] JsonValue parse_json(std::string_view text, const std::string& source = "json");

// indent == 0 renders a single line.
[[nodiscard]] std::string write_json(const JsonValue& value, unsigned indent = 0U);

void append_json_string(std::string& out, std::string_view value);

}  // namespace reldb::storage
