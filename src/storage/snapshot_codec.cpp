#include "reldb/storage/snapshot_codec.hpp"

#include "reldb/common/errors.hpp"
#include "reldb/storage/btree_index.hpp"
#include "reldb/storage/hash_index.hpp"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace reldb::storage {

namespace {

SlotId decode_slot(const JsonValue& json)
{
    const auto slot = json.as_integer();
    if (slot < 0) {
        throw_error(Errc::Storage, "Negative row slot " + std::to_string(slot) + " in snapshot");
    }
    return static_cast<SlotId>(slot);
}

bool optional_flag(const JsonValue& object, std::string_view key, bool fallback)
{
    const auto* member = object.find(key);
    if (member == nullptr || member->is_null()) {
        return fallback;
    }
    return member->as_boolean();
}

}  // namespace

JsonValue encode_value(const catalog::Value& value)
{
    switch (value.type()) {
    case catalog::ValueType::Null:
        return JsonValue::null();
    case catalog::ValueType::Integer:
        return JsonValue::integer(value.as_integer());
    case catalog::ValueType::Float:
        return JsonValue::number(value.as_float());
    case catalog::ValueType::Text:
        return JsonValue::string(value.as_text());
    case catalog::ValueType::Boolean:
        return JsonValue::boolean(value.as_boolean());
    case catalog::ValueType::Timestamp:
        return JsonValue::string(catalog::format_timestamp(value.as_timestamp()));
    }
    return JsonValue::null();
}

catalog::Value decode_literal(const JsonValue& json)
{
    switch (json.kind()) {
    case JsonValue::Kind::Null:
        return catalog::Value::null();
    case JsonValue::Kind::Boolean:
        return catalog::Value::boolean(json.as_boolean());
    case JsonValue::Kind::Integer:
        return catalog::Value::integer(json.as_integer());
    case JsonValue::Kind::Number:
        return catalog::Value::floating(json.as_number());
    case JsonValue::Kind::String:
        return catalog::Value::text(json.as_string());
    case JsonValue::Kind::Array:
    case JsonValue::Kind::Object:
        break;
    }
    throw_error(Errc::Storage, "Unsupported JSON " + std::string{json_kind_name(json.kind())} + " literal in snapshot");
}

catalog::Value decode_value(const JsonValue& json, const catalog::Column& column)
{
    if (json.is_null()) {
        return catalog::Value::null();
    }

    try {
        return catalog::convert_value(column, decode_literal(json));
    } catch (const std::system_error& error) {
        if (error.code() != Errc::Constraint) {
            throw;
        }
        throw_error(Errc::Storage, std::string{"Corrupt snapshot value: "} + error.what());
    }
}

JsonValue encode_column(const catalog::Column& column)
{
    auto json = JsonValue::object();
    json.set("name", JsonValue::string(column.name));
    json.set("data_type", JsonValue::string(std::string{catalog::data_type_name(column.data_type)}));
    json.set("length",
             column.length.has_value() ? JsonValue::integer(static_cast<std::int64_t>(*column.length)) : JsonValue::null());
    json.set("nullable", JsonValue::boolean(column.nullable));
    json.set("primary_key", JsonValue::boolean(column.primary_key));
    json.set("unique", JsonValue::boolean(column.unique));
    json.set("default", encode_value(column.default_value));
    return json;
}

catalog::Column decode_column(const JsonValue& json)
{
    catalog::Column column{};
    column.name = json.at("name").as_string();

    const auto& type_name = json.at("data_type").as_string();
    const auto data_type = catalog::parse_data_type(type_name);
    if (!data_type) {
        throw_error(Errc::Storage, "Unknown data type '" + type_name + "' for column '" + column.name + "'");
    }
    column.data_type = *data_type;

    if (const auto* length = json.find("length"); length != nullptr && !length->is_null()) {
        const auto value = length->as_integer();
        if (value < 0) {
            throw_error(Errc::Storage, "Negative length for column '" + column.name + "'");
        }
        column.length = static_cast<std::size_t>(value);
    }
    column.nullable = optional_flag(json, "nullable", true);
    column.primary_key = optional_flag(json, "primary_key", false);
    column.unique = optional_flag(json, "unique", false);
    if (const auto* fallback = json.find("default"); fallback != nullptr) {
        column.default_value = decode_literal(*fallback);
    }
    return column;
}

JsonValue encode_index(const Index& index)
{
    auto json = JsonValue::object();
    json.set("column_name", JsonValue::string(index.column_name()));

    if (const auto* btree = dynamic_cast<const BTreeIndex*>(&index); btree != nullptr) {
        json.set("order", JsonValue::integer(static_cast<std::int64_t>(btree->order())));
        json.set("size", JsonValue::integer(static_cast<std::int64_t>(btree->size())));
        auto entries = JsonValue::array();
        for (const auto& entry : btree->entries()) {
            auto pair = JsonValue::array();
            pair.push_back(encode_value(entry.key));
            pair.push_back(JsonValue::integer(static_cast<std::int64_t>(entry.slot)));
            entries.push_back(std::move(pair));
        }
        json.set("entries", std::move(entries));
        return json;
    }

    // entries() groups equal keys together.
    auto buckets = JsonValue::object();
    for (const auto& entry : index.entries()) {
        auto key = entry.key.to_string();
        auto& members = buckets.as_object();
        if (members.empty() || members.back().key != key) {
            members.push_back(JsonMember{std::move(key), JsonValue::array()});
        }
        members.back().value.push_back(JsonValue::integer(static_cast<std::int64_t>(entry.slot)));
    }
    json.set("index", std::move(buckets));
    return json;
}

IndexPtr decode_index(const JsonValue& json, const catalog::Column& column)
{
    const auto& column_name = json.at("column_name").as_string();
    if (column_name != column.name) {
        throw_error(Errc::Storage, "Index for column '" + column_name + "' stored under '" + column.name + "'");
    }

    // The presence of "order" marks a B-tree.
    if (const auto* order = json.find("order"); order != nullptr) {
        const auto order_value = order->as_integer();
        if (order_value < 2) {
            throw_error(Errc::Storage, "Invalid B-tree order for column '" + column.name + "'");
        }
        auto index = std::make_unique<BTreeIndex>(column_name, static_cast<std::size_t>(order_value));
        for (const auto& entry : json.at("entries").as_array()) {
            const auto& pair = entry.as_array();
            if (pair.size() != 2U) {
                throw_error(Errc::Storage, "Malformed B-tree entry for column '" + column.name + "'");
            }
            index->insert(decode_value(pair[0], column), decode_slot(pair[1]));
        }
        return index;
    }

    auto index = std::make_unique<HashIndex>(column_name);
    for (const auto& bucket : json.at("index").as_object()) {
        const auto key = decode_value(JsonValue::string(bucket.key), column);
        for (const auto& slot : bucket.value.as_array()) {
            index->insert(key, decode_slot(slot));
        }
    }
    return index;
}

JsonValue encode_table(const Table& table)
{
    auto json = JsonValue::object();
    json.set("name", JsonValue::string(table.name()));

    auto columns = JsonValue::array();
    auto column_order = JsonValue::array();
    for (const auto& column : table.columns()) {
        columns.push_back(encode_column(column));
        column_order.push_back(JsonValue::string(column.name));
    }
    json.set("columns", std::move(columns));
    json.set("column_order", std::move(column_order));

    auto rows = JsonValue::array();
    for (const auto& slot : table.slots()) {
        if (!slot.occupied()) {
            rows.push_back(JsonValue::null());
            continue;
        }
        auto row = JsonValue::object();
        row.set("row_id", JsonValue::integer(static_cast<std::int64_t>(slot.row.row_id)));
        auto data = JsonValue::object();
        for (const auto& column : table.columns()) {
            const auto it = slot.row.data.find(column.name);
            data.set(column.name, it == slot.row.data.end() ? JsonValue::null() : encode_value(it->second));
        }
        row.set("data", std::move(data));
        rows.push_back(std::move(row));
    }
    json.set("rows", std::move(rows));

    auto indexes = JsonValue::object();
    for (const auto& [column_name, index] : table.indexes()) {
        indexes.set(column_name, encode_index(*index));
    }
    json.set("indexes", std::move(indexes));
    json.set("next_row_id", JsonValue::integer(static_cast<std::int64_t>(table.next_row_id())));
    return json;
}

Table decode_table(const JsonValue& json, std::size_t btree_order)
{
    std::vector<catalog::Column> columns;
    for (const auto& column : json.at("columns").as_array()) {
        columns.push_back(decode_column(column));
    }

    // column_order wins over the order of the column list when both exist.
    if (const auto* order = json.find("column_order"); order != nullptr) {
        std::vector<catalog::Column> ordered;
        for (const auto& name : order->as_array()) {
            const auto& column_name = name.as_string();
            bool found = false;
            for (auto& column : columns) {
                if (column.name == column_name) {
                    ordered.push_back(column);
                    found = true;
                    break;
                }
            }
            if (!found) {
                throw_error(Errc::Storage, "column_order names unknown column '" + column_name + "'");
            }
        }
        if (ordered.size() != columns.size()) {
            throw_error(Errc::Storage, "column_order does not cover every column");
        }
        columns = std::move(ordered);
    }

    Table table{json.at("name").as_string(), std::move(columns), btree_order};

    std::vector<RowSlot> slots;
    for (const auto& entry : json.at("rows").as_array()) {
        RowSlot slot{};
        if (!entry.is_null()) {
            slot.state = SlotState::Occupied;
            const auto row_id = entry.at("row_id").as_integer();
            if (row_id < 0) {
                throw_error(Errc::Storage, "Negative row_id in table '" + table.name() + "'");
            }
            slot.row.row_id = static_cast<std::uint64_t>(row_id);
            const auto& data = entry.at("data");
            for (const auto& column : table.columns()) {
                const auto* stored = data.find(column.name);
                slot.row.data.emplace(column.name,
                                      stored == nullptr ? catalog::Value::null() : decode_value(*stored, column));
            }
        }
        slots.push_back(std::move(slot));
    }

    const auto next_row_id = json.at("next_row_id").as_integer();
    if (next_row_id < 0) {
        throw_error(Errc::Storage, "Negative next_row_id in table '" + table.name() + "'");
    }
    table.restore_rows(std::move(slots), static_cast<std::uint64_t>(next_row_id));

    if (const auto* indexes = json.find("indexes"); indexes != nullptr) {
        for (const auto& member : indexes->as_object()) {
            const auto* column = table.find_column(member.key);
            if (column == nullptr) {
                throw_error(Errc::Storage, "Index on unknown column '" + member.key + "' in table '" + table.name() + "'");
            }
            table.restore_index(decode_index(member.value, *column));
        }
    }
    return table;
}

}  // namespace reldb::storage
