#pragma once

#include "reldb/catalog/column.hpp"
#include "reldb/catalog/value.hpp"
#include "reldb/storage/index.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/storage/table.hpp"

#include <cstdint>

namespace reldb::storage {

inline constexpr std::int64_t kSnapshotFormatVersion = 1;

// Column values are stored in their natural JSON form; timestamps as
// "YYYY-MM-DD HH:MM:SS" strings.
[[nodiscard]] JsonValue encode_value(const catalog::Value& value);
[[nodiscard]] catalog::Value decode_value(const JsonValue& json, const catalog::Column& column);
// Type-less decoding for column defaults.
[[nodiscard]] catalog::Value decode_literal(const JsonValue& json);

[[nodiscard]] JsonValue encode_column(const catalog::Column& column);
[[nodiscard]] catalog::Column decode_column(const JsonValue& json);

// B-tree: {column_name, order, size, entries: [[key, slot], ...]}.
// Hash:   {column_name, index: {"<key>": [slot, ...]}}.
[[nodiscard]] JsonValue encode_index(const Index& index);
[[nodiscard]] IndexPtr decode_index(const JsonValue& json, const catalog::Column& column);

[[nodiscard]] JsonValue encode_table(const Table& table);
[[nodiscard]] Table decode_table(const JsonValue& json, std::size_t btree_order);

}  // namespace reldb::storage
