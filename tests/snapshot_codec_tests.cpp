#include "reldb/common/errors.hpp"
#include "reldb/storage/btree_index.hpp"
#include "reldb/storage/hash_index.hpp"
#include "reldb/storage/snapshot_codec.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

using reldb::Errc;
using reldb::catalog::Column;
using reldb::catalog::DataType;
using reldb::catalog::Value;
using reldb::catalog::ValueType;
using reldb::storage::BTreeIndex;
using reldb::storage::HashIndex;
using reldb::storage::IndexKind;
using reldb::storage::JsonValue;
using reldb::storage::RowData;
using reldb::storage::Table;
using reldb::test::error_code_of;

namespace {

Column column(std::string name, DataType type)
{
    Column result{};
    result.name = std::move(name);
    result.data_type = type;
    return result;
}

Table make_accounts()
{
    auto id = column("id", DataType::Int);
    id.primary_key = true;
    auto owner = column("owner", DataType::Varchar);
    owner.length = 16U;
    auto balance = column("balance", DataType::Float);
    auto opened = column("opened", DataType::Datetime);
    return Table{"accounts", {id, owner, balance, opened}, 3U};
}

RowData account(std::int64_t id, std::string owner, double balance)
{
    RowData data;
    data.emplace("id", Value::integer(id));
    data.emplace("owner", Value::text(std::move(owner)));
    data.emplace("balance", Value::floating(balance));
    data.emplace("opened", Value::text("2024-03-01 09:30:00"));
    return data;
}

}  // namespace

TEST_CASE("encode_value writes natural JSON forms")
{
    CHECK(reldb::storage::encode_value(Value::null()).is_null());
    CHECK(reldb::storage::encode_value(Value::integer(-4)).as_integer() == -4);
    CHECK(reldb::storage::encode_value(Value::floating(2.5)).as_number() == 2.5);
    CHECK(reldb::storage::encode_value(Value::boolean(true)).as_boolean());
    CHECK(reldb::storage::encode_value(Value::text("abc")).as_string() == "abc");

    const auto stamp = reldb::catalog::parse_timestamp("2024-03-01 09:30:00");
    REQUIRE(stamp.has_value());
    CHECK(reldb::storage::encode_value(Value::timestamp(*stamp)).as_string() == "2024-03-01 09:30:00");
}

TEST_CASE("decode_value converts to the column type")
{
    const auto opened = column("opened", DataType::Datetime);
    const auto decoded = reldb::storage::decode_value(JsonValue::string("2024-03-01 09:30:00"), opened);
    CHECK(decoded.type() == ValueType::Timestamp);
    CHECK(reldb::catalog::format_timestamp(decoded.as_timestamp()) == "2024-03-01 09:30:00");

    const auto amount = column("amount", DataType::Float);
    CHECK(reldb::storage::decode_value(JsonValue::integer(3), amount).type() == ValueType::Float);
    CHECK(reldb::storage::decode_value(JsonValue::null(), amount).is_null());
}

TEST_CASE("decode_value reports corrupt values as storage errors")
{
    const auto id = column("id", DataType::Int);
    CHECK(error_code_of([&] { (void)reldb::storage::decode_value(JsonValue::string("seven"), id); })
          == reldb::make_error_code(Errc::Storage));
    CHECK(error_code_of([&] { (void)reldb::storage::decode_literal(JsonValue::array()); })
          == reldb::make_error_code(Errc::Storage));
}

TEST_CASE("column definitions survive encoding")
{
    auto name = column("name", DataType::Varchar);
    name.length = 40U;
    name.nullable = false;
    name.unique = true;
    name.default_value = Value::text("anon");

    const auto json = reldb::storage::encode_column(name);
    CHECK(json.at("data_type").as_string() == "VARCHAR");
    CHECK(json.at("length").as_integer() == 40);

    const auto decoded = reldb::storage::decode_column(json);
    CHECK(decoded.name == "name");
    CHECK(decoded.data_type == DataType::Varchar);
    CHECK(decoded.length == std::optional<std::size_t>{40U});
    CHECK_FALSE(decoded.nullable);
    CHECK(decoded.unique);
    CHECK_FALSE(decoded.primary_key);
    CHECK(decoded.default_value.as_text() == "anon");
}

TEST_CASE("decode_column applies defaults for missing flags")
{
    auto json = JsonValue::object();
    json.set("name", JsonValue::string("flag"));
    json.set("data_type", JsonValue::string("BOOLEAN"));

    const auto decoded = reldb::storage::decode_column(json);
    CHECK(decoded.data_type == DataType::Boolean);
    CHECK(decoded.nullable);
    CHECK_FALSE(decoded.length.has_value());
    CHECK(decoded.default_value.is_null());

    json.set("data_type", JsonValue::string("BLOB"));
    CHECK(error_code_of([&] { (void)reldb::storage::decode_column(json); }) == reldb::make_error_code(Errc::Storage));
}

TEST_CASE("B-tree indexes record order and sorted entries")
{
    BTreeIndex index{"age", 3U};
    index.insert(Value::integer(30), 2U);
    index.insert(Value::integer(10), 0U);
    index.insert(Value::integer(20), 1U);

    const auto json = reldb::storage::encode_index(index);
    CHECK(json.at("order").as_integer() == 3);
    CHECK(json.at("size").as_integer() == 3);
    const auto& entries = json.at("entries").as_array();
    REQUIRE(entries.size() == 3U);
    CHECK(entries[0].as_array()[0].as_integer() == 10);
    CHECK(entries[2].as_array()[1].as_integer() == 2);

    const auto decoded = reldb::storage::decode_index(json, column("age", DataType::Int));
    REQUIRE(decoded->kind() == IndexKind::BTree);
    CHECK(decoded->size() == 3U);
    CHECK(decoded->search(Value::integer(20)) == std::vector<reldb::storage::SlotId>{1U});
}

TEST_CASE("hash indexes group slots by rendered key")
{
    HashIndex index{"city"};
    index.insert(Value::text("Oslo"), 0U);
    index.insert(Value::text("Oslo"), 3U);
    index.insert(Value::text("Lima"), 1U);

    const auto json = reldb::storage::encode_index(index);
    CHECK(json.find("order") == nullptr);
    const auto* oslo = json.at("index").find("Oslo");
    REQUIRE(oslo != nullptr);
    CHECK(oslo->as_array().size() == 2U);

    const auto decoded = reldb::storage::decode_index(json, column("city", DataType::Varchar));
    CHECK(decoded->kind() == IndexKind::Hash);
    CHECK(decoded->search(Value::text("Oslo")).size() == 2U);
    CHECK(decoded->search(Value::text("Lima")) == std::vector<reldb::storage::SlotId>{1U});
}

TEST_CASE("decode_index rejects indexes filed under another column")
{
    HashIndex index{"city"};
    const auto json = reldb::storage::encode_index(index);
    CHECK(error_code_of([&] { (void)reldb::storage::decode_index(json, column("town", DataType::Varchar)); })
          == reldb::make_error_code(Errc::Storage));
}

TEST_CASE("tables keep tombstones, row ids and indexes across encoding")
{
    auto table = make_accounts();
    table.insert(account(1, "ann", 10.0));
    table.insert(account(2, "bob", 20.5));
    table.insert(account(3, "cid", 0.0));
    table.create_index("owner", IndexKind::Hash);
    table.remove(1U);

    const auto json = reldb::storage::encode_table(table);
    const auto& rows = json.at("rows").as_array();
    REQUIRE(rows.size() == 3U);
    CHECK(rows[1].is_null());
    CHECK(json.at("next_row_id").as_integer() == 3);
    CHECK(json.at("column_order").as_array()[1].as_string() == "owner");

    const auto decoded = reldb::storage::decode_table(json, 3U);
    CHECK(decoded.name() == "accounts");
    CHECK(decoded.column_order() == table.column_order());
    CHECK(decoded.live_row_count() == 2U);
    CHECK(decoded.next_row_id() == 3U);
    CHECK_FALSE(decoded.slots()[1].occupied());
    CHECK(decoded.row_at(2U).data.at("owner").as_text() == "cid");
    CHECK(decoded.row_at(0U).data.at("opened").type() == ValueType::Timestamp);

    REQUIRE(decoded.index("owner") != nullptr);
    CHECK(decoded.index("owner")->kind() == IndexKind::Hash);
    REQUIRE(decoded.index("id") != nullptr);
    CHECK(decoded.index("id")->kind() == IndexKind::BTree);
    CHECK(decoded.find_by_column("id", Value::integer(2)).empty());
    CHECK(decoded.find_by_column("id", Value::integer(3)).size() == 1U);
}

TEST_CASE("decode_table honours column_order over the column list")
{
    auto table = make_accounts();
    auto json = reldb::storage::encode_table(table);

    auto order = JsonValue::array();
    for (const auto* name : {"balance", "id", "opened", "owner"}) {
        order.push_back(JsonValue::string(name));
    }
    json.set("column_order", std::move(order));

    const auto decoded = reldb::storage::decode_table(json, 3U);
    CHECK(decoded.column_order() == std::vector<std::string>{"balance", "id", "opened", "owner"});

    auto broken = JsonValue::array();
    broken.push_back(JsonValue::string("ghost"));
    json.set("column_order", std::move(broken));
    CHECK(error_code_of([&] { (void)reldb::storage::decode_table(json, 3U); })
          == reldb::make_error_code(Errc::Storage));
}
