#include "reldb/common/errors.hpp"
#include "reldb/storage/btree_index.hpp"
#include "reldb/storage/table.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <utility>
#include <vector>

using reldb::Errc;
using reldb::catalog::Column;
using reldb::catalog::DataType;
using reldb::catalog::Value;
using reldb::storage::IndexKind;
using reldb::storage::RowData;
using reldb::storage::SlotId;
using reldb::storage::SlotRow;
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

Table make_users()
{
    auto id = column("id", DataType::Int);
    id.primary_key = true;
    auto name = column("name", DataType::Varchar);
    name.length = 20U;
    auto email = column("email", DataType::Varchar);
    email.unique = true;
    auto age = column("age", DataType::Int);
    auto active = column("active", DataType::Boolean);
    active.default_value = Value::boolean(true);
    return Table{"users", {id, name, email, age, active}};
}

RowData user(std::int64_t id, std::string name, std::string email, std::int64_t age)
{
    RowData data;
    data.emplace("id", Value::integer(id));
    data.emplace("name", Value::text(std::move(name)));
    data.emplace("email", Value::text(std::move(email)));
    data.emplace("age", Value::integer(age));
    return data;
}

std::vector<SlotId> slots_of(const std::vector<SlotRow>& rows)
{
    std::vector<SlotId> slots;
    for (const auto& row : rows) {
        slots.push_back(row.slot);
    }
    return slots;
}

}  // namespace

TEST_CASE("Table construction validates the schema")
{
    CHECK(error_code_of([] { Table{"empty", {}}; }) == Errc::Schema);
    CHECK(error_code_of([] {
              Table{"dup", {column("a", DataType::Int), column("a", DataType::Float)}};
          })
          == Errc::Schema);

    const auto users = make_users();
    CHECK(users.column_order() == std::vector<std::string>{"id", "name", "email", "age", "active"});
    CHECK(users.index("id") != nullptr);
    CHECK(users.index("email") != nullptr);
    CHECK(users.index("name") == nullptr);
    CHECK(users.btree_order() == reldb::storage::BTreeIndex::kDefaultOrder);
}

TEST_CASE("Table insert fills defaults and assigns row ids")
{
    auto users = make_users();
    const auto& first = users.insert(user(1, "Ada", "ada@example.com", 36));
    CHECK(first.row_id == 0U);
    CHECK(first.data.at("active").as_boolean());

    RowData partial;
    partial.emplace("id", Value::text("2"));
    const auto& second = users.insert(partial);
    CHECK(second.row_id == 1U);
    CHECK(second.data.at("id").as_integer() == 2);
    CHECK(second.data.at("name").is_null());
    CHECK(users.live_row_count() == 2U);
    CHECK(users.next_row_id() == 2U);
}

TEST_CASE("Table insert rejects unknown columns and bad values without side effects")
{
    auto users = make_users();
    users.insert(user(1, "Ada", "ada@example.com", 36));

    auto unknown = user(2, "Bob", "bob@example.com", 40);
    unknown.emplace("nickname", Value::text("b"));
    CHECK(error_code_of([&] { users.insert(unknown); }) == Errc::Schema);

    CHECK(error_code_of([&] { users.insert(user(1, "Eve", "eve@example.com", 22)); }) == Errc::Constraint);
    CHECK(error_code_of([&] { users.insert(user(3, "Eve", "ada@example.com", 22)); }) == Errc::Constraint);
    CHECK(error_code_of([&] { users.insert(user(4, "A name that is far too long", "x@y", 1)); }) == Errc::Constraint);

    RowData no_key;
    no_key.emplace("name", Value::text("Nobody"));
    CHECK(error_code_of([&] { users.insert(no_key); }) == Errc::Constraint);

    CHECK(users.live_row_count() == 1U);
    CHECK(users.next_row_id() == 1U);
    CHECK(users.index("id")->size() == 1U);
}

TEST_CASE("Table allows several NULLs in a UNIQUE column")
{
    auto users = make_users();
    RowData first;
    first.emplace("id", Value::integer(1));
    RowData second;
    second.emplace("id", Value::integer(2));
    users.insert(first);
    users.insert(second);
    CHECK(users.live_row_count() == 2U);
    CHECK(users.index("email")->size() == 0U);
}

TEST_CASE("Table update moves index entries and checks uniqueness against other rows")
{
    auto users = make_users();
    users.insert(user(1, "Ada", "ada@example.com", 36));
    users.insert(user(2, "Bob", "bob@example.com", 40));

    RowData same_email;
    same_email.emplace("email", Value::text("ada@example.com"));
    users.update(0U, same_email);

    RowData taken;
    taken.emplace("email", Value::text("ada@example.com"));
    CHECK(error_code_of([&] { users.update(1U, taken); }) == Errc::Constraint);

    RowData renumber;
    renumber.emplace("id", Value::integer(10));
    users.update(1U, renumber);
    CHECK(users.index("id")->search(Value::integer(2)).empty());
    CHECK(users.index("id")->search(Value::integer(10)) == std::vector<SlotId>{1U});
    CHECK(users.row_at(1U).data.at("name").as_text() == "Bob");

    RowData bogus;
    bogus.emplace("missing", Value::integer(1));
    CHECK(error_code_of([&] { users.update(0U, bogus); }) == Errc::Schema);
    CHECK(error_code_of([&] { users.update(7U, renumber); }) == Errc::Execution);
}

TEST_CASE("Table remove tombstones slots without reusing them")
{
    auto users = make_users();
    users.insert(user(1, "Ada", "ada@example.com", 36));
    users.insert(user(2, "Bob", "bob@example.com", 40));
    users.insert(user(3, "Cy", "cy@example.com", 29));

    users.remove(1U);
    CHECK(users.live_row_count() == 2U);
    CHECK_FALSE(users.slots()[1].occupied());
    CHECK(slots_of(users.scan()) == std::vector<SlotId>{0U, 2U});
    CHECK(error_code_of([&] { users.remove(1U); }) == Errc::Execution);
    CHECK(error_code_of([&] { (void)users.row_at(1U); }) == Errc::Execution);

    const auto& next = users.insert(user(2, "Bob", "bob@example.com", 41));
    CHECK(next.row_id == 3U);
    CHECK(users.slots().size() == 4U);
}

TEST_CASE("Table find_by_column uses coerced lookups")
{
    auto users = make_users();
    users.insert(user(1, "Ada", "ada@example.com", 36));
    users.insert(user(2, "Bob", "bob@example.com", 36));

    CHECK(slots_of(users.find_by_column("id", Value::text("2"))) == std::vector<SlotId>{1U});
    CHECK(slots_of(users.find_by_column("age", Value::integer(36))) == std::vector<SlotId>{0U, 1U});
    CHECK(users.find_by_column("id", Value::text("two")).empty());
    CHECK(error_code_of([&] { (void)users.find_by_column("nope", Value::integer(1)); }) == Errc::Schema);
}

TEST_CASE("Table range lookups agree with and without an index")
{
    auto scanned = make_users();
    auto indexed = make_users();
    indexed.create_index("age");
    REQUIRE(indexed.index("age") != nullptr);
    CHECK(indexed.index("age")->kind() == IndexKind::BTree);

    for (std::int64_t i = 0; i < 40; ++i) {
        const auto data = user(i, "user" + std::to_string(i), "u" + std::to_string(i) + "@x", (i * 7) % 50);
        scanned.insert(data);
        indexed.insert(data);
    }
    scanned.remove(5U);
    indexed.remove(5U);

    const auto expected = slots_of(scanned.find_by_range("age", Value::integer(10), Value::integer(30)));
    const auto actual = slots_of(indexed.find_by_range("age", Value::integer(10), Value::integer(30)));
    CHECK_FALSE(expected.empty());
    CHECK(actual == expected);
    CHECK(indexed.find_by_range("age", Value::null(), Value::integer(3)).empty());
}

TEST_CASE("Table create_index supports hash indexes and rejects unknown columns")
{
    auto users = make_users();
    users.insert(user(1, "Ada", "ada@example.com", 36));
    users.create_index("name", IndexKind::Hash);
    REQUIRE(users.index("name") != nullptr);
    CHECK(users.index("name")->kind() == IndexKind::Hash);
    CHECK(users.index("name")->search(Value::text("Ada")) == std::vector<SlotId>{0U});

    users.create_index("name");
    CHECK(users.index("name")->kind() == IndexKind::Hash);

    CHECK(error_code_of([&] { users.create_index("nope"); }) == Errc::Schema);
}

TEST_CASE("Table describe renders every column")
{
    const auto users = make_users();
    const auto lines = users.describe();
    REQUIRE(lines.size() == 5U);
    CHECK(lines[0] == "id INT PRIMARY KEY");
    CHECK(users.describe_column("name") == "name VARCHAR(20)");
    CHECK(lines[4] == "active BOOLEAN DEFAULT true");
}
