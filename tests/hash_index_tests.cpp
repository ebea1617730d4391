#include "reldb/storage/hash_index.hpp"

#include <catch2/catch_test_macros.hpp>

#include <vector>

using reldb::catalog::Value;
using reldb::storage::HashIndex;
using reldb::storage::IndexKind;
using reldb::storage::SlotId;

TEST_CASE("HashIndex groups slots by key in insertion order")
{
    HashIndex index{"status"};
    CHECK(index.kind() == IndexKind::Hash);

    index.insert(Value::text("open"), 3U);
    index.insert(Value::text("closed"), 1U);
    index.insert(Value::text("open"), 0U);

    CHECK(index.search(Value::text("open")) == std::vector<SlotId>{3U, 0U});
    CHECK(index.search(Value::text("missing")).empty());
    CHECK(index.size() == 3U);
    CHECK(index.distinct_keys() == 2U);
}

TEST_CASE("HashIndex treats integer and float keys alike")
{
    HashIndex index{"n"};
    index.insert(Value::integer(2), 7U);
    CHECK(index.search(Value::floating(2.0)) == std::vector<SlotId>{7U});
}

TEST_CASE("HashIndex remove drops empty keys")
{
    HashIndex index{"n"};
    index.insert(Value::integer(1), 0U);
    index.insert(Value::integer(1), 1U);

    CHECK(index.remove(Value::integer(1), 0U));
    CHECK_FALSE(index.remove(Value::integer(1), 0U));
    CHECK_FALSE(index.remove(Value::integer(9), 0U));
    CHECK(index.distinct_keys() == 1U);
    CHECK(index.remove(Value::integer(1), 1U));
    CHECK(index.distinct_keys() == 0U);
    CHECK(index.size() == 0U);
}

TEST_CASE("HashIndex entries are sorted by key")
{
    HashIndex index{"n"};
    index.insert(Value::integer(30), 0U);
    index.insert(Value::integer(10), 1U);
    index.insert(Value::integer(20), 2U);
    index.insert(Value::integer(10), 3U);

    const auto entries = index.entries();
    REQUIRE(entries.size() == 4U);
    CHECK(entries[0].key.as_integer() == 10);
    CHECK(entries[0].slot == 1U);
    CHECK(entries[1].slot == 3U);
    CHECK(entries[2].key.as_integer() == 20);
    CHECK(entries[3].key.as_integer() == 30);
}
