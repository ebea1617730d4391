#include "reldb/catalog/value.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using reldb::catalog::compare_values;
using reldb::catalog::format_float;
using reldb::catalog::format_timestamp;
using reldb::catalog::parse_timestamp;
using reldb::catalog::Timestamp;
using reldb::catalog::total_order;
using reldb::catalog::Value;
using reldb::catalog::ValueHash;
using reldb::catalog::values_equal;
using reldb::catalog::ValueType;

TEST_CASE("Value factories report their type")
{
    CHECK(Value::null().is_null());
    CHECK(Value{}.type() == ValueType::Null);
    CHECK(Value::integer(7).type() == ValueType::Integer);
    CHECK(Value::floating(1.5).type() == ValueType::Float);
    CHECK(Value::text("a").type() == ValueType::Text);
    CHECK(Value::boolean(true).type() == ValueType::Boolean);
    CHECK(Value::timestamp(Timestamp{0}).type() == ValueType::Timestamp);
    CHECK(Value::integer(7).is_numeric());
    CHECK_FALSE(Value::boolean(true).is_numeric());
}

TEST_CASE("Value to_string renders display forms")
{
    CHECK(Value::null().to_string() == "NULL");
    CHECK(Value::integer(-42).to_string() == "-42");
    CHECK(Value::floating(2.0).to_string() == "2.0");
    CHECK(Value::floating(2.5).to_string() == "2.5");
    CHECK(Value::boolean(false).to_string() == "false");
    CHECK(Value::timestamp(Timestamp{86'400 + 3'661}).to_string() == "1970-01-02 01:01:01");
}

TEST_CASE("compare_values orders numerics across representations")
{
    const auto ordering = compare_values(Value::integer(2), Value::floating(2.5));
    REQUIRE(ordering.has_value());
    CHECK(*ordering < 0);
    CHECK(values_equal(Value::integer(1), Value::floating(1.0)));
    CHECK(values_equal(Value::boolean(true), Value::integer(1)));
}

TEST_CASE("compare_values rejects nulls and mismatched types")
{
    CHECK_FALSE(compare_values(Value::null(), Value::integer(1)).has_value());
    CHECK_FALSE(compare_values(Value::text("1"), Value::integer(1)).has_value());
    CHECK(values_equal(Value::null(), Value::null()));
    CHECK_FALSE(values_equal(Value::null(), Value::integer(0)));
}

TEST_CASE("compare_values parses text against timestamps")
{
    const auto stamp = parse_timestamp("2024-03-01 12:00:00");
    REQUIRE(stamp.has_value());
    const auto ordering = compare_values(Value::timestamp(*stamp), Value::text("2024-02-29"));
    REQUIRE(ordering.has_value());
    CHECK(*ordering > 0);
    CHECK_FALSE(compare_values(Value::timestamp(*stamp), Value::text("yesterday")).has_value());
}

TEST_CASE("total_order ranks types before values")
{
    CHECK(total_order(Value::null(), Value::boolean(false)) < 0);
    CHECK(total_order(Value::boolean(true), Value::integer(-100)) < 0);
    CHECK(total_order(Value::integer(5), Value::timestamp(Timestamp{0})) < 0);
    CHECK(total_order(Value::timestamp(Timestamp{0}), Value::text("")) < 0);
    CHECK(total_order(Value::integer(3), Value::floating(3.0)) == 0);
    CHECK(ValueHash{}(Value::integer(3)) == ValueHash{}(Value::floating(3.0)));
}

TEST_CASE("parse_timestamp accepts the supported layouts")
{
    CHECK(parse_timestamp("1970-01-01 00:00:00")->seconds == 0);
    CHECK(parse_timestamp("1970-01-02")->seconds == 86'400);
    CHECK(parse_timestamp("1970-01-01T00:01:00")->seconds == 60);
    CHECK_FALSE(parse_timestamp("2023-02-29").has_value());
    CHECK_FALSE(parse_timestamp("2024-13-01").has_value());
    CHECK_FALSE(parse_timestamp("2024-01-01 24:00:00").has_value());
    CHECK(parse_timestamp("2024-02-29").has_value());
    CHECK(parse_timestamp("2000-02-29").has_value());
    CHECK_FALSE(parse_timestamp("1900-02-29").has_value());
    CHECK_FALSE(parse_timestamp("2024-04-31").has_value());
    CHECK(parse_timestamp("1969-12-31 23:59:59")->seconds == -1);
}

TEST_CASE("format_timestamp round trips parsed text")
{
    const std::string text = "1999-12-31 23:59:59";
    const auto parsed = parse_timestamp(text);
    REQUIRE(parsed.has_value());
    CHECK(format_timestamp(*parsed) == text);
    CHECK(format_timestamp(Timestamp{-1}) == "1969-12-31 23:59:59");
}

TEST_CASE("format_float keeps a fractional marker")
{
    CHECK(format_float(10.0) == "10.0");
    CHECK(format_float(0.25) == "0.25");
}
