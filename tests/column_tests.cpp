#include "reldb/catalog/column.hpp"
#include "reldb/common/errors.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <limits>
#include <string>
#include <system_error>
#include <utility>

using reldb::Errc;
using reldb::catalog::Column;
using reldb::catalog::convert_value;
using reldb::catalog::DataType;
using reldb::catalog::describe_column;
using reldb::catalog::parse_data_type;
using reldb::catalog::validate_value;
using reldb::catalog::Value;
using reldb::catalog::ValueType;
using reldb::test::error_code_of;

namespace {

Column make_column(std::string name, DataType type)
{
    Column column{};
    column.name = std::move(name);
    column.data_type = type;
    return column;
}

}  // namespace

TEST_CASE("parse_data_type is case insensitive")
{
    CHECK(parse_data_type("int") == DataType::Int);
    CHECK(parse_data_type("VarChar") == DataType::Varchar);
    CHECK(parse_data_type("DATETIME") == DataType::Datetime);
    CHECK_FALSE(parse_data_type("TEXT").has_value());
}

TEST_CASE("convert_value coerces into the column type")
{
    const auto int_column = make_column("n", DataType::Int);
    CHECK(convert_value(int_column, Value::text(" 42 ")).as_integer() == 42);
    CHECK(convert_value(int_column, Value::floating(3.9)).as_integer() == 3);
    CHECK(convert_value(int_column, Value::boolean(true)).as_integer() == 1);
    CHECK(convert_value(int_column, Value::null()).is_null());

    const auto float_column = make_column("f", DataType::Float);
    CHECK(convert_value(float_column, Value::integer(2)).as_float() == 2.0);
    CHECK(convert_value(float_column, Value::text("1.25")).as_float() == 1.25);

    const auto text_column = make_column("s", DataType::Varchar);
    CHECK(convert_value(text_column, Value::integer(5)).as_text() == "5");

    const auto bool_column = make_column("b", DataType::Boolean);
    CHECK(convert_value(bool_column, Value::text("YES")).as_boolean());
    CHECK_FALSE(convert_value(bool_column, Value::text("no")).as_boolean());
    CHECK_FALSE(convert_value(bool_column, Value::integer(0)).as_boolean());

    const auto time_column = make_column("t", DataType::Datetime);
    CHECK(convert_value(time_column, Value::text("1970-01-01 00:00:10")).type() == ValueType::Timestamp);
}

TEST_CASE("convert_value reports impossible coercions as constraint errors")
{
    const auto int_column = make_column("n", DataType::Int);
    CHECK(error_code_of([&] { (void)convert_value(int_column, Value::text("abc")); }) == Errc::Constraint);
    CHECK(error_code_of([&] { (void)convert_value(int_column, Value::text("1.5")); }) == Errc::Constraint);

    const auto time_column = make_column("t", DataType::Datetime);
    CHECK(error_code_of([&] { (void)convert_value(time_column, Value::text("soon")); }) == Errc::Constraint);
    CHECK(error_code_of([&] { (void)convert_value(time_column, Value::integer(5)); }) == Errc::Constraint);
}

TEST_CASE("validate_value enforces nullability and length")
{
    auto name = make_column("name", DataType::Varchar);
    name.length = 3U;
    CHECK(validate_value(name, Value::text("abc")).as_text() == "abc");
    CHECK(error_code_of([&] { (void)validate_value(name, Value::text("abcd")); }) == Errc::Constraint);

    name.nullable = false;
    CHECK(error_code_of([&] { (void)validate_value(name, Value::null()); }) == Errc::Constraint);

    auto id = make_column("id", DataType::Int);
    id.primary_key = true;
    CHECK(id.accepts_null() == false);
    CHECK(error_code_of([&] { (void)validate_value(id, Value::null()); }) == Errc::Constraint);
}

TEST_CASE("validate_value measures VARCHAR length in characters")
{
    auto label = make_column("v", DataType::Varchar);
    label.length = 5U;
    CHECK(validate_value(label, Value::text("h\xC3\xA9llo")).as_text() == "h\xC3\xA9llo");
    CHECK(validate_value(label, Value::text("\xF0\x9F\x98\x80\xF0\x9F\x98\x80")).as_text().size() == 8U);
    CHECK(error_code_of([&] { (void)validate_value(label, Value::text("h\xC3\xA9llos")); }) == Errc::Constraint);
}

TEST_CASE("FLOAT columns reject values that are not finite")
{
    const auto ratio = make_column("ratio", DataType::Float);
    CHECK(error_code_of([&] { (void)convert_value(ratio, Value::text("nan")); }) == Errc::Constraint);
    CHECK(error_code_of([&] { (void)convert_value(ratio, Value::text("-inf")); }) == Errc::Constraint);
    CHECK(error_code_of([&] { (void)convert_value(ratio, Value::text("infinity")); }) == Errc::Constraint);
    CHECK(error_code_of([&] { (void)convert_value(ratio, Value::floating(std::numeric_limits<double>::infinity())); })
          == Errc::Constraint);
    CHECK(error_code_of([&] { (void)validate_value(ratio, Value::floating(std::numeric_limits<double>::quiet_NaN())); })
          == Errc::Constraint);
    CHECK(convert_value(ratio, Value::text("1e3")).as_float() == 1000.0);
}

TEST_CASE("describe_column renders type and constraints")
{
    auto column = make_column("email", DataType::Varchar);
    column.length = 40U;
    column.unique = true;
    column.nullable = false;
    CHECK(describe_column(column) == "email VARCHAR(40) UNIQUE NOT NULL");

    auto id = make_column("id", DataType::Int);
    id.primary_key = true;
    CHECK(describe_column(id) == "id INT PRIMARY KEY");
}
