#include "reldb/executor/command_metrics.hpp"
#include "reldb/executor/query_result.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/tools/command_log_formatter.hpp"

#include <catch2/catch_test_macros.hpp>

#include <chrono>
#include <string>
#include <vector>

using reldb::catalog::Value;
using reldb::executor::CommandMetrics;
using reldb::executor::QueryResult;
using reldb::executor::ResultRow;
using reldb::storage::parse_json;

namespace {

CommandMetrics sample_metrics()
{
    CommandMetrics metrics{};
    metrics.success = true;
    metrics.summary = "Selected 2 row(s)";
    metrics.duration_ms = 1.5;
    metrics.rows_touched = 2U;
    metrics.command_text = "SELECT name FROM users WHERE name = \"x\"";
    metrics.correlation_id = "stmt-7";
    metrics.command_category = "SELECT";
    metrics.started_at = std::chrono::system_clock::time_point{std::chrono::seconds{1'700'000'000}};
    metrics.finished_at = metrics.started_at + std::chrono::microseconds{1500};
    return metrics;
}

QueryResult sample_rows()
{
    QueryResult result{};
    result.columns = {"id", "name", "score"};
    ResultRow first;
    first.emplace("id", Value::integer(1));
    first.emplace("name", Value::text("ann"));
    first.emplace("score", Value::floating(2.5));
    ResultRow second;
    second.emplace("id", Value::integer(2));
    second.emplace("name", Value::null());
    second.emplace("score", Value::floating(4.0));
    result.rows = {first, second};
    result.row_count = 2U;
    return result;
}

}  // namespace

TEST_CASE("Command log records successful statements on one line")
{
    const auto line = reldb::tools::format_command_log_json(sample_metrics());
    CHECK(line.find('\n') == std::string::npos);

    const auto json = parse_json(line);
    CHECK(json.at("correlation_id").as_string() == "stmt-7");
    CHECK(json.at("category").as_string() == "SELECT");
    CHECK(json.at("sql").as_string() == "SELECT name FROM users WHERE name = \"x\"");
    CHECK(json.at("summary").as_string() == "Selected 2 row(s)");
    CHECK(json.at("success").as_boolean());
    CHECK(json.at("duration_ms").as_number() == 1.5);
    CHECK(json.at("rows_touched").as_integer() == 2);
    CHECK(json.at("started_at").as_string() == "2023-11-14T22:13:20.000000Z");
    CHECK(json.at("finished_at").as_string() == "2023-11-14T22:13:20.001500Z");
    CHECK(json.at("error").is_null());
}

TEST_CASE("Command log describes failures by category and code")
{
    auto metrics = sample_metrics();
    metrics.success = false;
    metrics.summary = "Unknown column: 'nope'";
    metrics.error_category = "reldb";
    metrics.error_code = 2;
    metrics.started_at = {};

    const auto json = parse_json(reldb::tools::format_command_log_json(metrics));
    CHECK_FALSE(json.at("success").as_boolean());
    CHECK(json.at("started_at").is_null());
    const auto& error = json.at("error");
    CHECK(error.at("category").as_string() == "reldb");
    CHECK(error.at("code").as_integer() == 2);
}

TEST_CASE("JSON result lines follow column order")
{
    const auto lines = reldb::tools::format_result_json_lines(sample_rows());
    REQUIRE(lines.size() == 2U);
    CHECK(lines[0] == R"({"id":1,"name":"ann","score":2.5})");
    CHECK(lines[1] == R"({"id":2,"name":null,"score":4.0})");

    QueryResult message{};
    message.message = "Updated 3 row(s)";
    message.rows_affected = 3U;
    CHECK(reldb::tools::format_result_json_lines(message)
          == std::vector<std::string>{R"json({"message":"Updated 3 row(s)","rows_affected":3})json"});

    QueryResult empty{};
    empty.columns = {"id"};
    CHECK(reldb::tools::format_result_json_lines(empty).empty());
}

TEST_CASE("Text result lines carry a header and a row count")
{
    CHECK(reldb::tools::format_result_text_lines(sample_rows())
          == std::vector<std::string>{"id | name | score", "1 | ann | 2.5", "2 | NULL | 4.0", "(2 rows)"});

    auto single = sample_rows();
    single.rows.pop_back();
    single.row_count = 1U;
    CHECK(reldb::tools::format_result_text_lines(single).back() == "(1 row)");

    QueryResult message{};
    message.message = "Created table 'users'";
    CHECK(reldb::tools::format_result_text_lines(message) == std::vector<std::string>{"Created table 'users'"});
}
