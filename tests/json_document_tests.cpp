#include "reldb/common/errors.hpp"
#include "reldb/storage/json_document.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <string>

using reldb::Errc;
using reldb::storage::JsonValue;
using reldb::storage::parse_json;
using reldb::storage::write_json;
using reldb::test::error_code_of;

TEST_CASE("parse_json reads nested documents")
{
    const auto document = parse_json(R"({"name": "db", "version": 2, "ratio": 0.5,
        "tags": ["a", true, null], "nested": {"empty": {}, "list": []}})");

    CHECK(document.kind() == JsonValue::Kind::Object);
    CHECK(document.at("name").as_string() == "db");
    CHECK(document.at("version").as_integer() == 2);
    CHECK(document.at("version").as_number() == 2.0);
    CHECK(document.at("ratio").as_number() == 0.5);
    const auto& tags = document.at("tags").as_array();
    REQUIRE(tags.size() == 3U);
    CHECK(tags[0].as_string() == "a");
    CHECK(tags[1].as_boolean());
    CHECK(tags[2].is_null());
    CHECK(document.at("nested").at("empty").as_object().empty());
    CHECK(document.at("nested").at("list").as_array().empty());
    CHECK(document.find("absent") == nullptr);
}

TEST_CASE("parse_json keeps member order")
{
    const auto document = parse_json(R"({"z": 1, "a": 2, "m": 3})");
    const auto& members = document.as_object();
    REQUIRE(members.size() == 3U);
    CHECK(members[0].key == "z");
    CHECK(members[1].key == "a");
    CHECK(members[2].key == "m");
}

TEST_CASE("parse_json decodes escapes")
{
    const auto document = parse_json(R"(["line\nbreak", "quote\"", "\u00e9", "\ud83d\ude00", "tab\t"])");
    const auto& items = document.as_array();
    CHECK(items[0].as_string() == "line\nbreak");
    CHECK(items[1].as_string() == "quote\"");
    CHECK(items[2].as_string() == "\xC3\xA9");
    CHECK(items[3].as_string() == "\xF0\x9F\x98\x80");
    CHECK(items[4].as_string() == "tab\t");
}

TEST_CASE("parse_json reports malformed input as a storage error")
{
    CHECK(error_code_of([] { (void)parse_json("{\"a\": }"); }) == Errc::Storage);
    CHECK(error_code_of([] { (void)parse_json("[1, 2"); }) == Errc::Storage);
    CHECK(error_code_of([] { (void)parse_json("{} trailing"); }) == Errc::Storage);
    CHECK(error_code_of([] { (void)parse_json(""); }) == Errc::Storage);
    CHECK(error_code_of([] { (void)parse_json("[01]"); }) == Errc::Storage);
    CHECK(error_code_of([] { (void)parse_json("{'a': 1}"); }) == Errc::Storage);
}

TEST_CASE("JsonValue accessors reject the wrong kind")
{
    const auto value = JsonValue::string("text");
    CHECK(error_code_of([&] { (void)value.as_integer(); }) == Errc::Storage);
    CHECK(error_code_of([&] { (void)JsonValue::object().at("missing"); }) == Errc::Storage);
}

TEST_CASE("write_json renders compact and indented forms")
{
    auto object = JsonValue::object();
    object.set("id", JsonValue::integer(3));
    object.set("score", JsonValue::number(2.0));
    object.set("name", JsonValue::string("a\"b"));
    auto list = JsonValue::array();
    list.push_back(JsonValue::boolean(false));
    list.push_back(JsonValue::null());
    object.set("list", std::move(list));
    object.set("id", JsonValue::integer(4));

    CHECK(write_json(object) == R"({"id":4,"score":2.0,"name":"a\"b","list":[false,null]})");
    CHECK(write_json(object, 2U) == "{\n  \"id\": 4,\n  \"score\": 2.0,\n  \"name\": \"a\\\"b\",\n  \"list\": [\n    false,\n    null\n  ]\n}");

    const auto reparsed = parse_json(write_json(object, 2U));
    CHECK(reparsed.at("name").as_string() == "a\"b");
    CHECK(reparsed.at("score").kind() == JsonValue::Kind::Number);
}
