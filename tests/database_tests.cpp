#include "reldb/common/errors.hpp"
#include "reldb/storage/database.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/storage/snapshot_codec.hpp"
#include "test_support.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

using reldb::Errc;
using reldb::catalog::Column;
using reldb::catalog::DataType;
using reldb::catalog::Value;
using reldb::storage::Database;
using reldb::storage::IndexKind;
using reldb::storage::RowData;
using reldb::test::TempDirectory;
using reldb::test::error_code_of;

namespace {

Column column(std::string name, DataType type)
{
    Column result{};
    result.name = std::move(name);
    result.data_type = type;
    return result;
}

std::vector<Column> product_columns()
{
    auto id = column("id", DataType::Int);
    id.primary_key = true;
    auto label = column("label", DataType::Varchar);
    label.length = 32U;
    auto price = column("price", DataType::Float);
    return {id, label, price};
}

RowData product(std::int64_t id, std::string label, double price)
{
    RowData data;
    data.emplace("id", Value::integer(id));
    data.emplace("label", Value::text(std::move(label)));
    data.emplace("price", Value::floating(price));
    return data;
}

Database::Config config_in(const TempDirectory& directory, std::string name = "shop")
{
    Database::Config config{};
    config.name = std::move(name);
    config.data_directory = directory.path();
    return config;
}

std::string read_text(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::binary);
    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

}  // namespace

TEST_CASE("Database writes a snapshot when tables change")
{
    TempDirectory directory{"reldb_db_"};
    Database database{config_in(directory)};
    CHECK(database.snapshot_path() == directory.path() / "shop.json");
    CHECK_FALSE(std::filesystem::exists(database.snapshot_path()));

    (void)database.create_table("products", product_columns());
    REQUIRE(std::filesystem::exists(database.snapshot_path()));
    CHECK_FALSE(std::filesystem::exists(directory.path() / "shop.json.tmp"));

    const auto document = reldb::storage::parse_json(read_text(database.snapshot_path()));
    CHECK(document.at("name").as_string() == "shop");
    CHECK(document.at("format_version").as_integer() == reldb::storage::kSnapshotFormatVersion);
    CHECK(document.at("tables").find("products") != nullptr);
}

TEST_CASE("Database reload restores rows, tombstones and indexes")
{
    TempDirectory directory{"reldb_db_"};
    std::string created_at;
    {
        Database database{config_in(directory)};
        auto& products = database.create_table("products", product_columns());
        products.insert(product(1, "pen", 1.5));
        products.insert(product(2, "ink", 7.25));
        products.insert(product(3, "pad", 3.0));
        products.remove(0U);
        products.create_index("label", IndexKind::Hash);
        database.save();
        created_at = reldb::storage::parse_json(read_text(database.snapshot_path())).at("created_at").as_string();
    }

    Database reloaded{config_in(directory)};
    const auto* products = reloaded.get_table("products");
    REQUIRE(products != nullptr);
    CHECK(products->live_row_count() == 2U);
    CHECK(products->next_row_id() == 3U);
    CHECK(products->column_order() == std::vector<std::string>{"id", "label", "price"});
    CHECK(products->find_by_column("label", Value::text("ink")).size() == 1U);
    CHECK(products->find_by_column("id", Value::integer(1)).empty());
    REQUIRE(products->index("label") != nullptr);
    CHECK(products->index("label")->kind() == IndexKind::Hash);

    reloaded.save();
    CHECK(reldb::storage::parse_json(read_text(reloaded.snapshot_path())).at("created_at").as_string() == created_at);
}

TEST_CASE("Database catalog operations report schema errors")
{
    TempDirectory directory{"reldb_db_"};
    Database database{config_in(directory)};
    (void)database.create_table("products", product_columns());
    (void)database.create_table("orders", {column("id", DataType::Int)});

    CHECK(database.list_tables() == std::vector<std::string>{"orders", "products"});
    CHECK(database.table_exists("orders"));
    CHECK(database.get_table("missing") == nullptr);

    const auto schema = reldb::make_error_code(Errc::Schema);
    CHECK(error_code_of([&] { (void)database.create_table("orders", {column("id", DataType::Int)}); }) == schema);
    CHECK(error_code_of([&] { (void)database.create_table("empty", {}); }) == schema);
    CHECK(error_code_of([&] { (void)database.require_table("missing"); }) == schema);
    CHECK(error_code_of([&] { database.drop_table("missing"); }) == schema);

    database.drop_table("orders");
    CHECK_FALSE(database.table_exists("orders"));

    Database reloaded{config_in(directory)};
    CHECK(reloaded.list_tables() == std::vector<std::string>{"products"});
}

TEST_CASE("Database rejects snapshots from a newer format")
{
    TempDirectory directory{"reldb_db_"};
    {
        std::ofstream stream(directory.path() / "future.json");
        stream << R"({"name": "future", "format_version": 99, "tables": {}})";
    }
    CHECK(error_code_of([&] { Database database{config_in(directory, "future")}; })
          == reldb::make_error_code(Errc::Storage));
}

TEST_CASE("Database keeps its configured name over the stored one")
{
    TempDirectory directory{"reldb_db_"};
    {
        std::ofstream stream(directory.path() / "alpha.json");
        stream << R"({"name": "beta", "format_version": 1, "tables": {}})";
    }

    Database database{config_in(directory, "alpha")};
    CHECK(database.name() == "alpha");
    database.create_table("items", product_columns());

    CHECK_FALSE(std::filesystem::exists(directory.path() / "beta.json"));
    const auto saved = reldb::storage::parse_json(read_text(directory.path() / "alpha.json"));
    CHECK(saved.at("name").as_string() == "alpha");
    CHECK(saved.at("tables").find("items") != nullptr);
}

TEST_CASE("Database reports malformed snapshots as storage errors")
{
    TempDirectory directory{"reldb_db_"};
    {
        std::ofstream stream(directory.path() / "broken.json");
        stream << R"({"name": "broken", "tables": )";
    }
    CHECK(error_code_of([&] { Database database{config_in(directory, "broken")}; })
          == reldb::make_error_code(Errc::Storage));
}

TEST_CASE("Database without persistence never touches the filesystem")
{
    TempDirectory directory{"reldb_db_"};
    auto config = config_in(directory, "scratch");
    config.data_directory = directory.path() / "unused";
    config.persist = false;

    Database database{config};
    (void)database.create_table("products", product_columns());
    database.save();
    CHECK_FALSE(std::filesystem::exists(directory.path() / "unused"));
    CHECK(database.table_exists("products"));
}

TEST_CASE("Database stats summarise each table")
{
    TempDirectory directory{"reldb_db_"};
    Database database{config_in(directory)};
    auto& products = database.create_table("products", product_columns());
    products.insert(product(1, "pen", 1.5));
    products.insert(product(2, "ink", 7.25));

    const auto stats = database.stats();
    CHECK(stats.name == "shop");
    CHECK(stats.table_count == 1U);
    REQUIRE(stats.tables.size() == 1U);
    CHECK(stats.tables[0].name == "products");
    CHECK(stats.tables[0].columns == 3U);
    CHECK(stats.tables[0].rows == 2U);
    CHECK(stats.tables[0].indexes == 1U);
    CHECK(stats.tables[0].size_kb > 0.0);
}

TEST_CASE("Database exports live rows as CSV")
{
    TempDirectory directory{"reldb_db_"};
    Database database{config_in(directory)};
    auto& products = database.create_table("products", product_columns());
    products.insert(product(1, "pen, blue", 1.5));
    products.insert(product(2, "gone", 2.0));
    RowData quoted;
    quoted.emplace("id", Value::integer(3));
    quoted.emplace("label", Value::text("say \"hi\""));
    products.insert(quoted);
    products.remove(1U);

    const auto output = directory.path() / "products.csv";
    database.export_table_csv("products", output);
    CHECK(read_text(output) == "id,label,price\r\n1,\"pen, blue\",1.5\r\n3,\"say \"\"hi\"\"\",\r\n");

    CHECK(error_code_of([&] { database.export_table_csv("missing", output); }) == reldb::make_error_code(Errc::Schema));
}
