#pragma once

#include "reldb/catalog/column.hpp"
#include "reldb/storage/btree_index.hpp"
#include "reldb/storage/table.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace reldb::storage {

struct TableStats final {
    std::string name{};
    std::size_t columns = 0U;
    std::size_t rows = 0U;
    std::size_t indexes = 0U;
    double size_kb = 0.0;
};

struct DatabaseStats final {
    std::string name{};
    std::size_t table_count = 0U;
    std::vector<TableStats> tables{};
};

// Table catalog persisted as a single JSON snapshot at
// <data_directory>/<name>.json. Every catalog change rewrites the snapshot.
class Database final {
public:
    struct Config final {
        std::string name = "default";
        std::filesystem::path data_directory = "data";
        std::size_t btree_order = BTreeIndex::kDefaultOrder;
        // When false nothing touches the filesystem; save() and load() are no-ops.
        bool persist = true;
    };

    Database();
    explicit Database(Config config);

    Database(const Database&) = delete;
    Database& operator=(const Database&) = delete;

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;
    [[nodiscard]] std::filesystem::path snapshot_path() const;

    Table& create_table(const std::string& table_name, std::vector<catalog::Column> columns);
    void drop_table(const std::string& table_name);

    [[nodiscard]] Table* get_table(std::string_view table_name) noexcept;
    [[nodiscard]] const Table* get_table(std::string_view table_name) const noexcept;
    // Throws Errc::Schema when absent.
    [[nodiscard]] Table& require_table(std::string_view table_name);
    [[nodiscard]] std::vector<std::string> list_tables() const;
    [[nodiscard]] bool table_exists(std::string_view table_name) const noexcept;

    // Writes <name>.json.tmp, then renames it over the snapshot.
    void save();
    // Replaces the in-memory catalog with the snapshot, if one exists.
    void load();

    [[nodiscard]] DatabaseStats stats() const;
    void export_table_csv(std::string_view table_name, const std::filesystem::path& output) const;

private:
    Config config_{};
    std::string created_at_{};
    std::map<std::string, Table, std::less<>> tables_{};
};

}  // namespace reldb::storage
