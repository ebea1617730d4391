#include "reldb/storage/database.hpp"

#include "reldb/common/errors.hpp"
#include "reldb/common/time_format.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/storage/snapshot_codec.hpp"

#include <chrono>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <utility>

namespace reldb::storage {

namespace {

void append_csv_field(std::string& out, const std::string& field)
{
    if (field.find_first_of(",\"\r\n") == std::string::npos) {
        out.append(field);
        return;
    }
    out.push_back('"');
    for (const char ch : field) {
        if (ch == '"') {
            out.push_back('"');
        }
        out.push_back(ch);
    }
    out.push_back('"');
}

std::string read_file(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw_error(Errc::Storage, "Unable to open snapshot " + path.string());
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    if (stream.bad()) {
        throw_error(Errc::Storage, "Failed to read snapshot " + path.string());
    }
    return contents.str();
}

void write_file(const std::filesystem::path& path, const std::string& contents)
{
    std::ofstream stream(path, std::ios::binary | std::ios::trunc);
    if (!stream) {
        throw_error(Errc::Storage, "Unable to open " + path.string() + " for writing");
    }
    stream.write(contents.data(), static_cast<std::streamsize>(contents.size()));
    stream.flush();
    if (!stream) {
        throw_error(Errc::Storage, "Failed to write " + path.string());
    }
}

}  // namespace

Database::Database()
    : Database{Config{}}
{}

Database::Database(Config config)
    : config_{std::move(config)}
    , created_at_{format_timestamp_iso(std::chrono::system_clock::now())}
{
    if (!config_.persist) {
        return;
    }

    std::error_code ec;
    std::filesystem::create_directories(config_.data_directory, ec);
    if (ec) {
        throw_error(Errc::Storage, "Unable to create data directory " + config_.data_directory.string() + ": " + ec.message());
    }
    load();
}

const std::string& Database::name() const noexcept
{
    return config_.name;
}

const Database::Config& Database::config() const noexcept
{
    return config_;
}

std::filesystem::path Database::snapshot_path() const
{
    return config_.data_directory / (config_.name + ".json");
}

Table& Database::create_table(const std::string& table_name, std::vector<catalog::Column> columns)
{
    if (table_exists(table_name)) {
        throw_error(Errc::Schema, "Table '" + table_name + "' already exists");
    }
    if (columns.empty()) {
        throw_error(Errc::Schema, "Table must have at least one column");
    }

    auto [it, inserted] = tables_.emplace(table_name, Table{table_name, std::move(columns), config_.btree_order});
    static_cast<void>(inserted);
    save();
    return it->second;
}

void Database::drop_table(const std::string& table_name)
{
    const auto it = tables_.find(table_name);
    if (it == tables_.end()) {
        throw_error(Errc::Schema, "Table '" + table_name + "' does not exist");
    }
    tables_.erase(it);
    save();
}

Table* Database::get_table(std::string_view table_name) noexcept
{
    const auto it = tables_.find(table_name);
    return it == tables_.end() ? nullptr : &it->second;
}

const Table* Database::get_table(std::string_view table_name) const noexcept
{
    const auto it = tables_.find(table_name);
    return it == tables_.end() ? nullptr : &it->second;
}

Table& Database::require_table(std::string_view table_name)
{
    auto* table = get_table(table_name);
    if (table == nullptr) {
        throw_error(Errc::Schema, "Table '" + std::string{table_name} + "' does not exist");
    }
    return *table;
}

std::vector<std::string> Database::list_tables() const
{
    std::vector<std::string> names;
    names.reserve(tables_.size());
    for (const auto& [table_name, table] : tables_) {
        names.push_back(table_name);
    }
    return names;
}

bool Database::table_exists(std::string_view table_name) const noexcept
{
    return tables_.find(table_name) != tables_.end();
}

void Database::save()
{
    if (!config_.persist) {
        return;
    }

    auto document = JsonValue::object();
    document.set("name", JsonValue::string(config_.name));
    document.set("created_at", JsonValue::string(created_at_));
    document.set("format_version", JsonValue::integer(kSnapshotFormatVersion));
    auto tables = JsonValue::object();
    for (const auto& [table_name, table] : tables_) {
        tables.set(table_name, encode_table(table));
    }
    document.set("tables", std::move(tables));

    const auto target = snapshot_path();
    auto staging = target;
    staging += ".tmp";

    write_file(staging, write_json(document, 2U));

    std::error_code ec;
    std::filesystem::rename(staging, target, ec);
    if (ec) {
        throw_error(Errc::Storage, "Unable to replace snapshot " + target.string() + ": " + ec.message());
    }
}

void Database::load()
{
    if (!config_.persist) {
        return;
    }

    const auto path = snapshot_path();
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        if (ec) {
            throw_error(Errc::Storage, "Unable to inspect snapshot " + path.string() + ": " + ec.message());
        }
        return;
    }

    const auto document = parse_json(read_file(path), path.string());

    if (const auto* version = document.find("format_version"); version != nullptr) {
        if (version->as_integer() > kSnapshotFormatVersion) {
            throw_error(Errc::Storage,
                        "Snapshot " + path.string() + " uses unsupported format version "
                            + std::to_string(version->as_integer()));
        }
    }

    std::map<std::string, Table, std::less<>> tables;
    if (const auto* stored = document.find("tables"); stored != nullptr) {
        for (const auto& member : stored->as_object()) {
            tables.emplace(member.key, decode_table(member.value, config_.btree_order));
        }
    }

    if (const auto* created = document.find("created_at"); created != nullptr && !created->is_null()) {
        created_at_ = created->as_string();
    }
    tables_ = std::move(tables);
}

DatabaseStats Database::stats() const
{
    DatabaseStats result{};
    result.name = config_.name;
    result.table_count = tables_.size();
    for (const auto& [table_name, table] : tables_) {
        TableStats entry{};
        entry.name = table_name;
        entry.columns = table.columns().size();
        entry.rows = table.live_row_count();
        entry.indexes = table.indexes().size();
        entry.size_kb = static_cast<double>(write_json(encode_table(table)).size()) / 1024.0;
        result.tables.push_back(std::move(entry));
    }
    return result;
}

void Database::export_table_csv(std::string_view table_name, const std::filesystem::path& output) const
{
    const auto* table = get_table(table_name);
    if (table == nullptr) {
        throw_error(Errc::Schema, "Table '" + std::string{table_name} + "' does not exist");
    }

    const auto order = table->column_order();
    std::string csv;
    for (std::size_t index = 0U; index < order.size(); ++index) {
        if (index > 0U) {
            csv.push_back(',');
        }
        append_csv_field(csv, order[index]);
    }
    csv.append("\r\n");

    for (const auto& entry : table->scan()) {
        for (std::size_t index = 0U; index < order.size(); ++index) {
            if (index > 0U) {
                csv.push_back(',');
            }
            const auto it = entry.row.data.find(order[index]);
            if (it != entry.row.data.end() && !it->second.is_null()) {
                append_csv_field(csv, it->second.to_string());
            }
        }
        csv.append("\r\n");
    }

    write_file(output, csv);
}

}  // namespace reldb::storage
