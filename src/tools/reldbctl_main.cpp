#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/executor/query_executor.hpp"
#include "reldb/parser/parser.hpp"
#include "reldb/storage/database.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/tools/command_log_formatter.hpp"

#include <CLI/CLI.hpp>

#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

namespace {

struct GlobalOptions final {
    std::string data_directory = "data";
    std::string database = "default";
    std::string log_json_path{};
    std::string format = "json";
};

reldb::storage::Database open_database(const GlobalOptions& options)
{
    reldb::storage::Database::Config config{};
    config.name = options.database;
    config.data_directory = options.data_directory;
    return reldb::storage::Database{std::move(config)};
}

std::string read_script(const std::filesystem::path& path)
{
    std::ifstream stream(path, std::ios::binary);
    if (!stream) {
        throw std::runtime_error{"unable to open script " + path.string()};
    }
    std::ostringstream contents;
    contents << stream.rdbuf();
    return contents.str();
}

void print_lines(const std::vector<std::string>& lines)
{
    for (const auto& line : lines) {
        std::cout << line << '\n';
    }
}

int run_exec(const GlobalOptions& options, const std::vector<std::string>& commands, const std::string& script_path)
{
    std::vector<std::string> statements = commands;
    if (!script_path.empty()) {
        const auto script = reldb::parser::split_statements(read_script(script_path));
        statements.insert(statements.end(), script.begin(), script.end());
    }
    if (statements.empty()) {
        throw std::runtime_error{"exec requires -c or -f"};
    }

    auto database = open_database(options);

    std::unique_ptr<std::ofstream> log_stream;
    if (!options.log_json_path.empty()) {
        log_stream = std::make_unique<std::ofstream>(options.log_json_path, std::ios::app);
        if (!*log_stream) {
            throw std::runtime_error{"unable to open log file " + options.log_json_path};
        }
    }

    reldb::executor::ExecutorTelemetry telemetry;
    reldb::executor::QueryExecutor::Config executor_config{};
    executor_config.telemetry = &telemetry;
    if (log_stream) {
        executor_config.command_logger = [&log_stream](const reldb::executor::CommandMetrics& metrics) {
            *log_stream << reldb::tools::format_command_log_json(metrics) << '\n';
            log_stream->flush();
        };
    }
    reldb::executor::QueryExecutor executor{database, std::move(executor_config)};

    for (const auto& sql : statements) {
        const auto result = executor.execute(sql);
        if (options.format == "text") {
            print_lines(reldb::tools::format_result_text_lines(result));
        } else {
            print_lines(reldb::tools::format_result_json_lines(result));
        }
    }
    return EXIT_SUCCESS;
}

int run_stats(const GlobalOptions& options)
{
    const auto database = open_database(options);
    const auto stats = database.stats();

    if (options.format == "text") {
        std::cout << "database " << stats.name << " (" << stats.table_count << " tables)" << '\n';
        for (const auto& table : stats.tables) {
            std::cout << "  " << table.name << ": " << table.rows << " rows, " << table.columns << " columns, "
                      << table.indexes << " indexes, " << table.size_kb << " KiB" << '\n';
        }
        return EXIT_SUCCESS;
    }

    using reldb::storage::JsonValue;
    auto tables = JsonValue::array();
    for (const auto& table : stats.tables) {
        auto entry = JsonValue::object();
        entry.set("name", JsonValue::string(table.name));
        entry.set("columns", JsonValue::integer(static_cast<std::int64_t>(table.columns)));
        entry.set("rows", JsonValue::integer(static_cast<std::int64_t>(table.rows)));
        entry.set("indexes", JsonValue::integer(static_cast<std::int64_t>(table.indexes)));
        entry.set("size_kb", JsonValue::number(table.size_kb));
        tables.push_back(std::move(entry));
    }
    auto document = JsonValue::object();
    document.set("name", JsonValue::string(stats.name));
    document.set("table_count", JsonValue::integer(static_cast<std::int64_t>(stats.table_count)));
    document.set("tables", std::move(tables));
    std::cout << reldb::storage::write_json(document) << '\n';
    return EXIT_SUCCESS;
}

int run_export_csv(const GlobalOptions& options, const std::string& table, const std::string& output)
{
    const auto database = open_database(options);
    database.export_table_csv(table, output);
    std::cerr << "exported " << table << " to " << output << '\n';
    return EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv)
{
    CLI::App app{"Command-line access to reldb databases"};
    app.require_subcommand(1);

    GlobalOptions options{};
    app.add_option("--data-dir", options.data_directory, "Directory holding database snapshots")
        ->capture_default_str();
    app.add_option("--database", options.database, "Database name")->capture_default_str();
    app.add_option("--log-json", options.log_json_path, "Append one JSON line per executed statement to this file");
    app.add_option("--format", options.format, "Output format (json or text)")
        ->transform(CLI::CheckedTransformer({{"json", "json"}, {"text", "text"}}))
        ->capture_default_str();

    int exit_code = EXIT_SUCCESS;

    std::vector<std::string> exec_commands;
    std::string exec_script;
    auto* exec = app.add_subcommand("exec", "Execute SQL statements");
    exec->add_option("-c,--command", exec_commands, "SQL statement to execute (repeatable)");
    exec->add_option("-f,--file", exec_script, "Script of ';'-separated statements")->check(CLI::ExistingFile);
    exec->callback([&]() {
        exit_code = run_exec(options, exec_commands, exec_script);
    });

    auto* stats = app.add_subcommand("stats", "Print database statistics");
    stats->callback([&]() {
        exit_code = run_stats(options);
    });

    std::string export_table;
    std::string export_path;
    auto* export_csv = app.add_subcommand("export-csv", "Export a table as CSV");
    export_csv->add_option("table", export_table, "Table to export")->required();
    export_csv->add_option("path", export_path, "Output file")->required();
    export_csv->callback([&]() {
        exit_code = run_export_csv(options, export_table, export_path);
    });

    try {
        app.parse(argc, argv);
    } catch (const CLI::ParseError& error) {
        return app.exit(error);
    } catch (const std::system_error& error) {
        std::cerr << "error [" << error.code().category().name() << ":" << error.code().value() << "]: " << error.what()
                  << '\n';
        return EXIT_FAILURE;
    } catch (const std::exception& error) {
        std::cerr << "error: " << error.what() << '\n';
        return EXIT_FAILURE;
    }

    return exit_code;
}
