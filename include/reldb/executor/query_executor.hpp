#pragma once

#include "reldb/executor/command_metrics.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/executor/query_result.hpp"
#include "reldb/parser/ast.hpp"

#include <atomic>
#include <cstdint>
#include <string>
#include <string_view>

namespace reldb::storage {
class Database;
}

namespace reldb::executor {

// Parses SQL text and runs it against a Database, persisting after every
// statement that changes it. Errors surface as std::system_error in the reldb
// category.
class QueryExecutor final {
public:
    struct Config final {
        ExecutorTelemetry* telemetry = nullptr;
        // Receives a record for every statement, successful or not.
        CommandLogger command_logger{};
    };

    explicit QueryExecutor(storage::Database& database);
    QueryExecutor(storage::Database& database, Config config);

    QueryResult execute(std::string_view sql);
    QueryResult execute(const parser::Statement& statement);

    [[nodiscard]] storage::Database& database() const noexcept;
    [[nodiscard]] const Config& config() const noexcept;

private:
    QueryResult execute_select(const parser::SelectStatement& statement);
    QueryResult execute_insert(const parser::InsertStatement& statement);
    QueryResult execute_update(const parser::UpdateStatement& statement);
    QueryResult execute_delete(const parser::DeleteStatement& statement);
    QueryResult execute_create_table(const parser::CreateTableStatement& statement);
    QueryResult execute_create_index(const parser::CreateIndexStatement& statement);
    QueryResult execute_drop_table(const parser::DropTableStatement& statement);

    void persist();
    void note_persisted() noexcept;
    [[nodiscard]] std::string next_correlation_id();

    storage::Database* database_ = nullptr;
    Config config_{};
    std::atomic<std::uint64_t> next_correlation_{1U};
};

}  // namespace reldb::executor
