#include "reldb/executor/query_executor.hpp"

#include "reldb/common/errors.hpp"
#include "reldb/executor/condition_evaluator.hpp"
#include "reldb/executor/delete_executor.hpp"
#include "reldb/executor/executor_context.hpp"
#include "reldb/executor/filter_executor.hpp"
#include "reldb/executor/insert_executor.hpp"
#include "reldb/executor/limit_executor.hpp"
#include "reldb/executor/nested_loop_join_executor.hpp"
#include "reldb/executor/projection_executor.hpp"
#include "reldb/executor/seq_scan_executor.hpp"
#include "reldb/executor/sort_executor.hpp"
#include "reldb/executor/tuple.hpp"
#include "reldb/executor/update_executor.hpp"
#include "reldb/parser/parser.hpp"
#include "reldb/storage/database.hpp"

#include <algorithm>
#include <chrono>
#include <memory>
#include <system_error>
#include <type_traits>
#include <utility>
#include <vector>

namespace reldb::executor {

namespace {

constexpr std::string_view kAllColumns = "*";

struct ScopedTable final {
    std::string name{};
    const storage::Table* table = nullptr;
};

using Scope = std::vector<ScopedTable>;

const ScopedTable* find_scoped_table(const Scope& scope, std::string_view name) noexcept
{
    for (const auto& entry : scope) {
        if (entry.name == name) {
            return &entry;
        }
    }
    return nullptr;
}

// Accepts "column" when any table in scope has it and "table.column" when the
// named table is in scope and has it.
void require_column_in_scope(std::string_view reference, const Scope& scope)
{
    const auto qualifier = qualifier_of(reference);
    const auto column = unqualified_name(reference);
    if (!qualifier.empty()) {
        const auto* entry = find_scoped_table(scope, qualifier);
        if (entry == nullptr) {
            throw_error(Errc::Schema,
                        "Unknown table '" + std::string{qualifier} + "' in column reference '" + std::string{reference} + "'");
        }
        if (!entry->table->has_column(column)) {
            throw_error(Errc::Schema, "Unknown column: '" + std::string{reference} + "'");
        }
        return;
    }
    const bool known = std::any_of(scope.begin(), scope.end(), [column](const ScopedTable& entry) {
        return entry.table->has_column(column);
    });
    if (!known) {
        throw_error(Errc::Schema, "Unknown column: '" + std::string{reference} + "'");
    }
}

void require_condition_in_scope(const parser::Condition& condition, const Scope& scope)
{
    std::visit(
        [&scope](const auto& node) {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, parser::Comparison>) {
                require_column_in_scope(node.column, scope);
            } else {
                if (node.left != nullptr) {
                    require_condition_in_scope(*node.left, scope);
                }
                if (node.right != nullptr) {
                    require_condition_in_scope(*node.right, scope);
                }
            }
        },
        condition.node);
}

std::vector<std::string> joined_names(const ScopedTable& entry)
{
    std::vector<std::string> names;
    for (const auto& column : entry.table->column_order()) {
        names.push_back(entry.name + "." + column);
        names.push_back(column);
    }
    return names;
}

// Unqualified operands bind to their default side; a qualifier naming the
// joined table binds to the right, any other qualifier to the left.
NestedLoopJoinExecutor::JoinKey bind_join_operand(const std::string& operand,
                                                  NestedLoopJoinExecutor::Side default_side,
                                                  const Scope& left_scope,
                                                  const ScopedTable& joined)
{
    using Side = NestedLoopJoinExecutor::Side;
    const auto qualifier = qualifier_of(operand);
    Side side = default_side;
    if (!qualifier.empty()) {
        side = qualifier == joined.name ? Side::Right : Side::Left;
    }
    if (side == Side::Right) {
        require_column_in_scope(operand, Scope{joined});
    } else {
        require_column_in_scope(operand, left_scope);
    }
    return NestedLoopJoinExecutor::JoinKey{operand, side};
}

void require_column_count(std::size_t columns, std::size_t values, const char* message)
{
    if (columns != values) {
        throw_error(Errc::Execution, message);
    }
}

ExecutorNodePtr make_filtered_scan(const storage::Table& table,
                                   const parser::ConditionPtr& where,
                                   ExecutorTelemetry* telemetry)
{
    ExecutorNodePtr root = std::make_unique<SeqScanExecutor>(SeqScanExecutor::Config{&table, false, telemetry});
    if (where != nullptr) {
        require_condition_in_scope(*where, Scope{ScopedTable{table.name(), &table}});
        const auto* condition = where.get();
        FilterExecutor::Config filter_config{};
        filter_config.predicate = [condition](const Tuple& tuple, ExecutorContext&) {
            return evaluate_condition(*condition, tuple);
        };
        filter_config.telemetry = telemetry;
        root = std::make_unique<FilterExecutor>(std::move(root), std::move(filter_config));
    }
    return root;
}

}  // namespace

QueryExecutor::QueryExecutor(storage::Database& database)
    : QueryExecutor{database, Config{}}
{}

QueryExecutor::QueryExecutor(storage::Database& database, Config config)
    : database_{&database}
    , config_{std::move(config)}
{}

storage::Database& QueryExecutor::database() const noexcept
{
    return *database_;
}

const QueryExecutor::Config& QueryExecutor::config() const noexcept
{
    return config_;
}

QueryResult QueryExecutor::execute(std::string_view sql)
{
    CommandMetrics metrics{};
    metrics.command_text = std::string{sql};
    metrics.correlation_id = next_correlation_id();
    metrics.started_at = std::chrono::system_clock::now();
    const auto start = std::chrono::steady_clock::now();

    const auto finish = [&]() {
        const auto duration_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(std::chrono::steady_clock::now() - start);
        metrics.duration_ms = static_cast<double>(duration_ns.count()) / 1'000'000.0;
        metrics.finished_at = std::chrono::system_clock::now();
        if (config_.command_logger) {
            config_.command_logger(metrics);
        }
    };

    try {
        const auto statement = parser::parse_sql(sql);
        metrics.command_category = std::string{parser::statement_kind_name(statement)};
        auto result = execute(statement);

        metrics.success = true;
        if (result.message) {
            metrics.summary = *result.message;
            metrics.rows_touched = result.rows_affected;
        } else {
            metrics.summary = "Selected " + std::to_string(result.row_count) + " row(s)";
            metrics.rows_touched = result.row_count;
        }
        finish();
        return result;
    } catch (const std::system_error& error) {
        metrics.success = false;
        metrics.summary = error.what();
        metrics.error_code = error.code().value();
        metrics.error_category = error.code().category().name();
        finish();
        throw;
    }
}

QueryResult QueryExecutor::execute(const parser::Statement& statement)
{
    return std::visit(
        [this](const auto& node) -> QueryResult {
            using Node = std::decay_t<decltype(node)>;
            if constexpr (std::is_same_v<Node, parser::SelectStatement>) {
                return execute_select(node);
            } else if constexpr (std::is_same_v<Node, parser::InsertStatement>) {
                return execute_insert(node);
            } else if constexpr (std::is_same_v<Node, parser::UpdateStatement>) {
                return execute_update(node);
            } else if constexpr (std::is_same_v<Node, parser::DeleteStatement>) {
                return execute_delete(node);
            } else if constexpr (std::is_same_v<Node, parser::CreateTableStatement>) {
                return execute_create_table(node);
            } else if constexpr (std::is_same_v<Node, parser::CreateIndexStatement>) {
                return execute_create_index(node);
            } else {
                return execute_drop_table(node);
            }
        },
        statement);
}

QueryResult QueryExecutor::execute_select(const parser::SelectStatement& statement)
{
    auto* telemetry = config_.telemetry;
    const auto& base = database_->require_table(statement.table);
    const bool joined = !statement.joins.empty();

    Scope scope{ScopedTable{base.name(), &base}};
    ExecutorNodePtr root = std::make_unique<SeqScanExecutor>(SeqScanExecutor::Config{&base, joined, telemetry});

    for (const auto& join : statement.joins) {
        const auto& table = database_->require_table(join.table);
        const ScopedTable right{table.name(), &table};

        NestedLoopJoinExecutor::Config join_config{};
        join_config.type = join.type;
        join_config.left_key = bind_join_operand(join.left_column, NestedLoopJoinExecutor::Side::Left, scope, right);
        join_config.right_key = bind_join_operand(join.right_column, NestedLoopJoinExecutor::Side::Right, scope, right);
        for (const auto& entry : scope) {
            const auto names = joined_names(entry);
            join_config.left_columns.insert(join_config.left_columns.end(), names.begin(), names.end());
        }
        join_config.right_columns = joined_names(right);
        join_config.telemetry = telemetry;

        auto inner = std::make_unique<SeqScanExecutor>(SeqScanExecutor::Config{&table, true, telemetry});
        root = std::make_unique<NestedLoopJoinExecutor>(std::move(root), std::move(inner), std::move(join_config));
        scope.push_back(right);
    }

    if (statement.where != nullptr) {
        require_condition_in_scope(*statement.where, scope);
        const auto* condition = statement.where.get();
        FilterExecutor::Config filter_config{};
        filter_config.predicate = [condition](const Tuple& tuple, ExecutorContext&) {
            return evaluate_condition(*condition, tuple);
        };
        filter_config.telemetry = telemetry;
        root = std::make_unique<FilterExecutor>(std::move(root), std::move(filter_config));
    }

    if (statement.order_by) {
        require_column_in_scope(statement.order_by->column, scope);
        root = std::make_unique<SortExecutor>(
            std::move(root), SortExecutor::Config{statement.order_by->column, statement.order_by->descending, telemetry});
    }

    if (statement.limit) {
        root = std::make_unique<LimitExecutor>(std::move(root), LimitExecutor::Config{*statement.limit, telemetry});
    }

    std::vector<std::string> columns;
    for (const auto& column : statement.columns) {
        if (column == kAllColumns) {
            if (joined) {
                columns.push_back(column);
            } else {
                const auto order = base.column_order();
                columns.insert(columns.end(), order.begin(), order.end());
            }
            continue;
        }
        require_column_in_scope(column, scope);
        columns.push_back(column);
    }

    auto projection_owner = std::make_unique<ProjectionExecutor>(std::move(root), ProjectionExecutor::Config{columns, telemetry});
    auto& projection = *projection_owner;

    ExecutorContext context{ExecutorContextConfig{database_, telemetry}};
    QueryResult result{};
    projection.open(context);
    Tuple tuple;
    while (projection.next(context, tuple)) {
        ResultRow row;
        for (const auto& [name, value] : tuple.entries()) {
            row.insert_or_assign(name, value);
        }
        result.rows.push_back(std::move(row));
    }
    projection.close(context);

    result.columns = projection.output_columns();
    result.row_count = result.rows.size();
    return result;
}

QueryResult QueryExecutor::execute_insert(const parser::InsertStatement& statement)
{
    auto& table = database_->require_table(statement.table);

    storage::RowData data;
    if (statement.columns) {
        require_column_count(statement.columns->size(), statement.values.size(), "Column count doesn't match value count");
        for (std::size_t i = 0U; i < statement.values.size(); ++i) {
            data.insert_or_assign((*statement.columns)[i], statement.values[i]);
        }
    } else {
        const auto order = table.column_order();
        require_column_count(order.size(), statement.values.size(), "Value count doesn't match table column count");
        for (std::size_t i = 0U; i < statement.values.size(); ++i) {
            data.insert_or_assign(order[i], statement.values[i]);
        }
    }

    InsertExecutor::Config insert_config{};
    insert_config.table = &table;
    insert_config.rows.push_back(std::move(data));
    insert_config.telemetry = config_.telemetry;
    InsertExecutor insert{std::move(insert_config)};

    ExecutorContext context{ExecutorContextConfig{database_, config_.telemetry}};
    Tuple ignored;
    insert.open(context);
    (void)insert.next(context, ignored);
    insert.close(context);
    persist();

    QueryResult result{};
    result.rows_affected = insert.rows_affected();
    result.message = "Inserted 1 row (row_id=" + std::to_string(insert.last_row_id().value_or(0U)) + ")";
    return result;
}

QueryResult QueryExecutor::execute_update(const parser::UpdateStatement& statement)
{
    auto& table = database_->require_table(statement.table);

    UpdateExecutor::Config update_config{};
    update_config.table = &table;
    for (const auto& [column, value] : statement.assignments) {
        if (!table.has_column(column)) {
            throw_error(Errc::Schema, "Unknown column: '" + column + "'");
        }
        update_config.assignments.insert_or_assign(column, value);
    }
    update_config.telemetry = config_.telemetry;
    UpdateExecutor update{make_filtered_scan(table, statement.where, config_.telemetry), std::move(update_config)};

    ExecutorContext context{ExecutorContextConfig{database_, config_.telemetry}};
    Tuple ignored;
    try {
        update.open(context);
        (void)update.next(context, ignored);
        update.close(context);
    } catch (...) {
        if (update.rows_affected() != 0U) {
            persist();
        }
        throw;
    }
    persist();

    QueryResult result{};
    result.rows_affected = update.rows_affected();
    result.message = "Updated " + std::to_string(update.rows_affected()) + " row(s)";
    return result;
}

QueryResult QueryExecutor::execute_delete(const parser::DeleteStatement& statement)
{
    auto& table = database_->require_table(statement.table);

    DeleteExecutor remove{make_filtered_scan(table, statement.where, config_.telemetry),
                          DeleteExecutor::Config{&table, config_.telemetry}};

    ExecutorContext context{ExecutorContextConfig{database_, config_.telemetry}};
    Tuple ignored;
    try {
        remove.open(context);
        (void)remove.next(context, ignored);
        remove.close(context);
    } catch (...) {
        if (remove.rows_affected() != 0U) {
            persist();
        }
        throw;
    }
    persist();

    QueryResult result{};
    result.rows_affected = remove.rows_affected();
    result.message = "Deleted " + std::to_string(remove.rows_affected()) + " row(s)";
    return result;
}

QueryResult QueryExecutor::execute_create_table(const parser::CreateTableStatement& statement)
{
    const auto& table = database_->create_table(statement.table, statement.columns);
    note_persisted();

    QueryResult result{};
    result.message = "Created table '" + table.name() + "'";
    return result;
}

QueryResult QueryExecutor::execute_create_index(const parser::CreateIndexStatement& statement)
{
    auto& table = database_->require_table(statement.table);
    table.create_index(statement.column);
    persist();

    QueryResult result{};
    result.message = "Created index on " + statement.table + "." + statement.column;
    return result;
}

QueryResult QueryExecutor::execute_drop_table(const parser::DropTableStatement& statement)
{
    database_->drop_table(statement.table);
    note_persisted();

    QueryResult result{};
    result.message = "Dropped table '" + statement.table + "'";
    return result;
}

void QueryExecutor::persist()
{
    {
        ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Persist};
        database_->save();
    }
    note_persisted();
}

void QueryExecutor::note_persisted() noexcept
{
    if (config_.telemetry != nullptr && database_->config().persist) {
        config_.telemetry->record_snapshot_written();
    }
}

std::string QueryExecutor::next_correlation_id()
{
    return "stmt-" + std::to_string(next_correlation_.fetch_add(1U, std::memory_order_relaxed));
}

}  // namespace reldb::executor
