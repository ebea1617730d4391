#include "reldb/executor/insert_executor.hpp"

#include <stdexcept>
#include <utility>

namespace reldb::executor {

InsertExecutor::InsertExecutor(Config config)
    : config_{std::move(config)}
{
    if (config_.table == nullptr) {
        throw std::invalid_argument{"InsertExecutor requires a target table"};
    }
}

void InsertExecutor::open(ExecutorContext& context)
{
    (void)context;
    rows_affected_ = 0U;
    last_row_id_.reset();
    drained_ = false;
}

bool InsertExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    (void)context;
    (void)tuple;
    if (drained_) {
        return false;
    }
    drained_ = true;

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Insert};
    for (const auto& data : config_.rows) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_insert_attempt();
        }
        const auto& row = config_.table->insert(data);
        last_row_id_ = row.row_id;
        ++rows_affected_;
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_insert_success();
        }
    }
    return false;
}

void InsertExecutor::close(ExecutorContext& context)
{
    (void)context;
    drained_ = true;
}

std::size_t InsertExecutor::rows_affected() const noexcept
{
    return rows_affected_;
}

std::optional<std::uint64_t> InsertExecutor::last_row_id() const noexcept
{
    return last_row_id_;
}

}  // namespace reldb::executor
