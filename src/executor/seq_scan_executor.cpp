#include "reldb/executor/seq_scan_executor.hpp"

#include "reldb/executor/tuple.hpp"

#include <stdexcept>
#include <utility>

namespace reldb::executor {

SeqScanExecutor::SeqScanExecutor(Config config)
    : config_{std::move(config)}
{
    if (config_.table == nullptr) {
        throw std::invalid_argument{"SeqScanExecutor requires a table"};
    }
}

void SeqScanExecutor::open(ExecutorContext& context)
{
    (void)context;
    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::SeqScan};
    column_order_ = config_.table->column_order();
    rows_ = config_.table->scan();
    position_ = 0U;
}

bool SeqScanExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    (void)context;
    if (position_ >= rows_.size()) {
        return false;
    }

    const auto& current = rows_[position_++];
    tuple.clear();
    tuple.set_slot(current.slot);
    for (const auto& column : column_order_) {
        const auto it = current.row.data.find(column);
        auto value = it != current.row.data.end() ? it->second : catalog::Value::null();
        if (config_.qualify) {
            tuple.set(config_.table->name() + "." + column, value);
        }
        tuple.set(column, std::move(value));
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_seq_scan_row();
    }
    return true;
}

void SeqScanExecutor::close(ExecutorContext& context)
{
    (void)context;
    rows_.clear();
    position_ = 0U;
}

}  // namespace reldb::executor
