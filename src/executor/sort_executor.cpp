#include "reldb/executor/sort_executor.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace reldb::executor {

namespace {

int ordering_to_int(std::strong_ordering ordering) noexcept
{
    if (ordering < 0) {
        return -1;
    }
    return ordering > 0 ? 1 : 0;
}

catalog::Value sort_key(const catalog::Value& value)
{
    return value.is_null() ? catalog::Value::text("") : value;
}

}  // namespace

int compare_for_sort(const catalog::Value& lhs, const catalog::Value& rhs)
{
    const auto left = sort_key(lhs);
    const auto right = sort_key(rhs);
    if (const auto ordering = catalog::compare_values(left, right); ordering) {
        return ordering_to_int(*ordering);
    }
    return ordering_to_int(catalog::total_order(left, right));
}

SortExecutor::SortExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"SortExecutor requires a child executor"};
    }
    if (config_.column.empty()) {
        throw std::invalid_argument{"SortExecutor requires a sort column"};
    }
    add_child(std::move(child));
}

void SortExecutor::open(ExecutorContext& context)
{
    auto& input = require_child(0U, "SortExecutor");
    input.open(context);

    rows_.clear();
    position_ = 0U;
    Tuple tuple;
    while (input.next(context, tuple)) {
        rows_.push_back(tuple);
    }

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Sort};
    const auto& column = config_.column;
    if (config_.descending) {
        std::stable_sort(rows_.begin(), rows_.end(), [&column](const Tuple& lhs, const Tuple& rhs) {
            return compare_for_sort(lhs.value_or_null(column), rhs.value_or_null(column)) > 0;
        });
    } else {
        std::stable_sort(rows_.begin(), rows_.end(), [&column](const Tuple& lhs, const Tuple& rhs) {
            return compare_for_sort(lhs.value_or_null(column), rhs.value_or_null(column)) < 0;
        });
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_sort_rows(rows_.size());
    }
}

bool SortExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    (void)context;
    if (position_ >= rows_.size()) {
        return false;
    }
    tuple = std::move(rows_[position_++]);
    return true;
}

void SortExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
    rows_.clear();
    position_ = 0U;
}

}  // namespace reldb::executor
