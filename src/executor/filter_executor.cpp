#include "reldb/executor/filter_executor.hpp"

#include "reldb/executor/tuple.hpp"

#include <stdexcept>
#include <utility>

namespace reldb::executor {

FilterExecutor::FilterExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!config_.predicate) {
        throw std::invalid_argument{"FilterExecutor requires a predicate"};
    }
    if (!child) {
        throw std::invalid_argument{"FilterExecutor requires a child executor"};
    }
    add_child(std::move(child));
}

void FilterExecutor::open(ExecutorContext& context)
{
    if (child_count() != 1U) {
        throw std::logic_error{"FilterExecutor expected exactly one child"};
    }
    require_child(0U, "FilterExecutor").open(context);
}

bool FilterExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    auto* input = child(0U);
    if (input == nullptr) {
        return false;
    }

    while (input->next(context, tuple)) {
        bool passed = false;
        {
            ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Filter};
            passed = config_.predicate(tuple, context);
        }
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_filter_row(passed);
        }
        if (passed) {
            return true;
        }
    }

    return false;
}

void FilterExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

}  // namespace reldb::executor
