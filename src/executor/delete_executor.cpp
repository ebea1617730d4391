#include "reldb/executor/delete_executor.hpp"

#include "reldb/executor/tuple.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace reldb::executor {

DeleteExecutor::DeleteExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"DeleteExecutor requires a child executor"};
    }
    if (config_.table == nullptr) {
        throw std::invalid_argument{"DeleteExecutor requires a target table"};
    }
    add_child(std::move(child));
}

void DeleteExecutor::open(ExecutorContext& context)
{
    require_child(0U, "DeleteExecutor").open(context);
    child_open_ = true;
    drained_ = false;
    rows_affected_ = 0U;
}

bool DeleteExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    if (drained_) {
        return false;
    }
    drained_ = true;

    auto& input = require_child(0U, "DeleteExecutor");
    std::vector<storage::SlotId> targets;
    while (input.next(context, tuple)) {
        const auto slot = tuple.slot();
        if (!slot) {
            throw std::logic_error{"DeleteExecutor received a tuple without a slot"};
        }
        targets.push_back(*slot);
    }

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Delete};
    for (const auto slot : targets) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_delete_attempt();
        }
        config_.table->remove(slot);
        ++rows_affected_;
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_delete_success();
        }
    }
    return false;
}

void DeleteExecutor::close(ExecutorContext& context)
{
    if (child_open_) {
        require_child(0U, "DeleteExecutor").close(context);
        child_open_ = false;
    }
    drained_ = true;
}

std::size_t DeleteExecutor::rows_affected() const noexcept
{
    return rows_affected_;
}

}  // namespace reldb::executor
