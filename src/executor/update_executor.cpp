#include "reldb/executor/update_executor.hpp"

#include "reldb/executor/tuple.hpp"

#include <stdexcept>
#include <utility>
#include <vector>

namespace reldb::executor {

UpdateExecutor::UpdateExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"UpdateExecutor requires a child executor"};
    }
    if (config_.table == nullptr) {
        throw std::invalid_argument{"UpdateExecutor requires a target table"};
    }
    add_child(std::move(child));
}

void UpdateExecutor::open(ExecutorContext& context)
{
    require_child(0U, "UpdateExecutor").open(context);
    child_open_ = true;
    drained_ = false;
    rows_affected_ = 0U;
}

bool UpdateExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    if (drained_) {
        return false;
    }
    drained_ = true;

    auto& input = require_child(0U, "UpdateExecutor");
    std::vector<storage::SlotId> targets;
    while (input.next(context, tuple)) {
        const auto slot = tuple.slot();
        if (!slot) {
            throw std::logic_error{"UpdateExecutor received a tuple without a slot"};
        }
        targets.push_back(*slot);
    }

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Update};
    for (const auto slot : targets) {
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_update_attempt();
        }
        (void)config_.table->update(slot, config_.assignments);
        ++rows_affected_;
        if (config_.telemetry != nullptr) {
            config_.telemetry->record_update_success();
        }
    }
    return false;
}

void UpdateExecutor::close(ExecutorContext& context)
{
    if (child_open_) {
        require_child(0U, "UpdateExecutor").close(context);
        child_open_ = false;
    }
    drained_ = true;
}

std::size_t UpdateExecutor::rows_affected() const noexcept
{
    return rows_affected_;
}

}  // namespace reldb::executor
