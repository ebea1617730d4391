#include "reldb/executor/limit_executor.hpp"

#include <stdexcept>
#include <utility>

namespace reldb::executor {

LimitExecutor::LimitExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"LimitExecutor requires a child executor"};
    }
    add_child(std::move(child));
}

void LimitExecutor::open(ExecutorContext& context)
{
    require_child(0U, "LimitExecutor").open(context);
    emitted_ = 0U;
}

bool LimitExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    if (emitted_ >= config_.limit) {
        return false;
    }
    auto* input = child(0U);
    if (input == nullptr || !input->next(context, tuple)) {
        return false;
    }
    ++emitted_;
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_limit_emit();
    }
    return true;
}

void LimitExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

}  // namespace reldb::executor
