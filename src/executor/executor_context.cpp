#include "reldb/executor/executor_context.hpp"

namespace reldb::executor {

ExecutorContext::ExecutorContext()
    : ExecutorContext{ExecutorContextConfig{}}
{}

ExecutorContext::ExecutorContext(ExecutorContextConfig config)
    : config_{config}
{}

storage::Database* ExecutorContext::database() const noexcept
{
    return config_.database;
}

ExecutorTelemetry* ExecutorContext::telemetry() const noexcept
{
    return config_.telemetry;
}

}  // namespace reldb::executor
