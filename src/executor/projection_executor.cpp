#include "reldb/executor/projection_executor.hpp"

#include "reldb/executor/tuple.hpp"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace reldb::executor {

namespace {

constexpr std::string_view kAllColumns = "*";

}  // namespace

ProjectionExecutor::ProjectionExecutor(ExecutorNodePtr child, Config config)
    : config_{std::move(config)}
{
    if (!child) {
        throw std::invalid_argument{"ProjectionExecutor requires a child executor"};
    }
    if (config_.columns.empty()) {
        throw std::invalid_argument{"ProjectionExecutor requires at least one column"};
    }
    add_child(std::move(child));
}

void ProjectionExecutor::open(ExecutorContext& context)
{
    require_child(0U, "ProjectionExecutor").open(context);
    source_columns_.clear();
    resolved_ = false;
}

bool ProjectionExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    auto* input = child(0U);
    if (input == nullptr) {
        return false;
    }

    Tuple source;
    if (!input->next(context, source)) {
        return false;
    }

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::Projection};
    if (!resolved_) {
        resolve_columns(&source);
    }

    tuple.clear();
    for (const auto& column : source_columns_) {
        tuple.set(unqualified_name(column), source.value_or_null(column));
    }

    if (config_.telemetry != nullptr) {
        config_.telemetry->record_projection_row();
    }
    return true;
}

void ProjectionExecutor::close(ExecutorContext& context)
{
    if (auto* input = child(0U); input != nullptr) {
        input->close(context);
    }
}

std::vector<std::string> ProjectionExecutor::output_columns() const
{
    std::vector<std::string> names;
    const auto append = [&names](std::string_view column) {
        const auto name = unqualified_name(column);
        if (std::find(names.begin(), names.end(), name) == names.end()) {
            names.emplace_back(name);
        }
    };

    if (resolved_) {
        for (const auto& column : source_columns_) {
            append(column);
        }
        return names;
    }
    for (const auto& column : config_.columns) {
        if (column != kAllColumns) {
            append(column);
        }
    }
    return names;
}

void ProjectionExecutor::resolve_columns(const Tuple* first)
{
    source_columns_.clear();
    for (const auto& column : config_.columns) {
        if (column != kAllColumns) {
            source_columns_.push_back(column);
            continue;
        }
        if (first != nullptr) {
            const auto names = first->names();
            source_columns_.insert(source_columns_.end(), names.begin(), names.end());
        }
    }
    resolved_ = true;
}

}  // namespace reldb::executor
