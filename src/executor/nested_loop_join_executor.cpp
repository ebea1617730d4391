#include "reldb/executor/nested_loop_join_executor.hpp"

#include "reldb/catalog/value.hpp"

#include <stdexcept>
#include <utility>

namespace reldb::executor {

namespace {

std::vector<Tuple> drain(ExecutorNode& node, ExecutorContext& context)
{
    std::vector<Tuple> rows;
    Tuple tuple;
    while (node.next(context, tuple)) {
        rows.push_back(tuple);
    }
    return rows;
}

Tuple merge(const Tuple& left, const Tuple& right)
{
    Tuple merged = left;
    merged.set_slot(std::nullopt);
    for (const auto& [name, value] : right.entries()) {
        merged.set(name, value);
    }
    return merged;
}

}  // namespace

NestedLoopJoinExecutor::NestedLoopJoinExecutor(ExecutorNodePtr outer, ExecutorNodePtr inner, Config config)
    : config_{std::move(config)}
{
    if (!outer || !inner) {
        throw std::invalid_argument{"NestedLoopJoinExecutor requires outer and inner children"};
    }
    if (config_.left_key.name.empty() || config_.right_key.name.empty()) {
        throw std::invalid_argument{"NestedLoopJoinExecutor requires join keys"};
    }
    add_child(std::move(outer));
    add_child(std::move(inner));
}

void NestedLoopJoinExecutor::open(ExecutorContext& context)
{
    if (child_count() != 2U) {
        throw std::logic_error{"NestedLoopJoinExecutor expected exactly two children"};
    }
    auto& outer = require_child(0U, "NestedLoopJoinExecutor");
    auto& inner = require_child(1U, "NestedLoopJoinExecutor");
    outer.open(context);
    inner.open(context);

    ExecutorTelemetry::LatencyScope latency_scope{config_.telemetry, ExecutorTelemetry::Operator::NestedLoopJoin};
    const auto left_rows = drain(outer, context);
    const auto right_rows = drain(inner, context);

    output_.clear();
    position_ = 0U;
    if (config_.type == parser::JoinType::Right) {
        join_from_right(left_rows, right_rows);
    } else {
        join_from_left(left_rows, right_rows);
    }
}

bool NestedLoopJoinExecutor::next(ExecutorContext& context, Tuple& tuple)
{
    (void)context;
    if (position_ >= output_.size()) {
        return false;
    }
    tuple = std::move(output_[position_++]);
    return true;
}

void NestedLoopJoinExecutor::close(ExecutorContext& context)
{
    for (const auto& input : children()) {
        input->close(context);
    }
    output_.clear();
    position_ = 0U;
}

bool NestedLoopJoinExecutor::matches(const Tuple& left, const Tuple& right)
{
    const auto key_value = [&](const JoinKey& key) {
        return (key.side == Side::Left ? left : right).value_or_null(key.name);
    };
    const bool matched = catalog::values_equal(key_value(config_.left_key), key_value(config_.right_key));
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_nested_loop_compare(matched);
    }
    return matched;
}

void NestedLoopJoinExecutor::emit(Tuple tuple)
{
    output_.push_back(std::move(tuple));
    if (config_.telemetry != nullptr) {
        config_.telemetry->record_nested_loop_emit();
    }
}

void NestedLoopJoinExecutor::join_from_left(const std::vector<Tuple>& left_rows, const std::vector<Tuple>& right_rows)
{
    for (const auto& left : left_rows) {
        bool matched = false;
        for (const auto& right : right_rows) {
            if (matches(left, right)) {
                matched = true;
                emit(merge(left, right));
            }
        }
        if (!matched && config_.type == parser::JoinType::Left) {
            Tuple padded = left;
            padded.set_slot(std::nullopt);
            for (const auto& name : config_.right_columns) {
                padded.set(name, catalog::Value::null());
            }
            emit(std::move(padded));
        }
    }
}

void NestedLoopJoinExecutor::join_from_right(const std::vector<Tuple>& left_rows, const std::vector<Tuple>& right_rows)
{
    for (const auto& right : right_rows) {
        bool matched = false;
        for (const auto& left : left_rows) {
            if (matches(left, right)) {
                matched = true;
                emit(merge(left, right));
            }
        }
        if (!matched) {
            Tuple padded;
            for (const auto& name : config_.left_columns) {
                padded.set(name, catalog::Value::null());
            }
            emit(merge(padded, right));
        }
    }
}

}  // namespace reldb::executor
