#include "reldb/executor/executor_telemetry.hpp"

namespace reldb::executor {

namespace {

void bump(std::atomic<std::uint64_t>& counter, std::uint64_t amount = 1U) noexcept
{
    counter.fetch_add(amount, std::memory_order_relaxed);
}

}  // namespace

ExecutorTelemetry::LatencyScope::LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept
    : telemetry_{telemetry}
    , operator_{op}
{
    if (telemetry_ != nullptr) {
        start_ = std::chrono::steady_clock::now();
    }
}

ExecutorTelemetry::LatencyScope::~LatencyScope()
{
    if (telemetry_ == nullptr) {
        return;
    }
    const auto end = std::chrono::steady_clock::now();
    const auto elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(end - start_);
    const auto duration_ns = elapsed.count() > 0 ? static_cast<std::uint64_t>(elapsed.count()) : 0ULL;
    telemetry_->record_latency(operator_, duration_ns);
}

void ExecutorTelemetry::record_seq_scan_row() noexcept
{
    bump(seq_scan_rows_read_);
}

void ExecutorTelemetry::record_filter_row(bool passed) noexcept
{
    bump(filter_rows_evaluated_);
    if (passed) {
        bump(filter_rows_passed_);
    }
}

void ExecutorTelemetry::record_nested_loop_compare(bool matched) noexcept
{
    bump(nested_loop_rows_compared_);
    if (matched) {
        bump(nested_loop_rows_matched_);
    }
}

void ExecutorTelemetry::record_nested_loop_emit() noexcept
{
    bump(nested_loop_rows_emitted_);
}

void ExecutorTelemetry::record_sort_rows(std::size_t count) noexcept
{
    bump(sort_rows_, static_cast<std::uint64_t>(count));
}

void ExecutorTelemetry::record_limit_emit() noexcept
{
    bump(limit_rows_emitted_);
}

void ExecutorTelemetry::record_projection_row() noexcept
{
    bump(projection_rows_emitted_);
}

void ExecutorTelemetry::record_insert_attempt() noexcept
{
    bump(insert_rows_attempted_);
}

void ExecutorTelemetry::record_insert_success() noexcept
{
    bump(insert_rows_succeeded_);
}

void ExecutorTelemetry::record_update_attempt() noexcept
{
    bump(update_rows_attempted_);
}

void ExecutorTelemetry::record_update_success() noexcept
{
    bump(update_rows_succeeded_);
}

void ExecutorTelemetry::record_delete_attempt() noexcept
{
    bump(delete_rows_attempted_);
}

void ExecutorTelemetry::record_delete_success() noexcept
{
    bump(delete_rows_succeeded_);
}

void ExecutorTelemetry::record_snapshot_written() noexcept
{
    bump(snapshots_written_);
}

void ExecutorTelemetry::record_latency(Operator op, std::uint64_t duration_ns) noexcept
{
    const auto index = static_cast<std::size_t>(op);
    if (index >= latencies_.size()) {
        return;
    }
    auto& counters = latencies_[index];
    counters.invocations.fetch_add(1U, std::memory_order_relaxed);
    counters.total_duration_ns.fetch_add(duration_ns, std::memory_order_relaxed);
    counters.last_duration_ns.store(duration_ns, std::memory_order_relaxed);
}

ExecutorTelemetrySnapshot ExecutorTelemetry::snapshot() const noexcept
{
    ExecutorTelemetrySnapshot snapshot{};
    snapshot.seq_scan_rows_read = seq_scan_rows_read_.load(std::memory_order_relaxed);
    snapshot.filter_rows_evaluated = filter_rows_evaluated_.load(std::memory_order_relaxed);
    snapshot.filter_rows_passed = filter_rows_passed_.load(std::memory_order_relaxed);
    snapshot.nested_loop_rows_compared = nested_loop_rows_compared_.load(std::memory_order_relaxed);
    snapshot.nested_loop_rows_matched = nested_loop_rows_matched_.load(std::memory_order_relaxed);
    snapshot.nested_loop_rows_emitted = nested_loop_rows_emitted_.load(std::memory_order_relaxed);
    snapshot.sort_rows = sort_rows_.load(std::memory_order_relaxed);
    snapshot.limit_rows_emitted = limit_rows_emitted_.load(std::memory_order_relaxed);
    snapshot.projection_rows_emitted = projection_rows_emitted_.load(std::memory_order_relaxed);
    snapshot.insert_rows_attempted = insert_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.insert_rows_succeeded = insert_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.update_rows_attempted = update_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.update_rows_succeeded = update_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.delete_rows_attempted = delete_rows_attempted_.load(std::memory_order_relaxed);
    snapshot.delete_rows_succeeded = delete_rows_succeeded_.load(std::memory_order_relaxed);
    snapshot.snapshots_written = snapshots_written_.load(std::memory_order_relaxed);

    const auto make_latency_snapshot = [&](Operator operator_kind) {
        ExecutorTelemetrySnapshot::OperatorLatencySnapshot latency{};
        const auto& counters = latencies_[static_cast<std::size_t>(operator_kind)];
        latency.invocations = counters.invocations.load(std::memory_order_relaxed);
        latency.total_duration_ns = counters.total_duration_ns.load(std::memory_order_relaxed);
        latency.last_duration_ns = counters.last_duration_ns.load(std::memory_order_relaxed);
        return latency;
    };

    snapshot.seq_scan_latency = make_latency_snapshot(Operator::SeqScan);
    snapshot.filter_latency = make_latency_snapshot(Operator::Filter);
    snapshot.nested_loop_latency = make_latency_snapshot(Operator::NestedLoopJoin);
    snapshot.sort_latency = make_latency_snapshot(Operator::Sort);
    snapshot.projection_latency = make_latency_snapshot(Operator::Projection);
    snapshot.insert_latency = make_latency_snapshot(Operator::Insert);
    snapshot.update_latency = make_latency_snapshot(Operator::Update);
    snapshot.delete_latency = make_latency_snapshot(Operator::Delete);
    snapshot.persist_latency = make_latency_snapshot(Operator::Persist);

    return snapshot;
}

void ExecutorTelemetry::reset() noexcept
{
    for (auto* counter : {&seq_scan_rows_read_, &filter_rows_evaluated_, &filter_rows_passed_,
                          &nested_loop_rows_compared_, &nested_loop_rows_matched_, &nested_loop_rows_emitted_,
                          &sort_rows_, &limit_rows_emitted_, &projection_rows_emitted_,
                          &insert_rows_attempted_, &insert_rows_succeeded_, &update_rows_attempted_,
                          &update_rows_succeeded_, &delete_rows_attempted_, &delete_rows_succeeded_,
                          &snapshots_written_}) {
        counter->store(0U, std::memory_order_relaxed);
    }

    for (auto& latency : latencies_) {
        latency.invocations.store(0U, std::memory_order_relaxed);
        latency.total_duration_ns.store(0U, std::memory_order_relaxed);
        latency.last_duration_ns.store(0U, std::memory_order_relaxed);
    }
}

}  // namespace reldb::executor
