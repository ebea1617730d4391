#pragma once

#include <array>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace reldb::executor {

struct ExecutorTelemetrySnapshot final {
    struct OperatorLatencySnapshot final {
        std::uint64_t invocations = 0U;
        std::uint64_t total_duration_ns = 0U;
        std::uint64_t last_duration_ns = 0U;
    };

    std::uint64_t seq_scan_rows_read = 0U;
    std::uint64_t filter_rows_evaluated = 0U;
    std::uint64_t filter_rows_passed = 0U;
    std::uint64_t nested_loop_rows_compared = 0U;
    std::uint64_t nested_loop_rows_matched = 0U;
    std::uint64_t nested_loop_rows_emitted = 0U;
    std::uint64_t sort_rows = 0U;
    std::uint64_t limit_rows_emitted = 0U;
    std::uint64_t projection_rows_emitted = 0U;
    std::uint64_t insert_rows_attempted = 0U;
    std::uint64_t insert_rows_succeeded = 0U;
    std::uint64_t update_rows_attempted = 0U;
    std::uint64_t update_rows_succeeded = 0U;
    std::uint64_t delete_rows_attempted = 0U;
    std::uint64_t delete_rows_succeeded = 0U;
    std::uint64_t snapshots_written = 0U;

    OperatorLatencySnapshot seq_scan_latency{};
    OperatorLatencySnapshot filter_latency{};
    OperatorLatencySnapshot nested_loop_latency{};
    OperatorLatencySnapshot sort_latency{};
    OperatorLatencySnapshot projection_latency{};
    OperatorLatencySnapshot insert_latency{};
    OperatorLatencySnapshot update_latency{};
    OperatorLatencySnapshot delete_latency{};
    OperatorLatencySnapshot persist_latency{};
};

class ExecutorTelemetry final {
public:
    enum class Operator {
        SeqScan = 0,
        Filter,
        NestedLoopJoin,
        Sort,
        Projection,
        Insert,
        Update,
        Delete,
        Persist,
        Count
    };

    class LatencyScope final {
    public:
        LatencyScope(ExecutorTelemetry* telemetry, Operator op) noexcept;
        ~LatencyScope();

        LatencyScope(const LatencyScope&) = delete;
        LatencyScope& operator=(const LatencyScope&) = delete;

    private:
        ExecutorTelemetry* telemetry_ = nullptr;
        Operator operator_ = Operator::SeqScan;
        std::chrono::steady_clock::time_point start_{};
    };

    void record_seq_scan_row() noexcept;
    void record_filter_row(bool passed) noexcept;
    void record_nested_loop_compare(bool matched) noexcept;
    void record_nested_loop_emit() noexcept;
    void record_sort_rows(std::size_t count) noexcept;
    void record_limit_emit() noexcept;
    void record_projection_row() noexcept;
    void record_insert_attempt() noexcept;
    void record_insert_success() noexcept;
    void record_update_attempt() noexcept;
    void record_update_success() noexcept;
    void record_delete_attempt() noexcept;
    void record_delete_success() noexcept;
    void record_snapshot_written() noexcept;

    void record_latency(Operator op, std::uint64_t duration_ns) noexcept;

    [[nodiscard]] ExecutorTelemetrySnapshot snapshot() const noexcept;
    void reset() noexcept;

private:
    struct OperatorLatencyCounters final {
        std::atomic<std::uint64_t> invocations{0U};
        std::atomic<std::uint64_t> total_duration_ns{0U};
        std::atomic<std::uint64_t> last_duration_ns{0U};
    };

    std::atomic<std::uint64_t> seq_scan_rows_read_{0U};
    std::atomic<std::uint64_t> filter_rows_evaluated_{0U};
    std::atomic<std::uint64_t> filter_rows_passed_{0U};
    std::atomic<std::uint64_t> nested_loop_rows_compared_{0U};
    std::atomic<std::uint64_t> nested_loop_rows_matched_{0U};
    std::atomic<std::uint64_t> nested_loop_rows_emitted_{0U};
    std::atomic<std::uint64_t> sort_rows_{0U};
    std::atomic<std::uint64_t> limit_rows_emitted_{0U};
    std::atomic<std::uint64_t> projection_rows_emitted_{0U};
    std::atomic<std::uint64_t> insert_rows_attempted_{0U};
    std::atomic<std::uint64_t> insert_rows_succeeded_{0U};
    std::atomic<std::uint64_t> update_rows_attempted_{0U};
    std::atomic<std::uint64_t> update_rows_succeeded_{0U};
    std::atomic<std::uint64_t> delete_rows_attempted_{0U};
    std::atomic<std::uint64_t> delete_rows_succeeded_{0U};
    std::atomic<std::uint64_t> snapshots_written_{0U};

    std::array<OperatorLatencyCounters, static_cast<std::size_t>(Operator::Count)> latencies_{};
};

}  // namespace reldb::executor
