#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/storage/table.hpp"

#include <cstddef>
#include <vector>

namespace reldb::executor {

// Emits the live rows of a table in slot order. The rows are copied on open,
// so mutating the table while the scan is open does not disturb it.
class SeqScanExecutor final : public ExecutorNode {
public:
    struct Config final {
        const storage::Table* table = nullptr;
        // Also emit "table.column" ahead of each bare column name.
        bool qualify = false;
        ExecutorTelemetry* telemetry = nullptr;
    };

    explicit SeqScanExecutor(Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::vector<std::string> column_order_{};
    std::vector<storage::SlotRow> rows_{};
    std::size_t position_ = 0U;
};

}  // namespace reldb::executor
