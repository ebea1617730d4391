#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/storage/table.hpp"

#include <cstddef>

namespace reldb::executor {

// Applies the assignments to every slot produced by the child. The child is
// drained before the first row changes; rows are then updated one at a time,
// so a failure leaves earlier rows updated.
class UpdateExecutor final : public ExecutorNode {
public:
    struct Config final {
        storage::Table* table = nullptr;
        storage::RowData assignments{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    UpdateExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

    [[nodiscard]] std::size_t rows_affected() const noexcept;

private:
    Config config_{};
    std::size_t rows_affected_ = 0U;
    bool child_open_ = false;
    bool drained_ = false;
};

}  // namespace reldb::executor
