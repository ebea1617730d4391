#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/storage/table.hpp"

#include <cstddef>

namespace reldb::executor {

// Tombstones every slot produced by the child, after draining it.
class DeleteExecutor final : public ExecutorNode {
public:
    struct Config final {
        storage::Table* table = nullptr;
        ExecutorTelemetry* telemetry = nullptr;
    };

    DeleteExecutor(ExecutorNodePtr child, Config config);

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
