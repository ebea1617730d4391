#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/storage/table.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace reldb::executor {

// Inserts its configured rows on the first call to next and produces no
// tuples. Rows inserted before a failing row stay in the table.
class InsertExecutor final : public ExecutorNode {
public:
    struct Config final {
        storage::Table* table = nullptr;
        std::vector<storage::RowData> rows{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    explicit InsertExecutor(Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

    [[nodiscard]] std::size_t rows_affected() const noexcept;
    [[nodiscard]] std::optional<std::uint64_t> last_row_id() const noexcept;

private:
    Config config_{};
    std::size_t rows_affected_ = 0U;
    std::optional<std::uint64_t> last_row_id_{};
    bool drained_ = false;
};

}  // namespace reldb::executor
