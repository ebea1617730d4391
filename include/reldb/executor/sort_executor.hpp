#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/executor/tuple.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace reldb::executor {

// Stable sort on one column. Nulls sort as the empty string; values that
// cannot be compared fall back to the total value order.
class SortExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::string column{};
        bool descending = false;
        ExecutorTelemetry* telemetry = nullptr;
    };

    SortExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::vector<Tuple> rows_{};
    std::size_t position_ = 0U;
};

// Negative, zero or positive as lhs sorts before, with or after rhs.
[[nodiscard]] int compare_for_sort(const catalog::Value& lhs, const catalog::Value& rhs);

}  // namespace reldb::executor
