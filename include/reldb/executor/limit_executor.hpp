#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"

#include <cstddef>

namespace reldb::executor {

class LimitExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::size_t limit = 0U;
        ExecutorTelemetry* telemetry = nullptr;
    };

    LimitExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
    std::size_t emitted_ = 0U;
};

}  // namespace reldb::executor
