#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"

#include <functional>

namespace reldb::executor {

class FilterExecutor final : public ExecutorNode {
public:
    using Predicate = std::function<bool(const Tuple&, ExecutorContext&)>;

    struct Config final {
        Predicate predicate{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    FilterExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

private:
    Config config_{};
};

}  // namespace reldb::executor
