#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"

#include <string>
#include <vector>

namespace reldb::executor {

// Maps each input tuple onto the selected columns under their bare names.
// A "*" entry expands to the names carried by the first input tuple.
class ProjectionExecutor final : public ExecutorNode {
public:
    struct Config final {
        std::vector<std::string> columns{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    ProjectionExecutor(ExecutorNodePtr child, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

    // Bare output names without duplicates. Stable once a tuple has been
    // produced; before that any "*" expands to nothing.
    [[nodiscard]] std::vector<std::string> output_columns() const;

private:
    void resolve_columns(const Tuple* first);

    Config config_{};
    std::vector<std::string> source_columns_{};
    bool resolved_ = false;
};

}  // namespace reldb::executor
