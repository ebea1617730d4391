#pragma once

#include "reldb/executor/executor_node.hpp"
#include "reldb/executor/executor_telemetry.hpp"
#include "reldb/executor/tuple.hpp"
#include "reldb/parser/ast.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace reldb::executor {

// Equality join of two inputs. Both inputs are materialised on open; output
// tuples carry the left entries followed by the right ones, with right-hand
// values replacing left-hand values under the same name.
class NestedLoopJoinExecutor final : public ExecutorNode {
public:
    enum class Side {
        Left = 0,
        Right
    };

    struct JoinKey final {
        std::string name{};
        Side side = Side::Left;
    };

    struct Config final {
        parser::JoinType type = parser::JoinType::Inner;
        JoinKey left_key{};
        JoinKey right_key{};
        // Names set to null when one side has no match (RIGHT and LEFT joins).
        std::vector<std::string> left_columns{};
        std::vector<std::string> right_columns{};
        ExecutorTelemetry* telemetry = nullptr;
    };

    NestedLoopJoinExecutor(ExecutorNodePtr outer, ExecutorNodePtr inner, Config config);

    void open(ExecutorContext& context) override;
    bool next(ExecutorContext& context, Tuple& tuple) override;
    void close(ExecutorContext& context) override;

private:
    [[nodiscard]] bool matches(const Tuple& left, const Tuple& right);
    void emit(Tuple tuple);
    void join_from_left(const std::vector<Tuple>& left_rows, const std::vector<Tuple>& right_rows);
    void join_from_right(const std::vector<Tuple>& left_rows, const std::vector<Tuple>& right_rows);

    Config config_{};
    std::vector<Tuple> output_{};
    std::size_t position_ = 0U;
};

}  // namespace reldb::executor
