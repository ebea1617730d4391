#pragma once

#include <cstddef>
#include <memory>
#include <vector>

namespace reldb::executor {

class ExecutorContext;
class Tuple;

class ExecutorNode;
using ExecutorNodePtr = std::unique_ptr<ExecutorNode>;

// Pull-based operator: open once, call next until it returns false, close.
class ExecutorNode {
public:
    virtual ~ExecutorNode() = default;

    ExecutorNode(const ExecutorNode&) = delete;
    ExecutorNode& operator=(const ExecutorNode&) = delete;
    ExecutorNode(ExecutorNode&&) = default;
    ExecutorNode& operator=(ExecutorNode&&) = default;

    virtual void open(ExecutorContext& context) = 0;
    virtual bool next(ExecutorContext& context, Tuple& tuple) = 0;
    virtual void close(ExecutorContext& context) = 0;

    void add_child(ExecutorNodePtr child);

    [[nodiscard]] std::size_t child_count() const noexcept;
    [[nodiscard]] ExecutorNode* child(std::size_t index) const noexcept;
    [[nodiscard]] const std::vector<ExecutorNodePtr>& children() const noexcept;

protected:
    ExecutorNode() = default;

    // Throws std::logic_error unless child(index) exists.
    [[nodiscard]] ExecutorNode& require_child(std::size_t index, const char* owner) const;

private:
    std::vector<ExecutorNodePtr> children_{};
};

}  // namespace reldb::executor
