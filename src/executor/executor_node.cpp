#include "reldb/executor/executor_node.hpp"

#include <stdexcept>
#include <string>

namespace reldb::executor {

void ExecutorNode::add_child(ExecutorNodePtr child)
{
    if (!child) {
        throw std::invalid_argument("executor child must not be null");
    }
    children_.push_back(std::move(child));
}

std::size_t ExecutorNode::child_count() const noexcept
{
    return children_.size();
}

ExecutorNode* ExecutorNode::child(std::size_t index) const noexcept
{
    if (index >= children_.size()) {
        return nullptr;
    }
    return children_[index].get();
}

const std::vector<ExecutorNodePtr>& ExecutorNode::children() const noexcept
{
    return children_;
}

ExecutorNode& ExecutorNode::require_child(std::size_t index, const char* owner) const
{
    auto* node = child(index);
    if (node == nullptr) {
        throw std::logic_error{std::string{owner} + " missing child executor " + std::to_string(index)};
    }
    return *node;
}

}  // namespace reldb::executor
