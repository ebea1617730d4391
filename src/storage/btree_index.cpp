#include "reldb/storage/btree_index.hpp"

#include <algorithm>
#include <compare>
#include <iterator>
#include <stdexcept>
#include <utility>

namespace reldb::storage {

namespace {

std::strong_ordering compare_entries(const IndexEntry& lhs, const IndexEntry& rhs) noexcept
{
    if (const auto ordering = catalog::total_order(lhs.key, rhs.key); ordering != 0) {
        return ordering;
    }
    return lhs.slot <=> rhs.slot;
}

bool entry_less(const IndexEntry& lhs, const IndexEntry& rhs) noexcept
{
    return compare_entries(lhs, rhs) < 0;
}

bool key_in_range(const catalog::Value& key, const catalog::Value& low, const catalog::Value& high) noexcept
{
    return catalog::total_order(key, low) >= 0 && catalog::total_order(key, high) <= 0;
}

}  // namespace

BTreeIndex::BTreeIndex(std::string column_name, std::size_t order)
    : Index{std::move(column_name)}
    , order_{order}
    , root_{std::make_unique<Node>()}
{
    if (order_ < 2U) {
        throw std::invalid_argument{"BTreeIndex order must be at least 2"};
    }
}

IndexKind BTreeIndex::kind() const noexcept
{
    return IndexKind::BTree;
}

std::size_t BTreeIndex::order() const noexcept
{
    return order_;
}

std::size_t BTreeIndex::size() const noexcept
{
    return size_;
}

std::size_t BTreeIndex::height() const noexcept
{
    std::size_t levels = 1U;
    const Node* node = root_.get();
    while (!node->leaf) {
        node = node->children.front().get();
        ++levels;
    }
    return levels;
}

std::size_t BTreeIndex::max_entries() const noexcept
{
    return 2U * order_ - 1U;
}

bool BTreeIndex::is_full(const Node& node) const noexcept
{
    return node.entries.size() >= max_entries();
}

void BTreeIndex::insert(const catalog::Value& key, SlotId slot)
{
    if (is_full(*root_)) {
        auto new_root = std::make_unique<Node>();
        new_root->leaf = false;
        new_root->children.push_back(std::move(root_));
        root_ = std::move(new_root);
        split_child(*root_, 0U);
    }

    insert_non_full(*root_, IndexEntry{key, slot});
    ++size_;
}

void BTreeIndex::split_child(Node& parent, std::size_t index)
{
    auto& full = *parent.children[index];
    auto right = std::make_unique<Node>();
    right->leaf = full.leaf;

    const auto median_position = order_ - 1U;
    IndexEntry median = std::move(full.entries[median_position]);

    right->entries.assign(std::make_move_iterator(full.entries.begin() + static_cast<std::ptrdiff_t>(median_position + 1U)),
                          std::make_move_iterator(full.entries.end()));
    full.entries.resize(median_position);

    if (!full.leaf) {
        right->children.assign(std::make_move_iterator(full.children.begin() + static_cast<std::ptrdiff_t>(order_)),
                               std::make_move_iterator(full.children.end()));
        full.children.resize(order_);
    }

    parent.entries.insert(parent.entries.begin() + static_cast<std::ptrdiff_t>(index), std::move(median));
    parent.children.insert(parent.children.begin() + static_cast<std::ptrdiff_t>(index + 1U), std::move(right));
}

void BTreeIndex::insert_non_full(Node& node, IndexEntry entry)
{
    auto position = std::upper_bound(node.entries.begin(), node.entries.end(), entry, entry_less);
    if (node.leaf) {
        node.entries.insert(position, std::move(entry));
        return;
    }

    auto child_index = static_cast<std::size_t>(std::distance(node.entries.begin(), position));
    if (is_full(*node.children[child_index])) {
        split_child(node, child_index);
        if (entry_less(node.entries[child_index], entry)) {
            ++child_index;
        }
    }
    insert_non_full(*node.children[child_index], std::move(entry));
}

std::vector<SlotId> BTreeIndex::search(const catalog::Value& key) const
{
    std::vector<IndexEntry> matches;
    collect_range(*root_, key, key, matches);

    std::vector<SlotId> slots;
    slots.reserve(matches.size());
    for (const auto& match : matches) {
        slots.push_back(match.slot);
    }
    return slots;
}

std::vector<IndexEntry> BTreeIndex::range_search(const catalog::Value& low, const catalog::Value& high) const
{
    std::vector<IndexEntry> result;
    if (catalog::total_order(low, high) > 0) {
        return result;
    }
    collect_range(*root_, low, high, result);
    return result;
}

void BTreeIndex::collect_range(const Node& node,
                               const catalog::Value& low,
                               const catalog::Value& high,
                               std::vector<IndexEntry>& out) const
{
    for (std::size_t index = 0U; index < node.entries.size(); ++index) {
        const auto& entry = node.entries[index];
        // children[index] only holds keys <= entry.key
        if (!node.leaf && catalog::total_order(entry.key, low) >= 0) {
            collect_range(*node.children[index], low, high, out);
        }
        if (key_in_range(entry.key, low, high)) {
            out.push_back(entry);
        }
        if (catalog::total_order(entry.key, high) > 0) {
            return;
        }
    }
    if (!node.leaf) {
        collect_range(*node.children.back(), low, high, out);
    }
}

std::vector<IndexEntry> BTreeIndex::entries() const
{
    std::vector<IndexEntry> result;
    result.reserve(size_);
    collect_all(*root_, result);
    return result;
}

void BTreeIndex::collect_all(const Node& node, std::vector<IndexEntry>& out) const
{
    for (std::size_t index = 0U; index < node.entries.size(); ++index) {
        if (!node.leaf) {
            collect_all(*node.children[index], out);
        }
        out.push_back(node.entries[index]);
    }
    if (!node.leaf) {
        collect_all(*node.children.back(), out);
    }
}

bool BTreeIndex::remove(const catalog::Value& key, SlotId slot)
{
    const IndexEntry target{key, slot};
    const bool removed = remove_from(*root_, target);

    if (root_->entries.empty() && !root_->leaf) {
        auto child = std::move(root_->children.front());
        root_ = std::move(child);
    }

    if (removed) {
        --size_;
    }
    return removed;
}

bool BTreeIndex::remove_from(Node& node, const IndexEntry& target)
{
    const auto position = std::lower_bound(node.entries.begin(), node.entries.end(), target, entry_less);
    auto index = static_cast<std::size_t>(std::distance(node.entries.begin(), position));
    const bool found = position != node.entries.end() && compare_entries(*position, target) == 0;

    if (found && node.leaf) {
        node.entries.erase(position);
        return true;
    }

    if (found) {
        auto& left = *node.children[index];
        auto& right = *node.children[index + 1U];
        if (left.entries.size() >= order_) {
            auto predecessor = max_entry(left);
            node.entries[index] = predecessor;
            return remove_from(left, predecessor);
        }
        if (right.entries.size() >= order_) {
            auto successor = min_entry(right);
            node.entries[index] = successor;
            return remove_from(right, successor);
        }
        merge_children(node, index);
        return remove_from(*node.children[index], target);
    }

    if (node.leaf) {
        return false;
    }

    if (node.children[index]->entries.size() < order_) {
        const bool was_last = index == node.entries.size();
        fill_child(node, index);
        if (was_last && index > node.entries.size()) {
            --index;
        }
    }
    return remove_from(*node.children[index], target);
}

void BTreeIndex::fill_child(Node& node, std::size_t index)
{
    if (index > 0U && node.children[index - 1U]->entries.size() >= order_) {
        borrow_from_previous(node, index);
    } else if (index < node.entries.size() && node.children[index + 1U]->entries.size() >= order_) {
        borrow_from_next(node, index);
    } else if (index < node.entries.size()) {
        merge_children(node, index);
    } else {
        merge_children(node, index - 1U);
    }
}

void BTreeIndex::borrow_from_previous(Node& node, std::size_t index)
{
    auto& child = *node.children[index];
    auto& sibling = *node.children[index - 1U];

    child.entries.insert(child.entries.begin(), std::move(node.entries[index - 1U]));
    if (!child.leaf) {
        child.children.insert(child.children.begin(), std::move(sibling.children.back()));
        sibling.children.pop_back();
    }
    node.entries[index - 1U] = std::move(sibling.entries.back());
    sibling.entries.pop_back();
}

void BTreeIndex::borrow_from_next(Node& node, std::size_t index)
{
    auto& child = *node.children[index];
    auto& sibling = *node.children[index + 1U];

    child.entries.push_back(std::move(node.entries[index]));
    if (!child.leaf) {
        child.children.push_back(std::move(sibling.children.front()));
        sibling.children.erase(sibling.children.begin());
    }
    node.entries[index] = std::move(sibling.entries.front());
    sibling.entries.erase(sibling.entries.begin());
}

void BTreeIndex::merge_children(Node& node, std::size_t index)
{
    auto& child = *node.children[index];
    auto& sibling = *node.children[index + 1U];

    child.entries.push_back(std::move(node.entries[index]));
    child.entries.insert(child.entries.end(),
                         std::make_move_iterator(sibling.entries.begin()),
                         std::make_move_iterator(sibling.entries.end()));
    child.children.insert(child.children.end(),
                          std::make_move_iterator(sibling.children.begin()),
                          std::make_move_iterator(sibling.children.end()));

    node.entries.erase(node.entries.begin() + static_cast<std::ptrdiff_t>(index));
    node.children.erase(node.children.begin() + static_cast<std::ptrdiff_t>(index + 1U));
}

const IndexEntry& BTreeIndex::max_entry(const Node& node)
{
    const Node* current = &node;
    while (!current->leaf) {
        current = current->children.back().get();
    }
    return current->entries.back();
}

const IndexEntry& BTreeIndex::min_entry(const Node& node)
{
    const Node* current = &node;
    while (!current->leaf) {
        current = current->children.front().get();
    }
    return current->entries.front();
}

bool BTreeIndex::check_invariants() const
{
    std::size_t leaf_depth = 0U;
    std::size_t counted = 0U;
    if (!check_node(*root_, true, 1U, leaf_depth, nullptr, nullptr)) {
        return false;
    }
    counted = entries().size();
    return counted == size_;
}

bool BTreeIndex::check_node(const Node& node,
                            bool is_root,
                            std::size_t depth,
                            std::size_t& leaf_depth,
                            const IndexEntry* lower,
                            const IndexEntry* upper) const
{
    if (node.entries.size() > max_entries()) {
        return false;
    }
    if (!is_root && node.entries.size() < order_ - 1U) {
        return false;
    }
    for (std::size_t index = 0U; index < node.entries.size(); ++index) {
        const auto& entry = node.entries[index];
        if (index > 0U && !entry_less(node.entries[index - 1U], entry)) {
            return false;
        }
        if ((lower != nullptr && !entry_less(*lower, entry)) || (upper != nullptr && !entry_less(entry, *upper))) {
            return false;
        }
    }

    if (node.leaf) {
        if (!node.children.empty()) {
            return false;
        }
        if (leaf_depth == 0U) {
            leaf_depth = depth;
        }
        return leaf_depth == depth;
    }

    if (node.children.size() != node.entries.size() + 1U) {
        return false;
    }
    for (std::size_t index = 0U; index < node.children.size(); ++index) {
        const IndexEntry* child_lower = index == 0U ? lower : &node.entries[index - 1U];
        const IndexEntry* child_upper = index == node.entries.size() ? upper : &node.entries[index];
        if (!check_node(*node.children[index], false, depth + 1U, leaf_depth, child_lower, child_upper)) {
            return false;
        }
    }
    return true;
}

}  // namespace reldb::storage
