#pragma once

#include "reldb/storage/index.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace reldb::storage {

// In-memory B-tree of order t: every node holds at most 2t-1 entries and every
// non-root node at least t-1. Entries are ordered by (key, slot), so equal keys
// from different rows stay distinct and may sit in neighbouring subtrees.
class BTreeIndex final : public Index {
public:
    static constexpr std::size_t kDefaultOrder = 3U;

    explicit BTreeIndex(std::string column_name, std::size_t order = kDefaultOrder);

    [[nodiscard]] IndexKind kind() const noexcept override;

    void insert(const catalog::Value& key, SlotId slot) override;
    [[nodiscard]] std::vector<SlotId> search(const catalog::Value& key) const override;
    bool remove(const catalog::Value& key, SlotId slot) override;

    [[nodiscard]] std::size_t size() const noexcept override;
    [[nodiscard]] std::vector<IndexEntry> entries() const override;

    // Every entry with low <= key <= high, in key order.
    [[nodiscard]] std::vector<IndexEntry> range_search(const catalog::Value& low, const catalog::Value& high) const;

    [[nodiscard]] std::size_t order() const noexcept;
    [[nodiscard]] std::size_t height() const noexcept;

    // Verifies ordering, node fill bounds and uniform leaf depth.
    [[nodiscard]] bool check_invariants() const;

private:
    struct Node final {
        bool leaf = true;
        std::vector<IndexEntry> entries{};
        std::vector<std::unique_ptr<Node>> children{};
    };

    [[nodiscard]] std::size_t max_entries() const noexcept;
    [[nodiscard]] bool is_full(const Node& node) const noexcept;

    void split_child(Node& parent, std::size_t index);
    void insert_non_full(Node& node, IndexEntry entry);

    bool remove_from(Node& node, const IndexEntry& target);
    void fill_child(Node& node, std::size_t index);
    void borrow_from_previous(Node& node, std::size_t index);
    void borrow_from_next(Node& node, std::size_t index);
    void merge_children(Node& node, std::size_t index);

    static const IndexEntry& max_entry(const Node& node);
    static const IndexEntry& min_entry(const Node& node);

    void collect_range(const Node& node,
                       const catalog::Value& low,
                       const catalog::Value& high,
                       std::vector<IndexEntry>& out) const;
    void collect_all(const Node& node, std::vector<IndexEntry>& out) const;
    bool check_node(const Node& node,
                    bool is_root,
                    std::size_t depth,
                    std::size_t& leaf_depth,
                    const IndexEntry* lower,
                    const IndexEntry* upper) const;

    std::size_t order_ = kDefaultOrder;
    std::unique_ptr<Node> root_{};
    std::size_t size_ = 0U;
};

}  // namespace reldb::storage
