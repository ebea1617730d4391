#pragma once

#include "reldb/storage/index.hpp"

#include <unordered_map>
#include <vector>

namespace reldb::storage {

// Exact-match index: key -> slots in insertion order. No range support.
class HashIndex final : public Index {
public:
    explicit HashIndex(std::string column_name);

    [[nodiscard]] IndexKind kind() const noexcept override;

    void insert(const catalog::Value& key, SlotId slot) override;
    [[nodiscard]] std::vector<SlotId> search(const catalog::Value& key) const override;
    bool remove(const catalog::Value& key, SlotId slot) override;

    [[nodiscard]] std::size_t size() const noexcept override;
    // Sorted by key, then by insertion order, so snapshots are stable.
    [[nodiscard]] std::vector<IndexEntry> entries() const override;

    [[nodiscard]] std::size_t distinct_keys() const noexcept;

private:
    std::unordered_map<catalog::Value, std::vector<SlotId>, catalog::ValueHash, catalog::ValueKeyEqual> buckets_{};
    std::size_t size_ = 0U;
};

}  // namespace reldb::storage
