#include "reldb/storage/hash_index.hpp"

#include <algorithm>
#include <utility>

namespace reldb::storage {

HashIndex::HashIndex(std::string column_name)
    : Index{std::move(column_name)}
{}

IndexKind HashIndex::kind() const noexcept
{
    return IndexKind::Hash;
}

void HashIndex::insert(const catalog::Value& key, SlotId slot)
{
    buckets_[key].push_back(slot);
    ++size_;
}

std::vector<SlotId> HashIndex::search(const catalog::Value& key) const
{
    const auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return {};
    }
    return it->second;
}

bool HashIndex::remove(const catalog::Value& key, SlotId slot)
{
    const auto it = buckets_.find(key);
    if (it == buckets_.end()) {
        return false;
    }

    auto& slots = it->second;
    const auto position = std::find(slots.begin(), slots.end(), slot);
    if (position == slots.end()) {
        return false;
    }

    slots.erase(position);
    if (slots.empty()) {
        buckets_.erase(it);
    }
    --size_;
    return true;
}

std::size_t HashIndex::size() const noexcept
{
    return size_;
}

std::size_t HashIndex::distinct_keys() const noexcept
{
    return buckets_.size();
}

std::vector<IndexEntry> HashIndex::entries() const
{
    std::vector<const std::pair<const catalog::Value, std::vector<SlotId>>*> ordered;
    ordered.reserve(buckets_.size());
    for (const auto& bucket : buckets_) {
        ordered.push_back(&bucket);
    }
    std::sort(ordered.begin(), ordered.end(), [](const auto* lhs, const auto* rhs) {
        return catalog::total_order(lhs->first, rhs->first) < 0;
    });

    std::vector<IndexEntry> result;
    result.reserve(size_);
    for (const auto* bucket : ordered) {
        for (const auto slot : bucket->second) {
            result.push_back(IndexEntry{bucket->first, slot});
        }
    }
    return result;
}

}  // namespace reldb::storage
