#pragma once

#include "reldb/catalog/value.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace reldb::storage {

// Stable position of a row in its table's slot arena.
using SlotId = std::size_t;

enum class IndexKind : std::uint8_t {
    BTree = 0,
    Hash
};

[[nodiscard]] std::string_view index_kind_name(IndexKind kind) noexcept;

struct IndexEntry final {
    catalog::Value key{};
    SlotId slot = 0U;
};

// Maps a column value to the set of row slots currently holding it.
class Index {
public:
    virtual ~Index() = default;

    Index(const Index&) = delete;
    Index& operator=(const Index&) = delete;
    Index(Index&&) = default;
    Index& operator=(Index&&) = default;

    [[nodiscard]] virtual IndexKind kind() const noexcept = 0;

    virtual void insert(const catalog::Value& key, SlotId slot) = 0;
    [[nodiscard]] virtual std::vector<SlotId> search(const catalog::Value& key) const = 0;
    // Returns false when no (key, slot) entry exists.
    virtual bool remove(const catalog::Value& key, SlotId slot) = 0;

    [[nodiscard]] virtual std::size_t size() const noexcept = 0;
    [[nodiscard]] virtual std::vector<IndexEntry> entries() const = 0;

    [[nodiscard]] const std::string& column_name() const noexcept;

protected:
    explicit Index(std::string column_name);

private:
    std::string column_name_{};
};

using IndexPtr = std::unique_ptr<Index>;

}  // namespace reldb::storage
