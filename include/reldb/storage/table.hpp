#pragma once

#include "reldb/catalog/column.hpp"
#include "reldb/catalog/value.hpp"
#include "reldb/storage/btree_index.hpp"
#include "reldb/storage/index.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace reldb::storage {

using RowData = std::map<std::string, catalog::Value, std::less<>>;

struct Row final {
    std::uint64_t row_id = 0U;
    RowData data{};
};

enum class SlotState : std::uint8_t {
    Occupied = 0,
    Tombstone
};

// One position in the append-only row arena. Deleted rows keep their slot.
struct RowSlot final {
    SlotState state = SlotState::Tombstone;
    Row row{};

    [[nodiscard]] bool occupied() const noexcept { return state == SlotState::Occupied; }
};

// A live row together with the slot it occupies.
struct SlotRow final {
    SlotId slot = 0U;
    Row row{};
};

enum class ValidationMode : std::uint8_t {
    Insert = 0,
    Update
};

class Table final {
public:
    Table(std::string name, std::vector<catalog::Column> columns, std::size_t btree_order = BTreeIndex::kDefaultOrder);

    Table(const Table&) = delete;
    Table& operator=(const Table&) = delete;
    Table(Table&&) = default;
    Table& operator=(Table&&) = default;

    [[nodiscard]] const std::string& name() const noexcept;
    [[nodiscard]] const std::vector<catalog::Column>& columns() const noexcept;
    [[nodiscard]] std::vector<std::string> column_order() const;
    [[nodiscard]] const catalog::Column* find_column(std::string_view column_name) const noexcept;
    [[nodiscard]] bool has_column(std::string_view column_name) const noexcept;
    [[nodiscard]] std::size_t btree_order() const noexcept;

    void create_index(const std::string& column_name, IndexKind kind = IndexKind::BTree);
    [[nodiscard]] const Index* index(std::string_view column_name) const noexcept;
    [[nodiscard]] const std::map<std::string, IndexPtr, std::less<>>& indexes() const noexcept;

    const Row& insert(const RowData& data);

    // Converts and checks the supplied values, including PRIMARY KEY and
    // UNIQUE duplicates outside `exclude`. Update mode only looks at the
    // columns present in `data`. Returns the converted values.
    [[nodiscard]] RowData validate_row(const RowData& data,
                                       ValidationMode mode = ValidationMode::Insert,
                                       std::optional<SlotId> exclude = std::nullopt) const;

    const Row& update(SlotId slot, const RowData& updates);
    void remove(SlotId slot);

    [[nodiscard]] std::vector<SlotRow> scan() const;
    [[nodiscard]] std::vector<SlotRow> find_by_column(std::string_view column_name, const catalog::Value& value) const;
    [[nodiscard]] std::vector<SlotRow> find_by_range(std::string_view column_name,
                                                     const catalog::Value& low,
                                                     const catalog::Value& high) const;

    [[nodiscard]] const Row& row_at(SlotId slot) const;
    [[nodiscard]] const std::vector<RowSlot>& slots() const noexcept;
    [[nodiscard]] std::size_t live_row_count() const noexcept;
    [[nodiscard]] std::uint64_t next_row_id() const noexcept;

    [[nodiscard]] std::string describe_column(std::string_view column_name) const;
    [[nodiscard]] std::vector<std::string> describe() const;

    // Snapshot restore hooks. Rows are taken as persisted without
    // revalidation; existing indexes are rebuilt from them until a persisted
    // index replaces them.
    void restore_rows(std::vector<RowSlot> slots, std::uint64_t next_row_id);
    void restore_index(IndexPtr index);

private:
    [[nodiscard]] const catalog::Column& require_column(std::string_view column_name) const;
    [[nodiscard]] RowSlot& require_slot(SlotId slot);
    [[nodiscard]] const RowSlot& require_slot(SlotId slot) const;
    [[nodiscard]] bool has_duplicate(const catalog::Column& column,
                                     const catalog::Value& value,
                                     std::optional<SlotId> exclude) const;
    [[nodiscard]] IndexPtr build_index(const std::string& column_name, IndexKind kind) const;
    [[nodiscard]] std::vector<SlotRow> collect_slots(const std::vector<SlotId>& slots) const;

    std::string name_{};
    std::vector<catalog::Column> columns_{};
    std::unordered_map<std::string, std::size_t> column_positions_{};
    std::size_t btree_order_ = BTreeIndex::kDefaultOrder;
    std::vector<RowSlot> slots_{};
    std::map<std::string, IndexPtr, std::less<>> indexes_{};
    std::uint64_t next_row_id_ = 0U;
    std::size_t live_rows_ = 0U;
};

}  // namespace reldb::storage
