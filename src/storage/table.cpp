#include "reldb/storage/table.hpp"

#include "reldb/common/errors.hpp"
#include "reldb/storage/hash_index.hpp"

#include <algorithm>
#include <memory>
#include <stdexcept>
#include <system_error>
#include <utility>

namespace reldb::storage {

namespace {

// Lookup values are coerced to the column type first; a value that cannot be
// coerced matches nothing.
std::optional<catalog::Value> coerce_lookup(const catalog::Column& column, const catalog::Value& value)
{
    try {
        return catalog::convert_value(column, value);
    } catch (const std::system_error& error) {
        if (error.code() != Errc::Constraint) {
            throw;
        }
    }
    return std::nullopt;
}

const catalog::Value& column_value(const Row& row, const std::string& column_name)
{
    static const catalog::Value kNull{};
    const auto it = row.data.find(column_name);
    return it == row.data.end() ? kNull : it->second;
}

IndexPtr make_index(const std::string& column_name, IndexKind kind, std::size_t btree_order)
{
    if (kind == IndexKind::Hash) {
        return std::make_unique<HashIndex>(column_name);
    }
    return std::make_unique<BTreeIndex>(column_name, btree_order);
}

}  // namespace

Table::Table(std::string name, std::vector<catalog::Column> columns, std::size_t btree_order)
    : name_{std::move(name)}
    , columns_{std::move(columns)}
    , btree_order_{btree_order}
{
    if (columns_.empty()) {
        throw_error(Errc::Schema, "Table must have at least one column");
    }

    for (std::size_t position = 0U; position < columns_.size(); ++position) {
        const auto [it, inserted] = column_positions_.emplace(columns_[position].name, position);
        if (!inserted) {
            throw_error(Errc::Schema, "Duplicate column '" + it->first + "' in table '" + name_ + "'");
        }
    }

    for (const auto& column : columns_) {
        if (column.requires_index()) {
            create_index(column.name);
        }
    }
}

const std::string& Table::name() const noexcept
{
    return name_;
}

const std::vector<catalog::Column>& Table::columns() const noexcept
{
    return columns_;
}

std::vector<std::string> Table::column_order() const
{
    std::vector<std::string> names;
    names.reserve(columns_.size());
    for (const auto& column : columns_) {
        names.push_back(column.name);
    }
    return names;
}

const catalog::Column* Table::find_column(std::string_view column_name) const noexcept
{
    const auto it = column_positions_.find(std::string{column_name});
    if (it == column_positions_.end()) {
        return nullptr;
    }
    return &columns_[it->second];
}

bool Table::has_column(std::string_view column_name) const noexcept
{
    return find_column(column_name) != nullptr;
}

std::size_t Table::btree_order() const noexcept
{
    return btree_order_;
}

const catalog::Column& Table::require_column(std::string_view column_name) const
{
    const auto* column = find_column(column_name);
    if (column == nullptr) {
        throw_error(Errc::Schema, "Column '" + std::string{column_name} + "' does not exist in table '" + name_ + "'");
    }
    return *column;
}

RowSlot& Table::require_slot(SlotId slot)
{
    return const_cast<RowSlot&>(std::as_const(*this).require_slot(slot));
}

const RowSlot& Table::require_slot(SlotId slot) const
{
    if (slot >= slots_.size()) {
        throw_error(Errc::Execution, "Invalid row slot " + std::to_string(slot) + " in table '" + name_ + "'");
    }
    const auto& entry = slots_[slot];
    if (!entry.occupied()) {
        throw_error(Errc::Execution, "Row slot " + std::to_string(slot) + " in table '" + name_ + "' was deleted");
    }
    return entry;
}

void Table::create_index(const std::string& column_name, IndexKind kind)
{
    const auto& column = require_column(column_name);
    if (indexes_.find(column.name) != indexes_.end()) {
        return;
    }

    indexes_.emplace(column.name, build_index(column.name, kind));
}

IndexPtr Table::build_index(const std::string& column_name, IndexKind kind) const
{
    auto index = make_index(column_name, kind, btree_order_);
    for (SlotId slot = 0U; slot < slots_.size(); ++slot) {
        if (!slots_[slot].occupied()) {
            continue;
        }
        const auto& value = column_value(slots_[slot].row, column_name);
        if (!value.is_null()) {
            index->insert(value, slot);
        }
    }
    return index;
}

const Index* Table::index(std::string_view column_name) const noexcept
{
    const auto it = indexes_.find(column_name);
    return it == indexes_.end() ? nullptr : it->second.get();
}

const std::map<std::string, IndexPtr, std::less<>>& Table::indexes() const noexcept
{
    return indexes_;
}

RowData Table::validate_row(const RowData& data, ValidationMode mode, std::optional<SlotId> exclude) const
{
    for (const auto& [column_name, value] : data) {
        if (!has_column(column_name)) {
            throw_error(Errc::Schema, "Unknown column: '" + column_name + "'");
        }
    }

    RowData converted;
    for (const auto& column : columns_) {
        const auto it = data.find(column.name);
        if (mode == ValidationMode::Update && it == data.end()) {
            continue;
        }

        auto value = catalog::validate_value(column, it == data.end() ? catalog::Value::null() : it->second);
        if (column.requires_index() && !value.is_null() && has_duplicate(column, value, exclude)) {
            throw_error(Errc::Constraint,
                        std::string{"Duplicate value for "} + (column.primary_key ? "PRIMARY KEY" : "UNIQUE") + " column '"
                            + column.name + "'");
        }
        converted.emplace(column.name, std::move(value));
    }
    return converted;
}

bool Table::has_duplicate(const catalog::Column& column, const catalog::Value& value, std::optional<SlotId> exclude) const
{
    const auto not_excluded = [&exclude](SlotId slot) { return !exclude.has_value() || *exclude != slot; };

    if (const auto* existing = index(column.name); existing != nullptr) {
        const auto slots = existing->search(value);
        return std::any_of(slots.begin(), slots.end(), not_excluded);
    }

    for (SlotId slot = 0U; slot < slots_.size(); ++slot) {
        if (slots_[slot].occupied() && not_excluded(slot)
            && catalog::values_equal(column_value(slots_[slot].row, column.name), value)) {
            return true;
        }
    }
    return false;
}

const Row& Table::insert(const RowData& data)
{
    RowData full;
    for (const auto& [column_name, value] : data) {
        if (!has_column(column_name)) {
            throw_error(Errc::Schema, "Unknown column: '" + column_name + "'");
        }
    }
    for (const auto& column : columns_) {
        const auto it = data.find(column.name);
        if (it != data.end()) {
            full.emplace(column.name, it->second);
        } else {
            full.emplace(column.name, column.default_value);
        }
    }

    auto converted = validate_row(full);

    const SlotId slot = slots_.size();
    RowSlot entry{};
    entry.state = SlotState::Occupied;
    entry.row.row_id = next_row_id_;
    entry.row.data = std::move(converted);
    slots_.push_back(std::move(entry));
    ++next_row_id_;
    ++live_rows_;

    const auto& row = slots_.back().row;
    for (auto& [column_name, index] : indexes_) {
        const auto& value = column_value(row, column_name);
        if (!value.is_null()) {
            index->insert(value, slot);
        }
    }
    return row;
}

const Row& Table::update(SlotId slot, const RowData& updates)
{
    auto& target = require_slot(slot);
    auto converted = validate_row(updates, ValidationMode::Update, slot);

    for (auto& [column_name, value] : converted) {
        auto& current = target.row.data[column_name];
        const auto it = indexes_.find(column_name);
        if (it != indexes_.end()) {
            if (!current.is_null()) {
                it->second->remove(current, slot);
            }
            if (!value.is_null()) {
                it->second->insert(value, slot);
            }
        }
        current = std::move(value);
    }
    return target.row;
}

void Table::remove(SlotId slot)
{
    auto& target = require_slot(slot);
    for (auto& [column_name, index] : indexes_) {
        const auto& value = column_value(target.row, column_name);
        if (!value.is_null()) {
            index->remove(value, slot);
        }
    }
    target.state = SlotState::Tombstone;
    target.row = Row{};
    --live_rows_;
}

std::vector<SlotRow> Table::scan() const
{
    std::vector<SlotRow> rows;
    rows.reserve(live_rows_);
    for (SlotId slot = 0U; slot < slots_.size(); ++slot) {
        if (slots_[slot].occupied()) {
            rows.push_back(SlotRow{slot, slots_[slot].row});
        }
    }
    return rows;
}

std::vector<SlotRow> Table::collect_slots(const std::vector<SlotId>& slots) const
{
    std::vector<SlotRow> rows;
    rows.reserve(slots.size());
    for (const auto slot : slots) {
        if (slot < slots_.size() && slots_[slot].occupied()) {
            rows.push_back(SlotRow{slot, slots_[slot].row});
        }
    }
    return rows;
}

std::vector<SlotRow> Table::find_by_column(std::string_view column_name, const catalog::Value& value) const
{
    const auto& column = require_column(column_name);

    std::optional<catalog::Value> key{value};
    if (!value.is_null()) {
        key = coerce_lookup(column, value);
        if (!key) {
            return {};
        }
    }

    if (const auto* existing = index(column.name); existing != nullptr && !key->is_null()) {
        auto slots = existing->search(*key);
        std::sort(slots.begin(), slots.end());
        return collect_slots(slots);
    }

    std::vector<SlotRow> rows;
    for (SlotId slot = 0U; slot < slots_.size(); ++slot) {
        if (slots_[slot].occupied() && catalog::values_equal(column_value(slots_[slot].row, column.name), *key)) {
            rows.push_back(SlotRow{slot, slots_[slot].row});
        }
    }
    return rows;
}

std::vector<SlotRow> Table::find_by_range(std::string_view column_name,
                                          const catalog::Value& low,
                                          const catalog::Value& high) const
{
    const auto& column = require_column(column_name);
    if (low.is_null() || high.is_null()) {
        return {};
    }
    const auto lower = coerce_lookup(column, low);
    const auto upper = coerce_lookup(column, high);
    if (!lower || !upper) {
        return {};
    }

    if (const auto* btree = dynamic_cast<const BTreeIndex*>(index(column.name)); btree != nullptr) {
        std::vector<SlotId> slots;
        for (const auto& entry : btree->range_search(*lower, *upper)) {
            slots.push_back(entry.slot);
        }
        std::sort(slots.begin(), slots.end());
        return collect_slots(slots);
    }

    std::vector<SlotRow> rows;
    for (SlotId slot = 0U; slot < slots_.size(); ++slot) {
        if (!slots_[slot].occupied()) {
            continue;
        }
        const auto& candidate = column_value(slots_[slot].row, column.name);
        const auto above = catalog::compare_values(*lower, candidate);
        const auto below = catalog::compare_values(candidate, *upper);
        if (above && below && *above <= 0 && *below <= 0) {
            rows.push_back(SlotRow{slot, slots_[slot].row});
        }
    }
    return rows;
}

const Row& Table::row_at(SlotId slot) const
{
    return require_slot(slot).row;
}

const std::vector<RowSlot>& Table::slots() const noexcept
{
    return slots_;
}

std::size_t Table::live_row_count() const noexcept
{
    return live_rows_;
}

std::uint64_t Table::next_row_id() const noexcept
{
    return next_row_id_;
}

std::string Table::describe_column(std::string_view column_name) const
{
    return catalog::describe_column(require_column(column_name));
}

std::vector<std::string> Table::describe() const
{
    std::vector<std::string> lines;
    lines.reserve(columns_.size());
    for (const auto& column : columns_) {
        lines.push_back(catalog::describe_column(column));
    }
    return lines;
}

void Table::restore_rows(std::vector<RowSlot> slots, std::uint64_t next_row_id)
{
    slots_ = std::move(slots);
    next_row_id_ = next_row_id;
    live_rows_ = static_cast<std::size_t>(
        std::count_if(slots_.begin(), slots_.end(), [](const RowSlot& slot) { return slot.occupied(); }));

    for (auto& [column_name, index] : indexes_) {
        index = build_index(column_name, index->kind());
    }
}

void Table::restore_index(IndexPtr index)
{
    if (!index) {
        throw std::invalid_argument{"Table::restore_index requires an index"};
    }
    const auto& column = require_column(index->column_name());
    indexes_.insert_or_assign(column.name, std::move(index));
}

}  // namespace reldb::storage
