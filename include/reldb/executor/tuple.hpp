#pragma once

#include "reldb/catalog/value.hpp"
#include "reldb/storage/index.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace reldb::executor {

// A row flowing between executor nodes: named values in insertion order plus
// the source slot when the row comes straight from a single table.
class Tuple final {
public:
    using Entry = std::pair<std::string, catalog::Value>;

    // Replaces an existing entry in place, otherwise appends.
    void set(std::string_view name, catalog::Value value);

    [[nodiscard]] const catalog::Value* find(std::string_view name) const noexcept;
    // Exact name first, then the column part of a "table.column" reference.
    [[nodiscard]] const catalog::Value* resolve(std::string_view name) const noexcept;
    [[nodiscard]] catalog::Value value_or_null(std::string_view name) const;

    [[nodiscard]] const std::vector<Entry>& entries() const noexcept;
    [[nodiscard]] std::vector<std::string> names() const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;
    void clear() noexcept;

    [[nodiscard]] std::optional<storage::SlotId> slot() const noexcept;
    void set_slot(std::optional<storage::SlotId> slot) noexcept;

private:
    std::vector<Entry> entries_{};
    std::optional<storage::SlotId> slot_{};
};

// "orders.amount" -> "amount"; unqualified names come back unchanged.
[[nodiscard]] std::string_view unqualified_name(std::string_view name) noexcept;
// "orders.amount" -> "orders"; empty for unqualified names.
[[nodiscard]] std::string_view qualifier_of(std::string_view name) noexcept;

}  // namespace reldb::executor
