#include "reldb/executor/tuple.hpp"

namespace reldb::executor {

void Tuple::set(std::string_view name, catalog::Value value)
{
    for (auto& entry : entries_) {
        if (entry.first == name) {
            entry.second = std::move(value);
            return;
        }
    }
    entries_.emplace_back(std::string{name}, std::move(value));
}

const catalog::Value* Tuple::find(std::string_view name) const noexcept
{
    for (const auto& entry : entries_) {
        if (entry.first == name) {
            return &entry.second;
        }
    }
    return nullptr;
}

const catalog::Value* Tuple::resolve(std::string_view name) const noexcept
{
    if (const auto* value = find(name); value != nullptr) {
        return value;
    }
    const auto column = unqualified_name(name);
    if (column.size() == name.size()) {
        return nullptr;
    }
    return find(column);
}

catalog::Value Tuple::value_or_null(std::string_view name) const
{
    const auto* value = resolve(name);
    return value != nullptr ? *value : catalog::Value::null();
}

const std::vector<Tuple::Entry>& Tuple::entries() const noexcept
{
    return entries_;
}

std::vector<std::string> Tuple::names() const
{
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (const auto& entry : entries_) {
        result.push_back(entry.first);
    }
    return result;
}

std::size_t Tuple::size() const noexcept
{
    return entries_.size();
}

bool Tuple::empty() const noexcept
{
    return entries_.empty();
}

void Tuple::clear() noexcept
{
    entries_.clear();
    slot_.reset();
}

std::optional<storage::SlotId> Tuple::slot() const noexcept
{
    return slot_;
}

void Tuple::set_slot(std::optional<storage::SlotId> slot) noexcept
{
    slot_ = slot;
}

std::string_view unqualified_name(std::string_view name) noexcept
{
    const auto dot = name.find('.');
    return dot == std::string_view::npos ? name : name.substr(dot + 1U);
}

std::string_view qualifier_of(std::string_view name) noexcept
{
    const auto dot = name.find('.');
    return dot == std::string_view::npos ? std::string_view{} : name.substr(0U, dot);
}

}  // namespace reldb::executor
