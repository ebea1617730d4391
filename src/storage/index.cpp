#include "reldb/storage/index.hpp"

#include <utility>

namespace reldb::storage {

std::string_view index_kind_name(IndexKind kind) noexcept
{
    switch (kind) {
    case IndexKind::BTree:
        return "btree";
    case IndexKind::Hash:
        return "hash";
    }
    return "unknown";
}

Index::Index(std::string column_name)
    : column_name_{std::move(column_name)}
{}

const std::string& Index::column_name() const noexcept
{
    return column_name_;
}

}  // namespace reldb::storage
