#pragma once

#include "reldb/catalog/value.hpp"

#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace reldb::executor {

using ResultRow = std::map<std::string, catalog::Value, std::less<>>;

struct QueryResult final {
    std::vector<std::string> columns{};
    std::vector<ResultRow> rows{};
    // Always rows.size(); statements other than SELECT return no rows.
    std::size_t row_count = 0U;
    // Rows inserted, updated or deleted by a data-modifying statement.
    std::size_t rows_affected = 0U;
    std::optional<std::string> message{};
};

}  // namespace reldb::executor
