#pragma once

#include "reldb/executor/command_metrics.hpp"
#include "reldb/executor/query_result.hpp"

#include <string>
#include <vector>

namespace reldb::tools {

// Single-line JSON record of one executed statement.
[[nodiscard]] std::string format_command_log_json(const executor::CommandMetrics& metrics);

// One JSON object per result row, keys in column order; a single
// {"message", "rows_affected"} object for statements without rows.
[[nodiscard]] std::vector<std::string> format_result_json_lines(const executor::QueryResult& result);

// Column header, one line per row with values separated by " | ", then a
// row count footer; the message alone for statements without rows.
[[nodiscard]] std::vector<std::string> format_result_text_lines(const executor::QueryResult& result);

}  // namespace reldb::tools
