#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace reldb::executor {

// One record per statement passed to QueryExecutor::execute.
struct CommandMetrics final {
    bool success = false;
    std::string summary{};
    double duration_ms = 0.0;
    std::uint64_t rows_touched = 0U;
    std::string command_text{};
    std::string correlation_id{};
    // Statement kind such as "SELECT"; empty when the text did not parse.
    std::string command_category{};
    // Zero on success.
    int error_code = 0;
    std::string error_category{};
    std::chrono::system_clock::time_point started_at{};
    std::chrono::system_clock::time_point finished_at{};
};

using CommandLogger = std::function<void(const CommandMetrics&)>;

}  // namespace reldb::executor
