#pragma once

#include <chrono>
#include <string>

namespace reldb {

// "YYYY-MM-DDTHH:MM:SS.uuuuuuZ"; empty for a default-constructed time point.
[[nodiscard]] std::string format_timestamp_iso(std::chrono::system_clock::time_point tp);

}  // namespace reldb
