#include "reldb/tools/command_log_formatter.hpp"

#include "reldb/common/time_format.hpp"
#include "reldb/storage/json_document.hpp"
#include "reldb/storage/snapshot_codec.hpp"

#include <cstdint>
#include <string_view>

namespace reldb::tools {

namespace {

std::string join_line(const std::vector<std::string>& fields)
{
    std::string line;
    for (std::size_t i = 0; i < fields.size(); ++i) {
        if (i > 0U) {
            line.append(" | ");
        }
        line.append(fields[i]);
    }
    return line;
}

}  // namespace

std::string format_command_log_json(const executor::CommandMetrics& metrics)
{
    std::string json;
    json.reserve(256U);
    json.push_back('{');
    bool first = true;

    auto append_field = [&](const char* name) {
        if (!first) {
            json.push_back(',');
        }
        first = false;
        json.push_back('"');
        json.append(name);
        json.push_back('"');
        json.push_back(':');
    };

    auto append_string_field = [&](const char* name, const std::string& value) {
        append_field(name);
        storage::append_json_string(json, value);
    };

    auto append_number_field = [&](const char* name, auto value) {
        append_field(name);
        json.append(std::to_string(value));
    };

    auto append_bool_field = [&](const char* name, bool value) {
        append_field(name);
        json.append(value ? "true" : "false");
    };

    auto append_timestamp_field = [&](const char* name, std::chrono::system_clock::time_point value) {
        const auto formatted = format_timestamp_iso(value);
        append_field(name);
        if (formatted.empty()) {
            json.append("null");
        } else {
            storage::append_json_string(json, formatted);
        }
    };

    append_string_field("correlation_id", metrics.correlation_id);
    append_string_field("category", metrics.command_category);
    append_string_field("sql", metrics.command_text);
    append_string_field("summary", metrics.summary);
    append_bool_field("success", metrics.success);
    append_number_field("duration_ms", metrics.duration_ms);
    append_number_field("rows_touched", metrics.rows_touched);
    append_timestamp_field("started_at", metrics.started_at);
    append_timestamp_field("finished_at", metrics.finished_at);

    append_field("error");
    if (metrics.success) {
        json.append("null");
    } else {
        json.push_back('{');
        json.append("\"category\":");
        storage::append_json_string(json, metrics.error_category);
        json.append(",\"code\":");
        json.append(std::to_string(metrics.error_code));
        json.push_back('}');
    }

    json.push_back('}');
    return json;
}

std::vector<std::string> format_result_json_lines(const executor::QueryResult& result)
{
    std::vector<std::string> lines;
    if (result.message) {
        auto object = storage::JsonValue::object();
        object.set("message", storage::JsonValue::string(*result.message));
        object.set("rows_affected", storage::JsonValue::integer(static_cast<std::int64_t>(result.rows_affected)));
        lines.push_back(storage::write_json(object));
        return lines;
    }

    lines.reserve(result.rows.size());
    for (const auto& row : result.rows) {
        auto object = storage::JsonValue::object();
        for (const auto& column : result.columns) {
            const auto it = row.find(column);
            object.set(column, it != row.end() ? storage::encode_value(it->second) : storage::JsonValue::null());
        }
        lines.push_back(storage::write_json(object));
    }
    return lines;
}

std::vector<std::string> format_result_text_lines(const executor::QueryResult& result)
{
    std::vector<std::string> lines;
    if (result.message) {
        lines.push_back(*result.message);
        return lines;
    }

    lines.push_back(join_line(result.columns));
    for (const auto& row : result.rows) {
        std::vector<std::string> fields;
        fields.reserve(result.columns.size());
        for (const auto& column : result.columns) {
            const auto it = row.find(column);
            fields.push_back(it != row.end() ? it->second.to_string() : std::string{"NULL"});
        }
        lines.push_back(join_line(fields));
    }
    lines.push_back("(" + std::to_string(result.row_count) + (result.row_count == 1U ? " row)" : " rows)"));
    return lines;
}

}  // namespace reldb::tools
