#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>
#include <core/types.hpp>
#include "summary.hpp"

enum class ReportFormat {
    Console,    // counts, rates, failures, fastest/slowest
    Detailed,   // console text + per-job table + per-job output blocks
    Json,       // full summary including results
    Csv,        // one row per job
};

const char* to_string(ReportFormat format);
std::optional<ReportFormat> parse_report_format(const std::string& text);

std::string render(ReportFormat format, const ExecutionSummary& summary);

std::string render_console(const ExecutionSummary& summary);
std::string render_detailed(const ExecutionSummary& summary);
std::string render_json(const ExecutionSummary& summary);
std::string render_csv(const ExecutionSummary& summary);

// Quote a CSV field if it contains a comma, quote, CR or LF.
std::string csv_escape(const std::string& field);

// nlohmann::json conversions (found by ADL)
void to_json(nlohmann::json& j, const JobResult& r);
void from_json(const nlohmann::json& j, JobResult& r);
void to_json(nlohmann::json& j, const ExecutionSummary& s);
void from_json(const nlohmann::json& j, ExecutionSummary& s);

// Parse a JSON report back into a summary.
Result<ExecutionSummary> parse_summary_json(const std::string& text);
