#include "reporter.hpp"
#include <core/constants.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <stdexcept>

using nlohmann::json;

const char* to_string(ReportFormat format) {
    switch (format) {
        case ReportFormat::Console:  return "console";
        case ReportFormat::Detailed: return "detailed";
        case ReportFormat::Json:     return "json";
        case ReportFormat::Csv:      return "csv";
    }
    return "console";
}

std::optional<ReportFormat> parse_report_format(const std::string& text) {
    if (text == "console")  return ReportFormat::Console;
    if (text == "detailed") return ReportFormat::Detailed;
    if (text == "json")     return ReportFormat::Json;
    if (text == "csv")      return ReportFormat::Csv;
    return std::nullopt;
}

std::string render(ReportFormat format, const ExecutionSummary& summary) {
    switch (format) {
        case ReportFormat::Console:  return render_console(summary);
        case ReportFormat::Detailed: return render_detailed(summary);
        case ReportFormat::Json:     return render_json(summary);
        case ReportFormat::Csv:      return render_csv(summary);
    }
    return render_console(summary);
}

static std::string failure_reason(const JobResult& r) {
    switch (r.status) {
        case JobStatus::Timeout:   return "timeout";
        case JobStatus::Cancelled: return "cancelled";
        case JobStatus::Failed:
            if (r.exit_code > 0) return fmt::format("exit code {}", r.exit_code);
            return "execution failed";
        default:
            return to_string(r.status);
    }
}

std::string render_console(const ExecutionSummary& s) {
    std::string out;
    out += "Par Execution Summary\n";
    out += "=====================\n";
    out += fmt::format("Total Jobs:      {}\n", s.total_jobs);
    out += fmt::format("Successful:      {}\n", s.successful);
    out += fmt::format("Failed:          {}\n", s.failed);
    out += fmt::format("Timed Out:       {}\n", s.timed_out);
    out += fmt::format("Cancelled:       {}\n", s.cancelled);
    out += fmt::format("Success Rate:    {:.1f}%\n", s.success_rate());
    out += fmt::format("Total Duration:  {}\n", format_duration(s.duration));
    out += fmt::format("Average Job:     {}\n", format_duration(s.average_duration()));

    if (s.has_failures()) {
        out += "\nFailed Jobs:\n";
        for (const auto& r : s.failures()) {
            out += fmt::format("- {}: {}", r.worktree, failure_reason(r));
            if (!r.error_message.empty()) out += fmt::format(" ({})", r.error_message);
            out += "\n";
        }
    }

    const JobResult* fastest = s.fastest();
    const JobResult* slowest = s.slowest();
    if (fastest && slowest) {
        out += "\nPerformance:\n";
        out += fmt::format("Fastest: {} ({})\n", fastest->worktree, format_duration(fastest->duration));
        out += fmt::format("Slowest: {} ({})\n", slowest->worktree, format_duration(slowest->duration));
    }
    return out;
}

static std::string truncate(const std::string& text, size_t width) {
    std::string flat = text;
    for (auto& c : flat) {
        if (c == '\n' || c == '\r' || c == '\t') c = ' ';
    }
    if (flat.size() <= width) return flat;
    if (width <= 3) return flat.substr(0, width);
    return flat.substr(0, width - 3) + "...";
}

std::string render_detailed(const ExecutionSummary& s) {
    std::string out = render_console(s);
    if (s.results.empty()) return out;

    out += "\nJobs:\n";
    out += fmt::format("{:<28} {:<10} {:>10}  {}\n", "WORKTREE", "STATUS", "DURATION", "ERROR");
    for (const auto& r : s.results) {
        out += fmt::format("{:<28} {:<10} {:>10}  {}\n",
                           truncate(r.worktree, 28), to_string(r.status),
                           format_duration(r.duration),
                           truncate(r.error_message, REPORT_ERROR_WIDTH));
    }

    out += "\nDetailed Results:\n";
    out += "=================\n";
    for (const auto& r : s.results) {
        out += fmt::format("\nJob: {}\n", r.job_id);
        out += fmt::format("Worktree: {} ({})\n", r.worktree, r.worktree_path);
        out += fmt::format("Status: {}\n", to_string(r.status));
        out += fmt::format("Exit Code: {}\n", r.exit_code);
        out += fmt::format("Duration: {}\n", format_duration(r.duration));
        out += fmt::format("Start Time: {}\n", format_iso(r.start_time));
        out += fmt::format("End Time: {}\n", format_iso(r.end_time));
        if (!r.error_message.empty()) {
            out += fmt::format("Error: {}\n", r.error_message);
        }
        if (!r.output.empty()) {
            out += "Output:\n";
            for (const auto& line : split_lines(r.output)) {
                out += "  " + line + "\n";
            }
        }
        out += std::string(50, '-') + "\n";
    }
    return out;
}

std::string csv_escape(const std::string& field) {
    if (field.find_first_of(",\"\r\n") == std::string::npos) return field;
    std::string out = "\"";
    for (char c : field) {
        if (c == '"') out += '"';
        out += c;
    }
    out += '"';
    return out;
}

std::string render_csv(const ExecutionSummary& s) {
    std::string out = "job_id,worktree,status,exit_code,duration_ms,start_time,end_time,error_message\n";
    for (const auto& r : s.results) {
        out += fmt::format("{},{},{},{},{},{},{},{}\n",
                           csv_escape(r.job_id), csv_escape(r.worktree), to_string(r.status),
                           r.exit_code, r.duration.count(),
                           format_iso(r.start_time), format_iso(r.end_time),
                           csv_escape(r.error_message));
    }
    return out;
}

std::string render_json(const ExecutionSummary& s) {
    json j = s;
    // Agent output is arbitrary bytes; invalid UTF-8 becomes U+FFFD
    return j.dump(2, ' ', false, json::error_handler_t::replace) + "\n";
}

// ── JSON conversions ─────────────────────────────────────────

static TimePoint time_field(const json& j, const char* key) {
    auto parsed = parse_iso(j.at(key).get<std::string>());
    if (!parsed) throw std::runtime_error(fmt::format("invalid timestamp in '{}'", key));
    return *parsed;
}

void to_json(json& j, const JobResult& r) {
    j = json{
        {"job_id", r.job_id},
        {"worktree", r.worktree},
        {"worktree_path", r.worktree_path},
        {"status", to_string(r.status)},
        {"exit_code", r.exit_code},
        {"duration_ms", r.duration.count()},
        {"start_time", format_iso(r.start_time)},
        {"end_time", format_iso(r.end_time)},
        {"output", r.output},
    };
    if (r.error_message.empty()) {
        j["error_message"] = nullptr;
    } else {
        j["error_message"] = r.error_message;
    }
}

void from_json(const json& j, JobResult& r) {
    r.job_id = j.at("job_id").get<std::string>();
    r.worktree = j.at("worktree").get<std::string>();
    r.worktree_path = j.value("worktree_path", "");

    std::string status = j.at("status").get<std::string>();
    auto parsed = parse_job_status(status);
    if (!parsed) throw std::runtime_error("unknown job status '" + status + "'");
    r.status = *parsed;

    r.exit_code = j.value("exit_code", -1);
    r.duration = Millis(j.at("duration_ms").get<long long>());
    r.start_time = time_field(j, "start_time");
    r.end_time = time_field(j, "end_time");
    r.output = j.value("output", "");
    const auto& err = j.at("error_message");
    r.error_message = err.is_null() ? "" : err.get<std::string>();
}

void to_json(json& j, const ExecutionSummary& s) {
    j = json{
        {"plan_id", s.plan_id},
        {"total_jobs", s.total_jobs},
        {"successful", s.successful},
        {"failed", s.failed},
        {"timed_out", s.timed_out},
        {"cancelled", s.cancelled},
        {"success_rate", s.success_rate()},
        {"duration_ms", s.duration.count()},
        {"start_time", format_iso(s.start_time)},
        {"end_time", format_iso(s.end_time)},
        {"results", s.results},
    };
}

void from_json(const json& j, ExecutionSummary& s) {
    s.plan_id = j.value("plan_id", "");
    s.total_jobs = j.at("total_jobs").get<int>();
    s.successful = j.at("successful").get<int>();
    s.failed = j.at("failed").get<int>();
    s.timed_out = j.at("timed_out").get<int>();
    s.cancelled = j.at("cancelled").get<int>();
    s.duration = Millis(j.at("duration_ms").get<long long>());
    s.start_time = time_field(j, "start_time");
    s.end_time = time_field(j, "end_time");
    s.results = j.at("results").get<std::vector<JobResult>>();
}

Result<ExecutionSummary> parse_summary_json(const std::string& text) {
    try {
        json j = json::parse(text);
        return Result<ExecutionSummary>::Ok(j.get<ExecutionSummary>());
    } catch (const std::exception& e) {
        return Result<ExecutionSummary>::Err(std::string("invalid summary JSON: ") + e.what());
    }
}
