#include "summary.hpp"
#include <core/log.hpp>
#include <fmt/format.h>

ExecutionSummary aggregate(const std::vector<JobResult>& results, const std::string& plan_id) {
    ExecutionSummary s;
    s.plan_id = plan_id;
    s.results = results;
    s.total_jobs = static_cast<int>(results.size());

    if (results.empty()) return s;

    s.start_time = results.front().start_time;
    s.end_time = results.front().end_time;

    for (const auto& r : results) {
        switch (r.status) {
            case JobStatus::Success:   s.successful++; break;
            case JobStatus::Timeout:   s.timed_out++;  break;
            case JobStatus::Cancelled: s.cancelled++;  break;
            case JobStatus::Failed:    s.failed++;     break;
            case JobStatus::Pending:
            case JobStatus::Running:
                // Keeps the partition total intact
                par_log(fmt::format("AGGREGATE: job {} still {}, counted as failed",
                                    r.job_id, to_string(r.status)));
                s.failed++;
                break;
        }
        if (r.start_time < s.start_time) s.start_time = r.start_time;
        if (r.end_time > s.end_time) s.end_time = r.end_time;
    }

    s.duration = std::chrono::duration_cast<Millis>(s.end_time - s.start_time);
    return s;
}

double ExecutionSummary::success_rate() const {
    if (total_jobs == 0) return 0.0;
    return 100.0 * successful / total_jobs;
}

Millis ExecutionSummary::average_duration() const {
    if (results.empty()) return Millis(0);
    Millis total(0);
    for (const auto& r : results) total += r.duration;
    return Millis(total.count() / static_cast<Millis::rep>(results.size()));
}

const JobResult* ExecutionSummary::slowest() const {
    const JobResult* best = nullptr;
    for (const auto& r : results) {
        if (!best || r.duration > best->duration) best = &r;
    }
    return best;
}

const JobResult* ExecutionSummary::fastest() const {
    const JobResult* best = nullptr;
    for (const auto& r : results) {
        if (!best || r.duration < best->duration) best = &r;
    }
    return best;
}

std::vector<JobResult> ExecutionSummary::failures() const {
    std::vector<JobResult> out;
    for (const auto& r : results) {
        if (r.status != JobStatus::Success) out.push_back(r);
    }
    return out;
}

bool ExecutionSummary::has_failures() const {
    return failed + timed_out + cancelled > 0;
}
