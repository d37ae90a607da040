#pragma once

#include <string>
#include <vector>
#include <core/types.hpp>
#include <executor/job.hpp>

struct ExecutionSummary {
    std::string plan_id;
    int total_jobs = 0;
    int successful = 0;
    int failed = 0;
    int timed_out = 0;
    int cancelled = 0;
    Millis duration{0};
    std::vector<JobResult> results;
    TimePoint start_time;
    TimePoint end_time;

    // Percentage in [0, 100]; 0 when there are no jobs
    double success_rate() const;
    Millis average_duration() const;

    // First encountered wins ties; nullptr when empty
    const JobResult* slowest() const;
    const JobResult* fastest() const;

    std::vector<JobResult> failures() const;
    bool has_failures() const;
};

// Deterministic: counts per status, span from earliest start to latest end.
ExecutionSummary aggregate(const std::vector<JobResult>& results, const std::string& plan_id);
