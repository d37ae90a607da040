#pragma once

#include <functional>
#include <vector>
#include <core/types.hpp>
#include "cancel_token.hpp"
#include "job.hpp"
#include "job_runner.hpp"

// Fixed worker pool over two bounded queues. Every job of the plan yields
// exactly one JobResult; all threads are joined before execute() returns.
class Scheduler {
public:
    using ResultCallback = std::function<void(const JobResult&)>;

    explicit Scheduler(JobRunner& runner);

    // Called on the calling thread as each result arrives.
    void on_result(ResultCallback cb) { on_result_ = std::move(cb); }

    // Parallel run with min(plan.max_workers, jobs) workers (at least one).
    // Fails only if the pre-flight check fails; no job runs in that case.
    Result<std::vector<JobResult>> execute(const ExecutionPlan& plan, const CancelToken& cancel);

    // Same contract, one job at a time on the calling thread.
    Result<std::vector<JobResult>> execute_sequential(const ExecutionPlan& plan,
                                                      const CancelToken& cancel);

private:
    JobRunner& runner_;
    ResultCallback on_result_;

    JobResult run_one(const Job& job, const CancelToken& cancel);
};
