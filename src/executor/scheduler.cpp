#include "scheduler.hpp"
#include "bounded_queue.hpp"
#include <core/log.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <thread>

Scheduler::Scheduler(JobRunner& runner) : runner_(runner) {}

JobResult Scheduler::run_one(const Job& job, const CancelToken& cancel) {
    if (cancel.is_cancelled()) {
        return make_result(job, JobStatus::Cancelled, "run cancelled before start");
    }
    try {
        JobResult r = runner_.run(job, cancel);
        if (!is_terminal(r.status)) {
            r.status = JobStatus::Failed;
            if (r.error_message.empty()) r.error_message = "runner returned a non-terminal status";
        }
        return r;
    } catch (const std::exception& e) {
        par_log(fmt::format("SCHEDULER: job {} threw: {}", job.id, e.what()));
        return make_result(job, JobStatus::Failed, std::string("internal error: ") + e.what());
    }
}

Result<std::vector<JobResult>> Scheduler::execute(const ExecutionPlan& plan,
                                                  const CancelToken& cancel) {
    std::vector<JobResult> results;
    if (plan.jobs.empty()) {
        return Result<std::vector<JobResult>>::Ok(results);
    }

    auto ready = runner_.preflight();
    if (ready.is_err()) {
        return Result<std::vector<JobResult>>::Err("pre-flight check failed: " + ready.error);
    }

    const size_t total = plan.jobs.size();
    const size_t workers = std::min(total, static_cast<size_t>(std::max(plan.max_workers, 1)));
    par_log(fmt::format("SCHEDULER: plan {} with {} jobs on {} workers", plan.id, total, workers));

    BoundedQueue<Job> job_queue(workers * 2);
    BoundedQueue<JobResult> result_queue(workers * 2);

    // The feeder keeps the job queue topped up while this thread collects
    std::thread feeder([&]() {
        for (const auto& job : plan.jobs) {
            if (!job_queue.push(job)) break;
        }
        job_queue.close();
    });

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        pool.emplace_back([&]() {
            while (auto job = job_queue.pop()) {
                result_queue.push(run_one(*job, cancel));
            }
        });
    }

    results.reserve(total);
    while (results.size() < total) {
        auto r = result_queue.pop();
        if (!r) break;
        if (on_result_) on_result_(*r);
        results.push_back(std::move(*r));
    }

    feeder.join();
    for (auto& t : pool) t.join();

    return Result<std::vector<JobResult>>::Ok(results);
}

Result<std::vector<JobResult>> Scheduler::execute_sequential(const ExecutionPlan& plan,
                                                             const CancelToken& cancel) {
    std::vector<JobResult> results;
    if (plan.jobs.empty()) {
        return Result<std::vector<JobResult>>::Ok(results);
    }

    auto ready = runner_.preflight();
    if (ready.is_err()) {
        return Result<std::vector<JobResult>>::Err("pre-flight check failed: " + ready.error);
    }

    results.reserve(plan.jobs.size());
    for (const auto& job : plan.jobs) {
        JobResult r = run_one(job, cancel);
        if (on_result_) on_result_(r);
        results.push_back(std::move(r));
    }
    return Result<std::vector<JobResult>>::Ok(results);
}
