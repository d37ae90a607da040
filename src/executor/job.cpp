#include "job.hpp"
#include <core/utils.hpp>
#include <fmt/format.h>

const char* to_string(JobStatus status) {
    switch (status) {
        case JobStatus::Pending:   return "pending";
        case JobStatus::Running:   return "running";
        case JobStatus::Success:   return "success";
        case JobStatus::Failed:    return "failed";
        case JobStatus::Timeout:   return "timeout";
        case JobStatus::Cancelled: return "cancelled";
    }
    return "unknown";
}

std::optional<JobStatus> parse_job_status(const std::string& text) {
    if (text == "pending")   return JobStatus::Pending;
    if (text == "running")   return JobStatus::Running;
    if (text == "success")   return JobStatus::Success;
    if (text == "failed")    return JobStatus::Failed;
    if (text == "timeout")   return JobStatus::Timeout;
    if (text == "cancelled") return JobStatus::Cancelled;
    return std::nullopt;
}

bool is_terminal(JobStatus status) {
    return status != JobStatus::Pending && status != JobStatus::Running;
}

void Job::start() {
    started_at = Clock::now();
    started_mono = SteadyClock::now();
}

void Job::complete() {
    completed_at = Clock::now();
    completed_mono = SteadyClock::now();
}

Millis Job::duration() const {
    if (!started_mono) return Millis(0);
    SteadyPoint end = completed_mono ? *completed_mono : SteadyClock::now();
    return std::chrono::duration_cast<Millis>(end - *started_mono);
}

Job new_job(const Worktree& worktree, const std::string& instruction_text,
            const std::string& instruction_name, Millis timeout,
            const TemplateVars& variables) {
    Job job;
    job.id = generate_id();
    job.worktree = worktree;
    job.instruction_text = instruction_text;
    job.instruction_name = instruction_name;
    job.timeout = timeout;
    job.variables = variables;
    job.created_at = Clock::now();
    return job;
}

JobResult make_result(const Job& job, JobStatus status, const std::string& error) {
    JobResult r;
    r.job_id = job.id;
    r.worktree = job.worktree.name;
    r.worktree_path = job.worktree.path.string();
    r.status = status;
    r.start_time = job.started_at ? *job.started_at : Clock::now();
    r.end_time = job.completed_at ? *job.completed_at : r.start_time;
    r.duration = job.duration();
    r.error_message = error;
    r.exit_code = -1;
    return r;
}

Result<ExecutionPlan> build_plan(const std::vector<Worktree>& worktrees,
                                 const Prompt& prompt,
                                 const TemplateVars& vars,
                                 const PlanOptions& options) {
    ExecutionPlan plan;
    plan.id = generate_id();
    plan.instruction_name = prompt.name;
    plan.max_workers = options.max_workers;
    plan.timeout = options.timeout;
    plan.dry_run = options.dry_run;
    plan.created_at = Clock::now();

    for (const auto& wt : worktrees) {
        TemplateVars job_vars = prompt.variables;
        job_vars["ProjectName"] = wt.project_name;
        job_vars["BranchName"] = wt.branch;
        job_vars["WorktreePath"] = wt.path.string();
        job_vars["TaskName"] = prompt.name;
        job_vars["Description"] = prompt.description;
        for (const auto& [k, v] : vars) job_vars[k] = v;

        std::string text = prompt.content;
        if (prompt.is_template) {
            auto expanded = expand_template(prompt.content, job_vars);
            if (expanded.is_err()) {
                return Result<ExecutionPlan>::Err(
                    fmt::format("prompt '{}' for {}: {}", prompt.name, wt.name, expanded.error));
            }
            text = expanded.value;
        }

        plan.jobs.push_back(new_job(wt, text, prompt.name, options.timeout, job_vars));
    }

    plan.total_jobs = static_cast<int>(plan.jobs.size());
    return Result<ExecutionPlan>::Ok(plan);
}
