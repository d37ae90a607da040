#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>
#include <prompts/prompt_store.hpp>
#include <worktree/worktree.hpp>

// Lifecycle: Pending -> Running -> one of the four terminal states.
enum class JobStatus {
    Pending,
    Running,
    Success,
    Failed,
    Timeout,
    Cancelled,
};

const char* to_string(JobStatus status);
std::optional<JobStatus> parse_job_status(const std::string& text);
bool is_terminal(JobStatus status);

struct Job {
    std::string id;
    Worktree worktree;
    std::string instruction_text;
    std::string instruction_name;
    Millis timeout{0};
    TemplateVars variables;
    TimePoint created_at;
    std::optional<TimePoint> started_at;
    std::optional<TimePoint> completed_at;
    std::optional<SteadyPoint> started_mono;
    std::optional<SteadyPoint> completed_mono;

    void start();
    void complete();

    // completed - started; now - started while running; zero if never started.
    // Measured on the steady clock, so wall-clock steps do not affect it.
    Millis duration() const;
};

Job new_job(const Worktree& worktree, const std::string& instruction_text,
            const std::string& instruction_name, Millis timeout,
            const TemplateVars& variables = {});

struct JobResult {
    std::string job_id;
    std::string worktree;         // display label (directory name)
    std::string worktree_path;
    JobStatus status = JobStatus::Pending;
    TimePoint start_time;
    TimePoint end_time;
    Millis duration{0};
    std::string output;
    std::string error_message;    // empty when none
    int exit_code = -1;
};

// Result for a job that never ran or could not run to completion.
JobResult make_result(const Job& job, JobStatus status, const std::string& error);

struct ExecutionPlan {
    std::string id;
    std::string instruction_name;
    std::vector<Job> jobs;
    int total_jobs = 0;
    int max_workers = 1;
    Millis timeout{0};
    bool dry_run = false;
    TimePoint created_at;
};

struct PlanOptions {
    int max_workers = 1;
    Millis timeout{0};
    bool dry_run = false;
};

// One job per worktree. Template prompts are expanded per worktree. Lookup
// order, lowest precedence first: the prompt's defaults, the built-in
// variables (ProjectName, BranchName, WorktreePath, TaskName, Description),
// then `vars`.
Result<ExecutionPlan> build_plan(const std::vector<Worktree>& worktrees,
                                 const Prompt& prompt,
                                 const TemplateVars& vars,
                                 const PlanOptions& options);
