#include <gtest/gtest.h>
#include <executor/job.hpp>
#include <platform/platform.hpp>
#include <set>

static Worktree make_worktree(const std::string& name, const std::string& branch = "main") {
    Worktree wt;
    wt.id = name + "-id";
    wt.name = name;
    wt.project_name = name;
    wt.path = "/src/" + name;
    wt.branch = branch;
    wt.is_valid = true;
    return wt;
}

TEST(JobStatus, StringsRoundTrip) {
    for (auto s : {JobStatus::Pending, JobStatus::Running, JobStatus::Success,
                   JobStatus::Failed, JobStatus::Timeout, JobStatus::Cancelled}) {
        auto parsed = parse_job_status(to_string(s));
        ASSERT_TRUE(parsed.has_value()) << to_string(s);
        EXPECT_EQ(*parsed, s);
    }
    EXPECT_FALSE(parse_job_status("done").has_value());
}

TEST(JobStatus, TerminalStates) {
    EXPECT_FALSE(is_terminal(JobStatus::Pending));
    EXPECT_FALSE(is_terminal(JobStatus::Running));
    EXPECT_TRUE(is_terminal(JobStatus::Success));
    EXPECT_TRUE(is_terminal(JobStatus::Failed));
    EXPECT_TRUE(is_terminal(JobStatus::Timeout));
    EXPECT_TRUE(is_terminal(JobStatus::Cancelled));
}

TEST(Job, DurationLifecycle) {
    Job job = new_job(make_worktree("a"), "do it", "task", Millis(1000));
    EXPECT_EQ(job.duration(), Millis(0));

    job.start();
    platform::sleep_ms(20);
    job.complete();
    Millis d = job.duration();
    EXPECT_GE(d.count(), 15);
    platform::sleep_ms(10);
    EXPECT_EQ(job.duration(), d);
}

TEST(Job, DurationIgnoresWallClockSteps) {
    Job job = new_job(make_worktree("a"), "do it", "task", Millis(1000));
    job.start();
    // Wall clock jumped forward an hour after the job started
    *job.started_at += std::chrono::hours(1);
    platform::sleep_ms(20);
    job.complete();

    EXPECT_GE(job.duration().count(), 15);
    EXPECT_LT(job.duration().count(), 5000);

    JobResult r = make_result(job, JobStatus::Success, "");
    EXPECT_EQ(r.duration, job.duration());
    EXPECT_EQ(r.start_time, *job.started_at);
    EXPECT_EQ(r.end_time, *job.completed_at);
}

TEST(Job, MakeResultForJobThatNeverRan) {
    Job job = new_job(make_worktree("a"), "do it", "task", Millis(1000));
    JobResult r = make_result(job, JobStatus::Cancelled, "cancelled before start");
    EXPECT_EQ(r.job_id, job.id);
    EXPECT_EQ(r.worktree, "a");
    EXPECT_EQ(r.worktree_path, "/src/a");
    EXPECT_EQ(r.status, JobStatus::Cancelled);
    EXPECT_EQ(r.duration, Millis(0));
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_EQ(r.error_message, "cancelled before start");
}

TEST(BuildPlan, OneJobPerWorktree) {
    Prompt p;
    p.name = "refactor";
    p.content = "Refactor the code";

    PlanOptions opts;
    opts.max_workers = 4;
    opts.timeout = Millis(60000);

    auto plan = build_plan({make_worktree("a"), make_worktree("b"), make_worktree("c")}, p, {}, opts);
    ASSERT_TRUE(plan.is_ok()) << plan.error;
    EXPECT_EQ(plan.value.total_jobs, 3);
    EXPECT_EQ(plan.value.jobs.size(), 3u);
    EXPECT_EQ(plan.value.max_workers, 4);
    EXPECT_EQ(plan.value.instruction_name, "refactor");
    EXPECT_FALSE(plan.value.id.empty());

    std::set<std::string> ids;
    for (const auto& job : plan.value.jobs) {
        EXPECT_EQ(job.instruction_text, "Refactor the code");
        EXPECT_EQ(job.timeout, Millis(60000));
        EXPECT_FALSE(job.started_at.has_value());
        ids.insert(job.id);
    }
    EXPECT_EQ(ids.size(), 3u);
}

TEST(BuildPlan, NonTemplateKeepsBraces) {
    Prompt p;
    p.name = "literal";
    p.content = "Keep {{.Unknown}} as is";
    auto plan = build_plan({make_worktree("a")}, p, {}, {});
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value.jobs[0].instruction_text, "Keep {{.Unknown}} as is");
}

TEST(BuildPlan, ExpandsBuiltinsPerWorktree) {
    Prompt p;
    p.name = "report";
    p.description = "Status report";
    p.is_template = true;
    p.content = "{{.TaskName}}: {{.ProjectName}}@{{.BranchName}} in {{.WorktreePath}} ({{.Description}})";

    auto plan = build_plan({make_worktree("api", "dev"), make_worktree("web", "main")}, p, {}, {});
    ASSERT_TRUE(plan.is_ok()) << plan.error;
    EXPECT_EQ(plan.value.jobs[0].instruction_text, "report: api@dev in /src/api (Status report)");
    EXPECT_EQ(plan.value.jobs[1].instruction_text, "report: web@main in /src/web (Status report)");
}

TEST(BuildPlan, VariablePrecedence) {
    Prompt p;
    p.name = "vars";
    p.is_template = true;
    p.content = "{{.Level}} {{.BranchName}} {{.ProjectName}}";
    p.variables = {{"Level", "low"}, {"BranchName", "from-default"}};

    auto plan = build_plan({make_worktree("api", "dev")}, p, {{"Level", "high"}, {"ProjectName", "override"}}, {});
    ASSERT_TRUE(plan.is_ok()) << plan.error;
    // Caller vars beat builtins, builtins beat prompt defaults
    EXPECT_EQ(plan.value.jobs[0].instruction_text, "high dev override");
    EXPECT_EQ(plan.value.jobs[0].variables.at("Level"), "high");
}

TEST(BuildPlan, UndefinedVariableFailsPlan) {
    Prompt p;
    p.name = "broken";
    p.is_template = true;
    p.content = "{{.Nope}}";

    auto plan = build_plan({make_worktree("api")}, p, {}, {});
    ASSERT_TRUE(plan.is_err());
    EXPECT_NE(plan.error.find("undefined template variable: Nope"), std::string::npos);
}

TEST(BuildPlan, EmptyWorktreeList) {
    Prompt p;
    p.name = "x";
    p.content = "y";
    auto plan = build_plan({}, p, {}, {});
    ASSERT_TRUE(plan.is_ok());
    EXPECT_EQ(plan.value.total_jobs, 0);
}
