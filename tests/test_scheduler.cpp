#include <gtest/gtest.h>
#include <executor/scheduler.hpp>
#include <executor/bounded_queue.hpp>
#include <executor/agent_executor.hpp>
#include <results/summary.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>

// Scripted runner: behavior per worktree name, with concurrency tracking.
class FakeRunner : public JobRunner {
public:
    Result<void> preflight_result = Result<void>::Ok();
    std::map<std::string, JobStatus> outcomes;   // default Success
    std::set<std::string> throws;
    int work_ms = 30;

    std::atomic<int> active{0};
    std::atomic<int> peak{0};
    std::atomic<int> calls{0};
    std::atomic<int> preflights{0};

    Result<void> preflight() override {
        preflights++;
        return preflight_result;
    }

    JobResult run(Job job, const CancelToken& cancel) override {
        calls++;
        int now = ++active;
        int prev = peak.load();
        while (now > prev && !peak.compare_exchange_weak(prev, now)) {}

        job.start();
        for (int waited = 0; waited < work_ms && !cancel.is_cancelled(); waited += 5) {
            platform::sleep_ms(5);
        }
        job.complete();
        active--;

        if (throws.count(job.worktree.name)) throw std::runtime_error("boom");

        JobStatus status = JobStatus::Success;
        if (cancel.is_cancelled()) status = JobStatus::Cancelled;
        auto it = outcomes.find(job.worktree.name);
        if (it != outcomes.end()) status = it->second;

        JobResult r = make_result(job, status, status == JobStatus::Success ? "" : "scripted");
        r.exit_code = status == JobStatus::Success ? 0 : 1;
        return r;
    }
};

static ExecutionPlan make_plan(int jobs, int workers) {
    ExecutionPlan plan;
    plan.id = "plan";
    plan.max_workers = workers;
    for (int i = 0; i < jobs; ++i) {
        Worktree wt;
        wt.name = "wt" + std::to_string(i);
        wt.path = "/tmp/" + wt.name;
        plan.jobs.push_back(new_job(wt, "do it", "task", Millis(1000)));
    }
    plan.total_jobs = jobs;
    return plan;
}

static std::set<std::string> ids_of(const std::vector<JobResult>& results) {
    std::set<std::string> ids;
    for (const auto& r : results) ids.insert(r.job_id);
    return ids;
}

TEST(BoundedQueue, FifoAndClose) {
    BoundedQueue<int> q(2);
    EXPECT_TRUE(q.push(1));
    EXPECT_TRUE(q.push(2));
    EXPECT_EQ(q.size(), 2u);
    q.close();
    EXPECT_FALSE(q.push(3));
    EXPECT_EQ(q.pop().value_or(-1), 1);
    EXPECT_EQ(q.pop().value_or(-1), 2);
    EXPECT_FALSE(q.pop().has_value());
}

TEST(BoundedQueue, PushBlocksWhenFull) {
    BoundedQueue<int> q(1);
    ASSERT_TRUE(q.push(1));
    std::atomic<bool> pushed{false};
    std::thread producer([&]() {
        q.push(2);
        pushed = true;
    });
    platform::sleep_ms(50);
    EXPECT_FALSE(pushed.load());
    EXPECT_EQ(q.pop().value_or(-1), 1);
    producer.join();
    EXPECT_TRUE(pushed.load());
    EXPECT_EQ(q.pop().value_or(-1), 2);
}

TEST(Scheduler, EveryJobYieldsOneResult) {
    FakeRunner runner;
    Scheduler scheduler(runner);
    auto plan = make_plan(10, 3);

    auto r = scheduler.execute(plan, CancelToken());
    ASSERT_TRUE(r.is_ok()) << r.error;
    EXPECT_EQ(r.value.size(), 10u);
    EXPECT_EQ(ids_of(r.value).size(), 10u);
    for (const auto& job : plan.jobs) EXPECT_EQ(ids_of(r.value).count(job.id), 1u);
    EXPECT_EQ(runner.preflights.load(), 1);
}

TEST(Scheduler, ConcurrencyBoundedByWorkers) {
    FakeRunner runner;
    runner.work_ms = 60;
    Scheduler scheduler(runner);

    auto r = scheduler.execute(make_plan(8, 2), CancelToken());
    ASSERT_TRUE(r.is_ok());
    EXPECT_LE(runner.peak.load(), 2);
    EXPECT_GE(runner.peak.load(), 1);
}

TEST(Scheduler, RunsInParallel) {
    FakeRunner runner;
    runner.work_ms = 200;
    Scheduler scheduler(runner);

    auto start = std::chrono::steady_clock::now();
    auto r = scheduler.execute(make_plan(4, 4), CancelToken());
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();
    ASSERT_TRUE(r.is_ok());
    EXPECT_LT(ms, 700);
    EXPECT_GE(runner.peak.load(), 2);
}

TEST(Scheduler, ZeroWorkersMeansOne) {
    FakeRunner runner;
    Scheduler scheduler(runner);
    auto r = scheduler.execute(make_plan(3, 0), CancelToken());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 3u);
    EXPECT_EQ(runner.peak.load(), 1);
}

TEST(Scheduler, EmptyPlanSkipsPreflight) {
    FakeRunner runner;
    runner.preflight_result = Result<void>::Err("should not be asked");
    Scheduler scheduler(runner);

    auto r = scheduler.execute(make_plan(0, 4), CancelToken());
    ASSERT_TRUE(r.is_ok());
    EXPECT_TRUE(r.value.empty());
    EXPECT_EQ(runner.preflights.load(), 0);
}

TEST(Scheduler, PreflightFailureRunsNothing) {
    FakeRunner runner;
    runner.preflight_result = Result<void>::Err("agent missing");
    Scheduler scheduler(runner);

    auto r = scheduler.execute(make_plan(3, 2), CancelToken());
    ASSERT_TRUE(r.is_err());
    EXPECT_EQ(r.error, "pre-flight check failed: agent missing");
    EXPECT_EQ(runner.calls.load(), 0);

    auto seq = scheduler.execute_sequential(make_plan(3, 2), CancelToken());
    ASSERT_TRUE(seq.is_err());
    EXPECT_EQ(runner.calls.load(), 0);
}

TEST(Scheduler, FailuresDoNotStopOtherJobs) {
    FakeRunner runner;
    runner.outcomes["wt1"] = JobStatus::Failed;
    runner.outcomes["wt3"] = JobStatus::Timeout;
    Scheduler scheduler(runner);

    auto r = scheduler.execute(make_plan(5, 2), CancelToken());
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 5u);
    int ok = 0;
    for (const auto& res : r.value) {
        if (res.worktree == "wt1") EXPECT_EQ(res.status, JobStatus::Failed);
        else if (res.worktree == "wt3") EXPECT_EQ(res.status, JobStatus::Timeout);
        else if (res.status == JobStatus::Success) ok++;
    }
    EXPECT_EQ(ok, 3);
}

TEST(Scheduler, RunnerExceptionBecomesFailedResult) {
    FakeRunner runner;
    runner.throws.insert("wt0");
    Scheduler scheduler(runner);

    auto r = scheduler.execute(make_plan(2, 2), CancelToken());
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 2u);
    for (const auto& res : r.value) {
        if (res.worktree == "wt0") {
            EXPECT_EQ(res.status, JobStatus::Failed);
            EXPECT_EQ(res.error_message, "internal error: boom");
        }
    }
}

TEST(Scheduler, NonTerminalStatusIsForcedToFailed) {
    FakeRunner runner;
    runner.outcomes["wt0"] = JobStatus::Running;
    Scheduler scheduler(runner);

    auto r = scheduler.execute_sequential(make_plan(1, 1), CancelToken());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value[0].status, JobStatus::Failed);
}

TEST(Scheduler, CancelBeforeStartCancelsEverything) {
    FakeRunner runner;
    Scheduler scheduler(runner);
    CancelToken cancel;
    cancel.cancel();

    auto r = scheduler.execute(make_plan(6, 3), cancel);
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 6u);
    for (const auto& res : r.value) EXPECT_EQ(res.status, JobStatus::Cancelled);
    EXPECT_EQ(runner.calls.load(), 0);
}

TEST(Scheduler, CancelMidRunStillReturnsAllResults) {
    FakeRunner runner;
    runner.work_ms = 2000;
    Scheduler scheduler(runner);
    CancelToken cancel;

    std::thread trigger([cancel]() {
        platform::sleep_ms(100);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = scheduler.execute(make_plan(6, 2), cancel);
    trigger.join();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(r.value.size(), 6u);
    EXPECT_LT(ms, 2000);
    for (const auto& res : r.value) EXPECT_EQ(res.status, JobStatus::Cancelled);
}

TEST(Scheduler, CallbackSeesEveryResultOnCallingThread) {
    FakeRunner runner;
    Scheduler scheduler(runner);
    std::vector<std::string> seen;
    auto caller = std::this_thread::get_id();
    bool same_thread = true;
    scheduler.on_result([&](const JobResult& r) {
        seen.push_back(r.job_id);
        if (std::this_thread::get_id() != caller) same_thread = false;
    });

    auto r = scheduler.execute(make_plan(5, 3), CancelToken());
    ASSERT_TRUE(r.is_ok());
    EXPECT_EQ(seen.size(), 5u);
    EXPECT_TRUE(same_thread);
}

TEST(Scheduler, SequentialKeepsPlanOrder) {
    FakeRunner runner;
    runner.work_ms = 5;
    Scheduler scheduler(runner);
    auto plan = make_plan(4, 4);

    auto r = scheduler.execute_sequential(plan, CancelToken());
    ASSERT_TRUE(r.is_ok());
    ASSERT_EQ(r.value.size(), 4u);
    for (size_t i = 0; i < plan.jobs.size(); ++i) {
        EXPECT_EQ(r.value[i].job_id, plan.jobs[i].id);
    }
    EXPECT_EQ(runner.peak.load(), 1);
}

// Same scheduler driving the real executor against a shell-script agent.
class SchedulerAgentTest : public ::testing::Test {
protected:
    std::filesystem::path test_dir;

    void SetUp() override {
        test_dir = std::filesystem::canonical(std::filesystem::temp_directory_path()) /
                   ("par_sched_test_" + generate_id());
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    // Answers --version; otherwise runs `body` inside the worktree
    Config agent_config(const std::string& body) {
        auto path = test_dir / "fake-agent";
        std::ofstream(path) << "#!/bin/sh\n"
                            << "[ \"$1\" = \"--version\" ] && echo 'agent 1.0' && exit 0\n"
                            << "cat >/dev/null\n"
                            << body << "\n";
        std::filesystem::permissions(path, std::filesystem::perms::owner_all);
        Config c = Config::defaults();
        c.set_agent_binary(path.string());
        return c;
    }

    ExecutionPlan plan_for(int jobs, int workers) {
        ExecutionPlan plan;
        plan.id = "plan";
        plan.max_workers = workers;
        for (int i = 0; i < jobs; ++i) {
            Worktree wt;
            wt.name = "wt" + std::to_string(i);
            wt.path = test_dir / wt.name;
            std::filesystem::create_directories(wt.path);
            plan.jobs.push_back(new_job(wt, "do it", "task", Millis(20000)));
        }
        plan.total_jobs = jobs;
        return plan;
    }
};

TEST_F(SchedulerAgentTest, MixedOutcome) {
    AgentExecutor executor(agent_config(
        "[ \"$(basename \"$(pwd)\")\" = wt1 ] && echo 'tests failed' && exit 1\necho done"));
    Scheduler scheduler(executor);

    auto r = scheduler.execute(plan_for(4, 2), CancelToken());
    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 4u);

    auto summary = aggregate(r.value, "plan");
    EXPECT_EQ(summary.successful, 3);
    EXPECT_EQ(summary.failed, 1);
    EXPECT_TRUE(summary.has_failures());
    for (const auto& res : r.value) {
        if (res.worktree == "wt1") {
            EXPECT_EQ(res.status, JobStatus::Failed);
            EXPECT_EQ(res.exit_code, 1);
            EXPECT_NE(res.output.find("tests failed"), std::string::npos);
        } else {
            EXPECT_EQ(res.status, JobStatus::Success);
            EXPECT_EQ(res.exit_code, 0);
        }
    }
}

TEST_F(SchedulerAgentTest, CancelStopsRunningAgents) {
    AgentExecutor executor(agent_config("sleep 10"));
    Scheduler scheduler(executor);
    CancelToken cancel;

    std::thread trigger([cancel]() {
        platform::sleep_ms(50);
        cancel.cancel();
    });
    auto start = std::chrono::steady_clock::now();
    auto r = scheduler.execute(plan_for(5, 2), cancel);
    trigger.join();
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count();

    ASSERT_TRUE(r.is_ok()) << r.error;
    ASSERT_EQ(r.value.size(), 5u);
    int ok = 0;
    for (const auto& res : r.value) {
        EXPECT_TRUE(res.status == JobStatus::Cancelled || res.status == JobStatus::Success)
            << to_string(res.status);
        if (res.status == JobStatus::Success) ok++;
    }
    EXPECT_LE(ok, 2);
    EXPECT_LT(ms, 10000);
}
