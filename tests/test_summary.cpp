#include <gtest/gtest.h>
#include <results/summary.hpp>
#include <core/time_utils.hpp>

static TimePoint at(const std::string& iso) {
    return *parse_iso(iso);
}

static JobResult result(const std::string& name, JobStatus status, const std::string& start,
                        const std::string& end) {
    JobResult r;
    r.job_id = name + "-job";
    r.worktree = name;
    r.worktree_path = "/src/" + name;
    r.status = status;
    r.start_time = at(start);
    r.end_time = at(end);
    r.duration = std::chrono::duration_cast<Millis>(r.end_time - r.start_time);
    r.exit_code = status == JobStatus::Success ? 0 : 1;
    return r;
}

TEST(Summary, CountsPartitionTotal) {
    auto s = aggregate({
        result("a", JobStatus::Success,   "2025-01-15T10:00:00Z", "2025-01-15T10:00:10Z"),
        result("b", JobStatus::Failed,    "2025-01-15T10:00:01Z", "2025-01-15T10:00:05Z"),
        result("c", JobStatus::Timeout,   "2025-01-15T10:00:02Z", "2025-01-15T10:01:02Z"),
        result("d", JobStatus::Cancelled, "2025-01-15T10:00:03Z", "2025-01-15T10:00:04Z"),
        result("e", JobStatus::Success,   "2025-01-15T10:00:04Z", "2025-01-15T10:00:06Z"),
    }, "plan-1");

    EXPECT_EQ(s.plan_id, "plan-1");
    EXPECT_EQ(s.total_jobs, 5);
    EXPECT_EQ(s.successful, 2);
    EXPECT_EQ(s.failed, 1);
    EXPECT_EQ(s.timed_out, 1);
    EXPECT_EQ(s.cancelled, 1);
    EXPECT_EQ(s.successful + s.failed + s.timed_out + s.cancelled, s.total_jobs);
    EXPECT_DOUBLE_EQ(s.success_rate(), 40.0);
    EXPECT_TRUE(s.has_failures());
    EXPECT_EQ(s.failures().size(), 3u);
}

TEST(Summary, SpanFromEarliestStartToLatestEnd) {
    auto s = aggregate({
        result("late", JobStatus::Success,  "2025-01-15T10:00:05Z", "2025-01-15T10:00:30Z"),
        result("early", JobStatus::Success, "2025-01-15T10:00:00Z", "2025-01-15T10:00:10Z"),
    }, "p");
    EXPECT_EQ(s.start_time, at("2025-01-15T10:00:00Z"));
    EXPECT_EQ(s.end_time, at("2025-01-15T10:00:30Z"));
    EXPECT_EQ(s.duration, Millis(30000));
}

TEST(Summary, AverageFastestSlowest) {
    auto s = aggregate({
        result("a", JobStatus::Success, "2025-01-15T10:00:00Z", "2025-01-15T10:00:02Z"),
        result("b", JobStatus::Success, "2025-01-15T10:00:00Z", "2025-01-15T10:00:06Z"),
        result("c", JobStatus::Success, "2025-01-15T10:00:00Z", "2025-01-15T10:00:04Z"),
    }, "p");
    EXPECT_EQ(s.average_duration(), Millis(4000));
    ASSERT_NE(s.fastest(), nullptr);
    ASSERT_NE(s.slowest(), nullptr);
    EXPECT_EQ(s.fastest()->worktree, "a");
    EXPECT_EQ(s.slowest()->worktree, "b");
    EXPECT_FALSE(s.has_failures());
    EXPECT_DOUBLE_EQ(s.success_rate(), 100.0);
}

TEST(Summary, TiesGoToFirst) {
    auto s = aggregate({
        result("first", JobStatus::Success,  "2025-01-15T10:00:00Z", "2025-01-15T10:00:03Z"),
        result("second", JobStatus::Success, "2025-01-15T10:00:01Z", "2025-01-15T10:00:04Z"),
    }, "p");
    EXPECT_EQ(s.fastest()->worktree, "first");
    EXPECT_EQ(s.slowest()->worktree, "first");
}

TEST(Summary, EmptyResults) {
    auto s = aggregate({}, "empty");
    EXPECT_EQ(s.total_jobs, 0);
    EXPECT_DOUBLE_EQ(s.success_rate(), 0.0);
    EXPECT_EQ(s.average_duration(), Millis(0));
    EXPECT_EQ(s.fastest(), nullptr);
    EXPECT_EQ(s.slowest(), nullptr);
    EXPECT_FALSE(s.has_failures());
    EXPECT_EQ(s.duration, Millis(0));
}

TEST(Summary, NonTerminalCountsAsFailed) {
    auto s = aggregate({
        result("stuck", JobStatus::Running, "2025-01-15T10:00:00Z", "2025-01-15T10:00:01Z"),
    }, "p");
    EXPECT_EQ(s.failed, 1);
    EXPECT_TRUE(s.has_failures());
}

TEST(Summary, AggregateIsIdempotent) {
    std::vector<JobResult> results = {
        result("a", JobStatus::Success, "2025-01-15T10:00:00Z", "2025-01-15T10:00:02Z"),
        result("b", JobStatus::Timeout, "2025-01-15T10:00:01Z", "2025-01-15T10:01:01Z"),
        result("c", JobStatus::Failed,  "2025-01-15T10:00:02Z", "2025-01-15T10:00:03Z"),
    };
    auto first = aggregate(results, "p");
    auto second = aggregate(results, "p");
    auto again = aggregate(first.results, "p");

    for (const auto* s : {&second, &again}) {
        EXPECT_EQ(s->total_jobs, first.total_jobs);
        EXPECT_EQ(s->successful, first.successful);
        EXPECT_EQ(s->failed, first.failed);
        EXPECT_EQ(s->timed_out, first.timed_out);
        EXPECT_EQ(s->cancelled, first.cancelled);
        EXPECT_EQ(s->start_time, first.start_time);
        EXPECT_EQ(s->end_time, first.end_time);
        EXPECT_EQ(s->duration, first.duration);
        EXPECT_EQ(s->average_duration(), first.average_duration());
        EXPECT_EQ(s->slowest()->worktree, first.slowest()->worktree);
        ASSERT_EQ(s->results.size(), first.results.size());
    }
    EXPECT_EQ(results.size(), 3u);
}
