#include <gtest/gtest.h>
#include <platform/process.hpp>
#include <platform/platform.hpp>
#include <core/utils.hpp>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <thread>

namespace fs = std::filesystem;
using platform::CaptureEnd;
using platform::CaptureOptions;
using platform::run_capture;

static long long elapsed_ms(std::chrono::steady_clock::time_point since) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - since).count();
}

TEST(Process, CapturesStdoutAndStderr) {
    auto r = run_capture("/bin/sh", {"-c", "echo out; echo err 1>&2"});
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_EQ(r.exit_code, 0);
    EXPECT_NE(r.output.find("out\n"), std::string::npos);
    EXPECT_NE(r.output.find("err\n"), std::string::npos);
}

TEST(Process, ReportsExitCode) {
    auto r = run_capture("/bin/sh", {"-c", "exit 3"});
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_EQ(r.exit_code, 3);
}

TEST(Process, FeedsStdin) {
    CaptureOptions opts;
    opts.input = "first line\nsecond line\n";
    auto r = run_capture("/bin/cat", {}, opts);
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_EQ(r.output, "first line\nsecond line\n");
}

TEST(Process, LargeInputAndOutputDoNotDeadlock) {
    CaptureOptions opts;
    opts.input = std::string(1 << 20, 'x');
    opts.timeout_ms = 20000;
    auto r = run_capture("/bin/cat", {}, opts);
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_EQ(r.output.size(), opts.input.size());
}

TEST(Process, EmptyInputClosesStdin) {
    CaptureOptions opts;
    opts.timeout_ms = 5000;
    auto r = run_capture("/bin/cat", {}, opts);
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_TRUE(r.output.empty());
}

TEST(Process, ChildIgnoringInputStillFinishes) {
    CaptureOptions opts;
    opts.input = std::string(1 << 20, 'y');
    opts.timeout_ms = 5000;
    auto r = run_capture("/bin/sh", {"-c", "exit 0"}, opts);
    EXPECT_EQ(r.end, CaptureEnd::Exited);
    EXPECT_EQ(r.exit_code, 0);
}

TEST(Process, RunsInWorkingDirectory) {
    auto dir = fs::canonical(fs::temp_directory_path());
    CaptureOptions opts;
    opts.working_dir = dir.string();
    auto r = run_capture("/bin/sh", {"-c", "pwd"}, opts);
    ASSERT_EQ(r.end, CaptureEnd::Exited);
    std::string out = r.output;
    trim(out);
    EXPECT_EQ(fs::canonical(out), dir);
}

TEST(Process, MissingProgramIsSpawnFailure) {
    auto r = run_capture("par-definitely-not-a-real-program", {});
    EXPECT_EQ(r.end, CaptureEnd::SpawnFailed);
    EXPECT_EQ(r.exit_code, -1);
    EXPECT_NE(r.error.find("cannot execute"), std::string::npos);
}

TEST(Process, MissingDirectoryIsSpawnFailure) {
    CaptureOptions opts;
    opts.working_dir = "/nonexistent/par/dir";
    auto r = run_capture("/bin/sh", {"-c", "true"}, opts);
    EXPECT_EQ(r.end, CaptureEnd::SpawnFailed);
    EXPECT_NE(r.error.find("cannot enter directory"), std::string::npos);
}

TEST(Process, TimeoutTerminatesChild) {
    CaptureOptions opts;
    opts.timeout_ms = 200;
    opts.kill_grace_ms = 500;
    auto start = std::chrono::steady_clock::now();
    auto r = run_capture("/bin/sh", {"-c", "echo started; sleep 30"}, opts);
    EXPECT_EQ(r.end, CaptureEnd::TimedOut);
    EXPECT_LT(elapsed_ms(start), 5000);
    EXPECT_NE(r.output.find("started"), std::string::npos);
}

TEST(Process, TimeoutEscalatesToKill) {
    CaptureOptions opts;
    opts.timeout_ms = 100;
    opts.kill_grace_ms = 300;
    auto start = std::chrono::steady_clock::now();
    auto r = run_capture("/bin/sh", {"-c", "trap '' TERM; while true; do sleep 1; done"}, opts);
    EXPECT_EQ(r.end, CaptureEnd::TimedOut);
    EXPECT_LT(elapsed_ms(start), 5000);
}

TEST(Process, ShouldStopCancelsChild) {
    std::atomic<bool> stop{false};
    std::thread trigger([&]() {
        platform::sleep_ms(150);
        stop.store(true);
    });

    CaptureOptions opts;
    opts.should_stop = [&]() { return stop.load(); };
    opts.kill_grace_ms = 500;
    auto start = std::chrono::steady_clock::now();
    auto r = run_capture("/bin/sh", {"-c", "sleep 30"}, opts);
    trigger.join();

    EXPECT_EQ(r.end, CaptureEnd::Stopped);
    EXPECT_LT(elapsed_ms(start), 5000);
}

TEST(Process, SpawnAndWait) {
    platform::SpawnOptions opts;
    opts.capture_output = true;
    auto proc = platform::spawn("/bin/sh", {"-c", "exit 7"}, opts);
    ASSERT_TRUE(proc.valid());
    EXPECT_EQ(proc.wait(), 7);
    EXPECT_FALSE(proc.running());
    EXPECT_EQ(proc.exit_code(), 7);
}

TEST(Process, WaitTimesOut) {
    auto proc = platform::spawn("/bin/sh", {"-c", "sleep 5"}, {});
    ASSERT_TRUE(proc.valid());
    EXPECT_EQ(proc.wait(100), -1);
    EXPECT_TRUE(proc.running());
    proc.terminate(200);
    EXPECT_FALSE(proc.running());
}

TEST(Platform, FindExecutable) {
    EXPECT_TRUE(platform::find_executable("sh").has_value());
    EXPECT_TRUE(platform::find_executable("/bin/sh").has_value());
    EXPECT_FALSE(platform::find_executable("par-definitely-not-a-real-program").has_value());
    EXPECT_FALSE(platform::find_executable("").has_value());
}
