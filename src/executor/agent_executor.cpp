#include "agent_executor.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <climits>

AgentExecutor::AgentExecutor(const Config& config)
    : binary_(config.agent().binary_path),
      print_flag_(config.agent().print_flag),
      default_args_(config.agent().default_args) {}

std::vector<std::string> AgentExecutor::agent_args() const {
    std::vector<std::string> args;
    if (!print_flag_.empty()) args.push_back(print_flag_);
    args.insert(args.end(), default_args_.begin(), default_args_.end());
    return args;
}

Result<void> AgentExecutor::preflight() {
    auto path = platform::find_executable(binary_);
    if (!path) {
        return Result<void>::Err(fmt::format("agent binary '{}' not found in PATH", binary_));
    }

    platform::CaptureOptions opts;
    opts.timeout_ms = PREFLIGHT_TIMEOUT_MS;
    auto res = platform::run_capture(path->string(), {"--version"}, opts);
    par_log_process("PREFLIGHT", path->string() + " --version", res.exit_code, res.output);

    switch (res.end) {
        case platform::CaptureEnd::SpawnFailed:
            return Result<void>::Err(fmt::format("cannot run agent '{}': {}", binary_, res.error));
        case platform::CaptureEnd::TimedOut:
        case platform::CaptureEnd::Stopped:
            return Result<void>::Err(fmt::format("agent '{} --version' did not answer within {}",
                                                 binary_, format_duration(Millis(PREFLIGHT_TIMEOUT_MS))));
        case platform::CaptureEnd::Exited:
            break;
    }
    if (res.exit_code != 0) {
        std::string out = res.output;
        trim(out);
        return Result<void>::Err(fmt::format("agent '{} --version' exited with code {}{}",
                                             binary_, res.exit_code, out.empty() ? "" : ": " + out));
    }
    return Result<void>::Ok();
}

JobResult AgentExecutor::run(Job job, const CancelToken& cancel) {
    if (cancel.is_cancelled()) {
        return make_result(job, JobStatus::Cancelled, "run cancelled before start");
    }

    job.start();
    par_log(fmt::format("JOB {} start in {}", job.id, job.worktree.path.string()));

    platform::CaptureOptions opts;
    opts.working_dir = job.worktree.path.string();
    opts.input = job.instruction_text;
    long long timeout_ms = job.timeout.count();
    opts.timeout_ms = timeout_ms > INT_MAX ? INT_MAX : static_cast<int>(timeout_ms);
    opts.should_stop = [&cancel]() { return cancel.is_cancelled(); };
    opts.poll_interval_ms = PROCESS_POLL_MS;
    opts.kill_grace_ms = KILL_GRACE_MS;

    auto res = platform::run_capture(binary_, agent_args(), opts);
    job.complete();

    JobResult result = make_result(job, JobStatus::Running, "");
    result.output = std::move(res.output);

    switch (res.end) {
        case platform::CaptureEnd::SpawnFailed:
            result.status = JobStatus::Failed;
            result.error_message = res.error;
            result.exit_code = -1;
            break;
        case platform::CaptureEnd::TimedOut:
            result.status = JobStatus::Timeout;
            result.error_message = fmt::format("timed out after {}", format_duration(job.timeout));
            result.exit_code = -1;
            break;
        case platform::CaptureEnd::Stopped:
            result.status = JobStatus::Cancelled;
            result.error_message = "cancelled";
            result.exit_code = -1;
            break;
        case platform::CaptureEnd::Exited:
            result.exit_code = res.exit_code;
            if (res.exit_code == 0) {
                result.status = JobStatus::Success;
            } else {
                result.status = JobStatus::Failed;
                result.error_message = fmt::format("agent exited with code {}", res.exit_code);
            }
            break;
    }

    par_log(fmt::format("JOB {} {} in {} (exit={})", job.id, to_string(result.status),
                        format_duration(result.duration), result.exit_code));
    return result;
}
