#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include "job_runner.hpp"

// Runs the configured coding agent inside a worktree: instruction on stdin,
// combined stdout/stderr captured, own process group so a timeout or
// cancellation can take down everything the agent started.
class AgentExecutor : public JobRunner {
public:
    explicit AgentExecutor(const Config& config);

    Result<void> preflight() override;
    JobResult run(Job job, const CancelToken& cancel) override;

    // [print_flag, default_args...]
    std::vector<std::string> agent_args() const;

private:
    std::string binary_;
    std::string print_flag_;
    std::vector<std::string> default_args_;
};
