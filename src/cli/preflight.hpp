#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>

struct PreflightIssue {
    std::string message;
    std::string fix;
    bool is_hint = false;  // true = friendly nudge, false = error
};

// Environment checks before a run. Returns empty vector if everything is good.
std::vector<PreflightIssue> run_preflight_checks(const Config& config);

// Individual checks (for granular use)
std::vector<PreflightIssue> check_agent_binary(const Config& config);
std::vector<PreflightIssue> check_git();
std::vector<PreflightIssue> check_output_dir(const Config& config);
