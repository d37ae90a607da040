#include "preflight.hpp"
#include <platform/platform.hpp>
#include <filesystem>
#include <fmt/format.h>

std::vector<PreflightIssue> check_agent_binary(const Config& config) {
    std::vector<PreflightIssue> issues;
    const auto& binary = config.agent().binary_path;

    if (!platform::find_executable(binary)) {
        issues.push_back({
            fmt::format("Agent binary '{}' not found", binary),
            "Install it or set agent.binary_path in " + get_config_path().string()
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_git() {
    std::vector<PreflightIssue> issues;
    if (!platform::find_executable("git")) {
        issues.push_back({
            "git not found in PATH",
            "Dirty and conflict checks are skipped without git",
            true
        });
    }
    return issues;
}

std::vector<PreflightIssue> check_output_dir(const Config& config) {
    std::vector<PreflightIssue> issues;
    namespace fs = std::filesystem;

    const auto& dir = config.defaults_section().output_dir;
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec || !fs::is_directory(dir, ec)) {
        issues.push_back({
            fmt::format("Cannot create output directory {}", dir.string()),
            "Pass -o <dir> or set defaults.output_dir"
        });
    }
    return issues;
}

std::vector<PreflightIssue> run_preflight_checks(const Config& config) {
    std::vector<PreflightIssue> all;
    for (auto&& issues : {check_agent_binary(config), check_git(), check_output_dir(config)}) {
        all.insert(all.end(), issues.begin(), issues.end());
    }
    return all;
}
