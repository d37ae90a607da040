#pragma once

#include <string>
#include <vector>
#include <core/config.hpp>
#include <prompts/prompt_store.hpp>
#include <worktree/worktree.hpp>
#include "args.hpp"

// Command handlers. Each returns the process exit status.
class ParCLI {
public:
    explicit ParCLI(Config config);

    int run(const RunOptions& opts);
    int list(const std::vector<std::string>& args);
    int clean(const CleanOptions& opts);
    int show(const std::vector<std::string>& args);
    int add(const AddOptions& opts);
    int init();

private:
    Config config_;

    Result<Prompt> resolve_prompt(const RunOptions& opts) const;
    std::vector<Worktree> target_worktrees(const RunOptions& opts) const;

    int list_worktrees() const;
    int list_prompts() const;
    int list_results() const;
};
