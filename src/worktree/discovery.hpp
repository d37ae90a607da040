#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/config.hpp>
#include "worktree.hpp"

namespace fs = std::filesystem;

class Discovery {
public:
    explicit Discovery(const Config& config);

    // Walk the configured search paths.
    std::vector<Worktree> find_worktrees() const;

    // Walk explicit roots. Missing or unreadable roots contribute nothing.
    // Hidden and symlinked directories are not descended into, nor are the
    // working trees of repositories already found. Result is sorted by path.
    static std::vector<Worktree> discover(const std::vector<fs::path>& roots,
                                          const std::vector<std::string>& exclude_patterns);

private:
    const Config& config_;
};

// Describe a single directory as a Worktree; nullopt if it is not a checkout.
std::optional<Worktree> inspect_worktree(const fs::path& dir);

// Keep worktrees whose name, project name or path matches `pattern`
// (a glob if it contains wildcards, otherwise a substring).
std::vector<Worktree> filter_by_pattern(const std::vector<Worktree>& worktrees,
                                        const std::string& pattern);
