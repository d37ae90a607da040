#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>

namespace fs = std::filesystem;

// Read-only view of the on-disk git metadata of one checkout. Everything
// except status() is answered from files; status() shells out to git.
class GitRepo {
public:
    // Opens `dir` if it has a .git directory or a "gitdir:" pointer file.
    static std::optional<GitRepo> open(const fs::path& dir);

    const fs::path& worktree_path() const { return worktree_path_; }
    const fs::path& git_dir() const { return git_dir_; }
    const fs::path& common_dir() const { return common_dir_; }
    bool is_linked() const { return linked_; }

    // Directory of the primary checkout that owns common_dir()
    fs::path primary_path() const;

    // Raw HEAD contents (trimmed), nullopt if unreadable
    std::optional<std::string> read_head() const;

    // Branch label derived from HEAD
    std::string branch() const;

    // url of [remote "<name>"] in the shared config, empty if absent
    std::string remote_url(const std::string& remote = "origin") const;

    // Linked checkouts registered under <common>/worktrees/*/gitdir
    std::vector<fs::path> linked_worktrees() const;

    // MERGE_HEAD present in the git directory
    bool merge_in_progress() const;

    // `git status --porcelain` lines
    Result<std::vector<std::string>> status() const;

private:
    fs::path worktree_path_;
    fs::path git_dir_;
    fs::path common_dir_;
    bool linked_ = false;
};

// "ref: refs/heads/X" -> "X"; a full hex object name -> first 7 chars;
// anything else -> "unknown".
std::string branch_from_head(const std::string& head);

// True if a porcelain status line reports an unmerged path.
bool is_conflict_status(const std::string& line);
