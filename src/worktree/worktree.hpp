#pragma once

#include <string>
#include <vector>
#include <filesystem>

namespace fs = std::filesystem;

// A working directory backed by a git repository.
struct Worktree {
    std::string id;
    std::string name;           // directory name
    fs::path path;              // absolute, canonical
    std::string branch;         // branch name, short hash, or "unknown"
    bool is_dirty = false;
    bool is_valid = false;      // set by the Validator
    std::string remote_url;     // origin url, empty if none
    std::string project_name;   // primary checkout's directory name
    bool is_linked = false;     // .git is a pointer file (secondary checkout)
};

struct ValidationResult {
    Worktree worktree;
    bool is_valid = false;
    std::vector<std::string> errors;
    std::vector<std::string> warnings;
};
