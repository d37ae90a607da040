#pragma once

#include <map>
#include <string>
#include <vector>
#include <core/config.hpp>
#include "worktree.hpp"

class Validator {
public:
    explicit Validator(const Config& config);
    explicit Validator(bool strict);

    // Checks one worktree. Never modifies the input; the copy in the result
    // carries the refreshed is_valid / is_dirty flags.
    ValidationResult validate(const Worktree& worktree) const;

    struct Filtered {
        std::vector<Worktree> valid;
        std::map<std::string, ValidationResult> results;  // keyed by path
    };

    Filtered filter_valid(const std::vector<Worktree>& worktrees) const;

    bool strict() const { return strict_; }

private:
    bool strict_;

    void check_dependencies(const fs::path& dir, ValidationResult& result) const;
    void check_disk_space(const fs::path& dir, ValidationResult& result) const;
};
