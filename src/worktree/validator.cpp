#include "validator.hpp"
#include "git_repo.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <platform/platform.hpp>
#include <fmt/format.h>
#include <algorithm>

namespace fs = std::filesystem;

static const char* const kManifests[] = {
    "package.json", "go.mod", "Cargo.toml", "pyproject.toml",
    "requirements.txt", "Gemfile", "composer.json", "CMakeLists.txt",
};

static const char* const kLockFiles[] = {
    "package-lock.json", "yarn.lock", "pnpm-lock.yaml", "go.sum",
    "Cargo.lock", "poetry.lock", "uv.lock", "Gemfile.lock", "composer.lock",
};

Validator::Validator(const Config& config) : strict_(config.strict_validation()) {}

Validator::Validator(bool strict) : strict_(strict) {}

ValidationResult Validator::validate(const Worktree& worktree) const {
    ValidationResult result;
    result.worktree = worktree;

    auto finish = [&]() {
        result.is_valid = result.errors.empty();
        result.worktree.is_valid = result.is_valid;
        return result;
    };

    std::error_code ec;
    if (!fs::is_directory(worktree.path, ec)) {
        result.errors.push_back("path does not exist: " + worktree.path.string());
        return finish();
    }

    auto repo = GitRepo::open(worktree.path);
    if (!repo || !repo->read_head()) {
        result.errors.push_back("not a valid git repository");
        return finish();
    }

    bool conflicts = repo->merge_in_progress();
    auto status = repo->status();
    if (status.is_ok()) {
        result.worktree.is_dirty = !status.value.empty();
        conflicts = conflicts || std::any_of(status.value.begin(), status.value.end(),
                                             is_conflict_status);
    } else {
        result.warnings.push_back("could not read git status: " + status.error);
    }

    if (conflicts) {
        result.errors.push_back("unresolved merge conflicts");
    }

    if (result.worktree.is_dirty) {
        if (strict_) {
            result.errors.push_back("uncommitted changes (strict mode)");
        } else {
            result.warnings.push_back("uncommitted changes");
        }
    }

    check_dependencies(worktree.path, result);
    check_disk_space(worktree.path, result);

    return finish();
}

void Validator::check_dependencies(const fs::path& dir, ValidationResult& result) const {
    std::error_code ec;
    for (const char* name : kManifests) {
        if (fs::exists(dir / name, ec)) {
            result.warnings.push_back(fmt::format("dependency manifest present: {}", name));
        }
    }
    for (const char* name : kLockFiles) {
        if (fs::exists(dir / name, ec)) {
            result.warnings.push_back(fmt::format("lock file present: {} (may need install)", name));
        }
    }
}

void Validator::check_disk_space(const fs::path& dir, ValidationResult& result) const {
    auto available = platform::available_disk_bytes(dir);
    if (available && *available < LOW_DISK_THRESHOLD_BYTES) {
        result.warnings.push_back(fmt::format("low disk space: {} MiB free",
                                              *available / (1024 * 1024)));
    }
}

Validator::Filtered Validator::filter_valid(const std::vector<Worktree>& worktrees) const {
    Filtered out;
    for (const auto& wt : worktrees) {
        auto result = validate(wt);
        if (result.is_valid) {
            out.valid.push_back(result.worktree);
        } else {
            par_log(fmt::format("VALIDATOR: {} invalid: {}", wt.path.string(),
                                result.errors.empty() ? "" : result.errors.front()));
        }
        out.results[wt.path.string()] = std::move(result);
    }
    return out;
}
