#include "discovery.hpp"
#include "git_repo.hpp"
#include "glob.hpp"
#include <core/log.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <set>

namespace fs = std::filesystem;

static fs::path canonical_or_absolute(const fs::path& p) {
    std::error_code ec;
    auto canon = fs::canonical(p, ec);
    if (!ec) return canon;
    auto abs = fs::absolute(p, ec);
    return ec ? p : abs.lexically_normal();
}

std::optional<Worktree> inspect_worktree(const fs::path& dir) {
    fs::path path = canonical_or_absolute(dir);
    auto repo = GitRepo::open(path);
    if (!repo) return std::nullopt;

    Worktree wt;
    wt.id = generate_id();
    wt.name = path.filename().string();
    wt.path = path;
    wt.branch = repo->branch();
    wt.remote_url = repo->remote_url();
    wt.is_linked = repo->is_linked();
    wt.project_name = repo->primary_path().filename().string();
    if (wt.project_name.empty()) wt.project_name = wt.name;

    auto status = repo->status();
    if (status.is_ok()) {
        wt.is_dirty = !status.value.empty();
    } else {
        par_log(fmt::format("DISCOVERY: status unavailable for {}: {}", path.string(), status.error));
    }
    return wt;
}

Discovery::Discovery(const Config& config) : config_(config) {}

std::vector<Worktree> Discovery::find_worktrees() const {
    return discover(config_.worktrees().search_paths, config_.worktrees().exclude_patterns);
}

std::vector<Worktree> Discovery::discover(const std::vector<fs::path>& roots,
                                          const std::vector<std::string>& exclude_patterns) {
    ExcludeMatcher matcher(exclude_patterns);
    std::set<std::string> seen;
    std::vector<Worktree> found;

    auto add = [&](const fs::path& dir) {
        fs::path path = canonical_or_absolute(dir);
        if (!seen.insert(path.string()).second) return;
        auto wt = inspect_worktree(path);
        if (wt) found.push_back(std::move(*wt));
    };

    // A primary checkout also brings in the linked checkouts it registered,
    // which may live outside every search root.
    auto add_repo = [&](const fs::path& dir) {
        auto repo = GitRepo::open(dir);
        if (!repo) return;
        add(dir);
        if (repo->is_linked()) return;
        for (const auto& linked : repo->linked_worktrees()) {
            if (!matcher.excludes(linked)) add(linked);
        }
    };

    for (const auto& root_in : roots) {
        fs::path root = expand_home(root_in.string());
        std::error_code ec;
        if (!fs::is_directory(root, ec)) {
            par_log("DISCOVERY: skipping missing root " + root.string());
            continue;
        }
        root = canonical_or_absolute(root);
        if (matcher.excludes(root)) continue;

        if (GitRepo::open(root)) {
            add_repo(root);
            continue;
        }

        fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
        if (ec) {
            par_log(fmt::format("DISCOVERY: cannot read {}: {}", root.string(), ec.message()));
            continue;
        }

        for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
            if (ec) {
                par_log(fmt::format("DISCOVERY: walk of {} stopped: {}", root.string(), ec.message()));
                break;
            }

            const auto& entry = *it;
            std::error_code entry_ec;
            if (entry.is_symlink(entry_ec) || !entry.is_directory(entry_ec)) continue;

            std::string name = entry.path().filename().string();
            if (!name.empty() && name[0] == '.') {
                it.disable_recursion_pending();
                continue;
            }
            if (matcher.excludes(entry.path())) {
                it.disable_recursion_pending();
                continue;
            }
            if (GitRepo::open(entry.path())) {
                it.disable_recursion_pending();
                add_repo(entry.path());
            }
        }
    }

    std::sort(found.begin(), found.end(), [](const Worktree& a, const Worktree& b) {
        return a.path < b.path;
    });
    par_log(fmt::format("DISCOVERY: found {} worktrees under {} roots", found.size(), roots.size()));
    return found;
}

std::vector<Worktree> filter_by_pattern(const std::vector<Worktree>& worktrees,
                                        const std::string& pattern) {
    if (pattern.empty()) return worktrees;

    bool is_glob = pattern.find_first_of("*?[") != std::string::npos;
    auto matches = [&](const std::string& text) {
        if (is_glob) return glob_match(pattern, text);
        return text.find(pattern) != std::string::npos;
    };

    std::vector<Worktree> out;
    for (const auto& wt : worktrees) {
        if (matches(wt.name) || matches(wt.project_name) || matches(wt.path.string())) {
            out.push_back(wt);
        }
    }
    return out;
}
