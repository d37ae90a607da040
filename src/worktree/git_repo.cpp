#include "git_repo.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/utils.hpp>
#include <platform/process.hpp>
#include <fmt/format.h>
#include <cctype>

namespace fs = std::filesystem;

// A relative path inside a git metadata file is relative to that file's directory.
static fs::path resolve_relative(const fs::path& base, const std::string& value) {
    fs::path p(value);
    if (p.is_relative()) p = base / p;
    std::error_code ec;
    auto canon = fs::weakly_canonical(p, ec);
    return ec ? p.lexically_normal() : canon;
}

std::optional<GitRepo> GitRepo::open(const fs::path& dir) {
    std::error_code ec;
    fs::path dot_git = dir / ".git";
    auto st = fs::status(dot_git, ec);
    if (ec) return std::nullopt;

    GitRepo repo;
    repo.worktree_path_ = dir;

    if (fs::is_directory(st)) {
        repo.git_dir_ = dot_git;
        repo.common_dir_ = dot_git;
        return repo;
    }

    if (!fs::is_regular_file(st)) return std::nullopt;

    // Linked checkout: .git is "gitdir: <path>"
    std::string content;
    if (!read_file(dot_git, content)) return std::nullopt;
    trim(content);
    const std::string prefix = "gitdir:";
    if (!starts_with(content, prefix)) return std::nullopt;
    std::string target = content.substr(prefix.size());
    trim(target);
    if (target.empty()) return std::nullopt;

    repo.git_dir_ = resolve_relative(dir, target);
    repo.linked_ = true;

    std::string commondir;
    if (read_file(repo.git_dir_ / "commondir", commondir)) {
        trim(commondir);
        repo.common_dir_ = resolve_relative(repo.git_dir_, commondir);
    } else {
        repo.common_dir_ = repo.git_dir_;
    }
    return repo;
}

fs::path GitRepo::primary_path() const {
    if (!linked_) return worktree_path_;
    if (common_dir_.filename() == ".git") return common_dir_.parent_path();
    return common_dir_;  // bare repository
}

std::optional<std::string> GitRepo::read_head() const {
    std::string head;
    if (!read_file(git_dir_ / "HEAD", head)) return std::nullopt;
    trim(head);
    if (head.empty()) return std::nullopt;
    return head;
}

std::string GitRepo::branch() const {
    auto head = read_head();
    if (!head) return "unknown";
    return branch_from_head(*head);
}

std::string GitRepo::remote_url(const std::string& remote) const {
    std::string config;
    if (!read_file(common_dir_ / "config", config)) return "";

    const std::string section = fmt::format("[remote \"{}\"]", remote);
    bool in_section = false;
    for (auto line : split_lines(config)) {
        trim(line);
        if (line.empty() || line[0] == '#' || line[0] == ';') continue;
        if (line[0] == '[') {
            in_section = (line == section);
            continue;
        }
        if (!in_section) continue;

        auto eq = line.find('=');
        if (eq == std::string::npos) continue;
        std::string key = line.substr(0, eq);
        std::string value = line.substr(eq + 1);
        trim(key);
        trim(value);
        if (key == "url") return value;
    }
    return "";
}

std::vector<fs::path> GitRepo::linked_worktrees() const {
    std::vector<fs::path> out;
    std::error_code ec;
    fs::path registry = common_dir_ / "worktrees";
    if (!fs::is_directory(registry, ec)) return out;

    for (const auto& entry : fs::directory_iterator(registry, ec)) {
        std::string gitdir;
        if (!read_file(entry.path() / "gitdir", gitdir)) continue;
        trim(gitdir);
        if (gitdir.empty()) continue;

        // gitdir holds the path of the checkout's .git pointer file
        fs::path checkout = resolve_relative(entry.path(), gitdir).parent_path();
        if (fs::is_directory(checkout, ec)) out.push_back(checkout);
    }
    return out;
}

bool GitRepo::merge_in_progress() const {
    std::error_code ec;
    return fs::exists(git_dir_ / "MERGE_HEAD", ec);
}

Result<std::vector<std::string>> GitRepo::status() const {
    platform::CaptureOptions opts;
    opts.working_dir = worktree_path_.string();
    opts.timeout_ms = GIT_STATUS_TIMEOUT_MS;

    std::vector<std::string> args = {"status", "--porcelain"};
    auto res = platform::run_capture("git", args, opts);

    if (res.end == platform::CaptureEnd::SpawnFailed) {
        return Result<std::vector<std::string>>::Err(res.error);
    }
    if (res.end == platform::CaptureEnd::TimedOut) {
        return Result<std::vector<std::string>>::Err("git status timed out");
    }
    if (res.exit_code != 0) {
        par_log_process("GIT", "git status --porcelain in " + worktree_path_.string(),
                        res.exit_code, res.output);
        std::string msg = res.output;
        trim(msg);
        return Result<std::vector<std::string>>::Err(
            fmt::format("git status exited with code {}: {}", res.exit_code, msg));
    }

    std::vector<std::string> lines;
    for (auto& line : split_lines(res.output)) {
        if (!line.empty()) lines.push_back(line);
    }
    return Result<std::vector<std::string>>::Ok(lines);
}

std::string branch_from_head(const std::string& head) {
    const std::string ref_prefix = "ref:";
    if (starts_with(head, ref_prefix)) {
        std::string ref = head.substr(ref_prefix.size());
        trim(ref);
        const std::string heads = "refs/heads/";
        if (starts_with(ref, heads)) ref = ref.substr(heads.size());
        return ref.empty() ? "unknown" : ref;
    }

    // Detached HEAD: SHA-1 (40) or SHA-256 (64) object name
    if (head.size() != 40 && head.size() != 64) return "unknown";
    for (char c : head) {
        if (!std::isxdigit(static_cast<unsigned char>(c))) return "unknown";
    }
    return head.substr(0, 7);
}

bool is_conflict_status(const std::string& line) {
    if (line.size() < 2) return false;
    char x = line[0];
    char y = line[1];
    if (x == 'U' || y == 'U') return true;
    return (x == 'A' && y == 'A') || (x == 'D' && y == 'D');
}
