#pragma once

#include <string>
#include <vector>
#include <optional>
#include <core/types.hpp>

// Options common to every command; --config may appear anywhere.
struct GlobalOptions {
    std::string config_path;
    std::string command;
    std::vector<std::string> args;
};

struct RunOptions {
    std::string prompt_name;
    std::optional<int> jobs;
    std::optional<Millis> timeout;
    std::string output_dir;
    std::string worktree_pattern;
    std::vector<std::string> directories;
    std::vector<std::string> vars;        // "key=value"
    std::string inline_text;              // -i: instruction instead of a stored prompt
    bool strict = false;
    bool sequential = false;
    bool dry_run = false;
    bool transcripts = false;
    bool continue_on_failure = false;
};

struct CleanOptions {
    Millis older_than{30LL * 24 * 60 * 60 * 1000};
    bool failed_only = false;
};

struct AddOptions {
    std::string name;
    std::string file;                     // empty = read stdin
    std::string description;
    bool is_template = false;
    std::vector<std::string> vars;        // default values, "key=value"
};

Result<GlobalOptions> parse_global_args(int argc, char** argv);
Result<RunOptions> parse_run_args(const std::vector<std::string>& args);
Result<CleanOptions> parse_clean_args(const std::vector<std::string>& args);
Result<AddOptions> parse_add_args(const std::vector<std::string>& args);
