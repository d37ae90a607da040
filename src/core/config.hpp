#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include "types.hpp"

namespace fs = std::filesystem;

struct DefaultsConfig {
    int jobs = 3;
    Millis timeout{60 * 60 * 1000};
    fs::path output_dir;
};

struct AgentConfig {
    std::string binary_path;
    std::string print_flag;
    std::vector<std::string> default_args;
};

struct WorktreeSearchConfig {
    std::vector<fs::path> search_paths;
    std::vector<std::string> exclude_patterns;
};

class Config {
public:
    // Load from an explicit YAML file. A missing file is an error.
    static Result<Config> load(const fs::path& path);

    // Load ~/.config/par/config.yaml, or built-in defaults if it does not exist
    static Result<Config> load_default();

    // Parse YAML text (used by load and by tests)
    static Result<Config> parse(const std::string& yaml_text);

    // Built-in defaults, with paths already ~-expanded
    static Config defaults();

    // Accessors
    const DefaultsConfig& defaults_section() const { return defaults_; }
    const AgentConfig& agent() const { return agent_; }
    const WorktreeSearchConfig& worktrees() const { return worktrees_; }
    bool strict_validation() const { return strict_; }
    const fs::path& prompts_dir() const { return prompts_dir_; }
    const fs::path& source_path() const { return source_path_; }

    // Command-line overrides
    void set_jobs(int jobs) { defaults_.jobs = jobs; }
    void set_timeout(Millis timeout) { defaults_.timeout = timeout; }
    void set_output_dir(const fs::path& dir) { defaults_.output_dir = dir; }
    void set_strict(bool strict) { strict_ = strict; }
    void set_agent_binary(const std::string& binary) { agent_.binary_path = binary; }
    void set_agent_args(std::vector<std::string> args) { agent_.default_args = std::move(args); }

    // Returns the first violated rule, if any
    Result<void> validate() const;

public:
    Config() = default;

private:
    DefaultsConfig defaults_;
    AgentConfig agent_;
    WorktreeSearchConfig worktrees_;
    bool strict_ = false;
    fs::path prompts_dir_;
    fs::path source_path_;
};

fs::path get_config_dir();
fs::path get_config_path();
bool config_exists();

// Write a commented default config if none exists
Result<void> create_default_config();
