#include "config.hpp"
#include "constants.hpp"
#include "time_utils.hpp"
#include "utils.hpp"
#include <platform/platform.hpp>
#include <yaml-cpp/yaml.h>
#include <fmt/format.h>
#include <fstream>

namespace fs = std::filesystem;

fs::path get_config_dir() {
    return platform::home_dir() / ".config" / "par";
}

fs::path get_config_path() {
    return get_config_dir() / "config.yaml";
}

bool config_exists() {
    std::error_code ec;
    return fs::exists(get_config_path(), ec);
}

Result<void> create_default_config() {
    fs::path config_path = get_config_path();

    // Don't overwrite existing config
    if (config_exists()) {
        return Result<void>::Ok();
    }

    const char* default_config = R"(# par configuration

defaults:
  jobs: 3                          # parallel workers
  timeout: 60m                     # per-job timeout (500ms, 45s, 30m, 1h30m)
  output_dir: ~/.local/share/par/results

agent:
  binary_path: claude              # agent executable, resolved through PATH
  print_flag: --print
  default_args:
    - --dangerously-skip-permissions

worktrees:
  search_paths:
    - ~/projects
    - ~/work
  exclude_patterns:
    - "*/node_modules/*"
    - "*/.git/*"
    - "*/target/*"

validation:
  strict: false                    # treat uncommitted changes as an error

prompts:
  storage_dir: ~/.local/share/par/prompts
)";

    try {
        fs::create_directories(config_path.parent_path());
        std::ofstream out(config_path);
        if (!out) {
            return Result<void>::Err("Failed to create config file at " + config_path.string());
        }
        out << default_config;
        out.close();
        return Result<void>::Ok();
    } catch (const std::exception& e) {
        return Result<void>::Err("Failed to write config file: " + std::string(e.what()));
    }
}

Config Config::defaults() {
    Config config;
    config.defaults_.jobs = DEFAULT_JOBS;
    config.defaults_.timeout = *parse_duration(DEFAULT_TIMEOUT);
    config.defaults_.output_dir = expand_home(DEFAULT_OUTPUT_DIR);
    config.agent_.binary_path = DEFAULT_AGENT_BINARY;
    config.agent_.print_flag = DEFAULT_PRINT_FLAG;
    config.agent_.default_args = {"--dangerously-skip-permissions"};
    config.worktrees_.search_paths = {expand_home("~/projects"), expand_home("~/work")};
    config.worktrees_.exclude_patterns = {"*/node_modules/*", "*/.git/*", "*/target/*"};
    config.strict_ = false;
    config.prompts_dir_ = expand_home(DEFAULT_PROMPTS_DIR);
    return config;
}

static std::vector<std::string> string_list(const YAML::Node& node,
                                            const std::vector<std::string>& fallback) {
    if (!node) return fallback;
    if (node.IsScalar()) return {node.as<std::string>()};
    return node.as<std::vector<std::string>>(std::vector<std::string>());
}

static Result<void> parse_defaults(const YAML::Node& node, DefaultsConfig& d) {
    if (!node) return Result<void>::Ok();

    d.jobs = node["jobs"].as<int>(d.jobs);

    if (node["timeout"]) {
        std::string text = node["timeout"].as<std::string>("");
        auto parsed = parse_duration(text);
        if (!parsed) {
            return Result<void>::Err(fmt::format("invalid defaults.timeout '{}'", text));
        }
        d.timeout = *parsed;
    }

    if (node["output_dir"]) {
        d.output_dir = expand_home(node["output_dir"].as<std::string>(""));
    }
    return Result<void>::Ok();
}

static void parse_agent(const YAML::Node& node, AgentConfig& a) {
    if (!node) return;
    a.binary_path = node["binary_path"].as<std::string>(a.binary_path);
    a.print_flag = node["print_flag"].as<std::string>(a.print_flag);
    a.default_args = string_list(node["default_args"], a.default_args);
}

static void parse_worktrees(const YAML::Node& node, WorktreeSearchConfig& w) {
    if (!node) return;
    if (node["search_paths"]) {
        w.search_paths.clear();
        for (const auto& p : string_list(node["search_paths"], {})) {
            w.search_paths.push_back(expand_home(p));
        }
    }
    w.exclude_patterns = string_list(node["exclude_patterns"], w.exclude_patterns);
}

Result<Config> Config::parse(const std::string& yaml_text) {
    try {
        YAML::Node root = YAML::Load(yaml_text);
        Config config = defaults();

        if (root && !root.IsNull() && !root.IsMap()) {
            return Result<Config>::Err("config root must be a mapping");
        }

        auto r = parse_defaults(root["defaults"], config.defaults_);
        if (r.is_err()) return Result<Config>::Err(r.error);

        // Accept the legacy "claude" section name
        if (root["agent"]) {
            parse_agent(root["agent"], config.agent_);
        } else if (root["claude"]) {
            parse_agent(root["claude"], config.agent_);
        }

        parse_worktrees(root["worktrees"], config.worktrees_);

        if (root["validation"]) {
            config.strict_ = root["validation"]["strict"].as<bool>(config.strict_);
        }
        if (root["prompts"] && root["prompts"]["storage_dir"]) {
            config.prompts_dir_ = expand_home(root["prompts"]["storage_dir"].as<std::string>(""));
        }

        auto valid = config.validate();
        if (valid.is_err()) return Result<Config>::Err(valid.error);

        return Result<Config>::Ok(config);
    } catch (const std::exception& e) {
        return Result<Config>::Err(std::string("Failed to parse config: ") + e.what());
    }
}

Result<Config> Config::load(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return Result<Config>::Err("Config not found at " + path.string());
    }

    std::string text;
    if (!read_file(path, text)) {
        return Result<Config>::Err("Cannot read config at " + path.string());
    }

    auto result = parse(text);
    if (result.is_err()) {
        return Result<Config>::Err(fmt::format("{}: {}", path.string(), result.error));
    }
    result.value.source_path_ = path;
    return result;
}

Result<Config> Config::load_default() {
    if (!config_exists()) {
        return Result<Config>::Ok(defaults());
    }
    return load(get_config_path());
}

Result<void> Config::validate() const {
    if (defaults_.jobs <= 0) {
        return Result<void>::Err(fmt::format("defaults.jobs must be positive (got {})", defaults_.jobs));
    }
    if (defaults_.timeout.count() <= 0) {
        return Result<void>::Err("defaults.timeout must be positive");
    }
    if (agent_.binary_path.empty()) {
        return Result<void>::Err("agent.binary_path must not be empty");
    }
    if (worktrees_.search_paths.empty()) {
        return Result<void>::Err("worktrees.search_paths must not be empty");
    }
    return Result<void>::Ok();
}
