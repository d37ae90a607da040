#include <iostream>
#include <vector>
#include <string>
#include "cli/args.hpp"
#include "cli/par_cli.hpp"
#include "cli/theme.hpp"

static void usage_line(const std::string& cmd, const std::string& arg, const std::string& desc) {
    std::cout << theme::color::ACCENT << "    par " << cmd << theme::color::RESET;
    if (!arg.empty()) std::cout << " " << theme::warm(arg);
    size_t width = cmd.size() + (arg.empty() ? 0 : arg.size() + 1);
    std::cout << std::string(width < 30 ? 30 - width : 1, ' ')
              << theme::dim(desc) << "\n";
}

void print_usage() {
    std::cout << theme::banner();
    std::cout << theme::section("Usage");
    usage_line("run", "<prompt>", "Run a prompt in every worktree");
    usage_line("run", "-i <text>", "Run an inline instruction");
    usage_line("list", "[worktrees|prompts|results]", "Show what par knows about");
    usage_line("show", "[file] [--format F]", "Render a saved summary");
    usage_line("clean", "[--older-than D|--failed]", "Remove old or failed results");
    usage_line("add", "<name> [-f file]", "Store a prompt");
    usage_line("init", "", "Write ~/.config/par/config.yaml");

    std::cout << theme::section("Run options");
    std::cout << theme::kv("-j, --jobs", "Parallel workers");
    std::cout << theme::kv("-t, --timeout", "Per-job timeout (e.g. 30m, 1h30m)");
    std::cout << theme::kv("-o, --output", "Results directory");
    std::cout << theme::kv("-w, --worktrees", "Filter worktrees by name or glob");
    std::cout << theme::kv("-d, --directories", "Explicit worktree directories (comma-separated)");
    std::cout << theme::kv("--var k=v", "Template variable (repeatable)");
    std::cout << theme::kv("--strict", "Reject worktrees with uncommitted changes");
    std::cout << theme::kv("--sequential", "Run one job at a time");
    std::cout << theme::kv("--dry-run", "Show the plan without running agents");
    std::cout << theme::kv("--transcripts", "Save each agent's output");
    std::cout << theme::kv("--continue-on-failure", "Exit 0 even if jobs failed");

    std::cout << "\n" << theme::color::DIM
              << "    par --config <file>   Use an alternate config\n"
              << "    par --version         Show version\n"
              << "    par --help            Show this help"
              << theme::color::RESET << "\n\n";
}

static int usage_error(const std::string& msg) {
    std::cout << theme::fail(msg);
    std::cout << theme::step("See: par --help");
    return 2;
}

int main(int argc, char** argv) {
    try {
        auto global = parse_global_args(argc, argv);
        if (global.is_err()) return usage_error(global.error);

        const std::string& cmd = global.value.command;
        const auto& args = global.value.args;

        if (cmd.empty() || cmd == "--help" || cmd == "-h" || cmd == "help") {
            print_usage();
            return 0;
        }
        if (cmd == "--version") {
            std::cout << theme::color::WARM << theme::color::BOLD << "par"
                      << theme::color::RESET << theme::color::DIM
                      << " version " << PAR_VERSION << theme::color::RESET << "\n";
            return 0;
        }

        auto config = global.value.config_path.empty()
            ? Config::load_default()
            : Config::load(global.value.config_path);
        if (config.is_err()) {
            std::cout << theme::fail(config.error);
            return 1;
        }

        ParCLI cli(config.value);

        if (cmd == "run") {
            auto opts = parse_run_args(args);
            if (opts.is_err()) return usage_error(opts.error);
            return cli.run(opts.value);
        } else if (cmd == "list") {
            return cli.list(args);
        } else if (cmd == "show") {
            return cli.show(args);
        } else if (cmd == "clean") {
            auto opts = parse_clean_args(args);
            if (opts.is_err()) return usage_error(opts.error);
            return cli.clean(opts.value);
        } else if (cmd == "add") {
            auto opts = parse_add_args(args);
            if (opts.is_err()) return usage_error(opts.error);
            return cli.add(opts.value);
        } else if (cmd == "init") {
            return cli.init();
        }

        std::cout << theme::fail("Unknown command: " + cmd);
        print_usage();
        return 2;
    } catch (const std::exception& e) {
        std::cout << theme::fail(std::string(e.what()));
        return 1;
    }
}
