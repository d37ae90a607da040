#include "par_cli.hpp"
#include "interrupt.hpp"
#include "preflight.hpp"
#include "theme.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <executor/agent_executor.hpp>
#include <executor/scheduler.hpp>
#include <results/reporter.hpp>
#include <results/storage.hpp>
#include <worktree/discovery.hpp>
#include <worktree/validator.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <iostream>
#include <iterator>

ParCLI::ParCLI(Config config) : config_(std::move(config)) {}

// ── run ──────────────────────────────────────────────────────

Result<Prompt> ParCLI::resolve_prompt(const RunOptions& opts) const {
    if (!opts.inline_text.empty()) {
        Prompt p;
        p.name = opts.prompt_name;
        p.content = opts.inline_text;
        p.is_template = !template_placeholders(p.content).empty();
        return Result<Prompt>::Ok(p);
    }
    PromptStore store(config_.prompts_dir());
    return store.load(opts.prompt_name);
}

std::vector<Worktree> ParCLI::target_worktrees(const RunOptions& opts) const {
    std::vector<Worktree> worktrees;

    if (!opts.directories.empty()) {
        for (const auto& dir : opts.directories) {
            auto wt = inspect_worktree(expand_home(dir));
            if (wt) {
                worktrees.push_back(*wt);
            } else {
                // Not a checkout; the validator reports why
                Worktree bare;
                bare.id = generate_id();
                bare.path = fs::absolute(expand_home(dir));
                bare.name = bare.path.filename().string();
                bare.project_name = bare.name;
                bare.branch = "unknown";
                worktrees.push_back(bare);
            }
        }
    } else {
        worktrees = Discovery(config_).find_worktrees();
    }

    if (!opts.worktree_pattern.empty()) {
        worktrees = filter_by_pattern(worktrees, opts.worktree_pattern);
    }
    return worktrees;
}

int ParCLI::run(const RunOptions& opts) {
    if (opts.jobs) config_.set_jobs(*opts.jobs);
    if (opts.timeout) config_.set_timeout(*opts.timeout);
    if (!opts.output_dir.empty()) config_.set_output_dir(expand_home(opts.output_dir));
    if (opts.strict) config_.set_strict(true);

    if (!opts.dry_run) {
        std::cout << theme::section("Preflight");
        bool blocked = false;
        for (const auto& issue : run_preflight_checks(config_)) {
            if (issue.is_hint) {
                std::cout << theme::info(issue.message);
            } else {
                std::cout << theme::fail(issue.message);
                blocked = true;
            }
            std::cout << theme::step(issue.fix);
        }
        if (blocked) return 1;
        std::cout << theme::ok("Environment ready");
    }

    auto prompt = resolve_prompt(opts);
    if (prompt.is_err()) {
        std::cout << theme::fail(prompt.error);
        return 1;
    }

    auto vars = parse_template_vars(opts.vars);
    if (vars.is_err()) {
        std::cout << theme::fail(vars.error);
        return 1;
    }

    // Discover + validate
    std::cout << theme::section("Worktrees");
    auto candidates = target_worktrees(opts);
    Validator validator(config_);
    auto filtered = validator.filter_valid(candidates);

    for (const auto& [path, vr] : filtered.results) {
        if (!vr.is_valid) {
            std::cout << theme::fail(fmt::format("{}  {}", vr.worktree.name, theme::dim(path)));
            for (const auto& e : vr.errors) std::cout << theme::step(e);
        } else {
            std::cout << theme::ok(fmt::format("{} {}", vr.worktree.name,
                                               theme::dim("[" + vr.worktree.branch + "]")));
            for (const auto& w : vr.warnings) std::cout << theme::log(w);
        }
    }

    if (filtered.valid.empty()) {
        std::cout << theme::fail(fmt::format("No valid worktrees found (out of {} discovered)",
                                             candidates.size()));
        return 1;
    }
    std::cout << "\n" << theme::info(fmt::format("Found {} valid worktrees (out of {} discovered)",
                                                 filtered.valid.size(), candidates.size()));

    PlanOptions plan_opts;
    plan_opts.max_workers = config_.defaults_section().jobs;
    plan_opts.timeout = config_.defaults_section().timeout;
    plan_opts.dry_run = opts.dry_run;

    auto plan = build_plan(filtered.valid, prompt.value, vars.value, plan_opts);
    if (plan.is_err()) {
        std::cout << theme::fail(plan.error);
        return 1;
    }

    if (opts.dry_run) {
        std::cout << theme::section("Dry run");
        for (const auto& job : plan.value.jobs) {
            std::cout << theme::step(fmt::format("{} ({}) [{}]", job.worktree.name,
                                                 job.worktree.path.string(), job.worktree.branch));
        }
        std::cout << "\n" << theme::kv("Workers", std::to_string(plan.value.max_workers));
        std::cout << theme::kv("Timeout", format_duration(plan.value.timeout));
        std::cout << theme::kv("Agent", config_.agent().binary_path);
        std::cout << "\n" << theme::dim("    Instruction for " + plan.value.jobs.front().worktree.name + ":") << "\n";
        std::cout << plan.value.jobs.front().instruction_text << "\n";
        return 0;
    }

    // Execute
    std::cout << theme::section(fmt::format("Running {} jobs with {} workers",
                                            plan.value.total_jobs,
                                            std::min(plan.value.max_workers, plan.value.total_jobs)));

    AgentExecutor executor(config_);
    Scheduler scheduler(executor);
    int done = 0;
    scheduler.on_result([&](const JobResult& r) {
        done++;
        std::string line = fmt::format("[{}/{}] {}  {}  {}", done, plan.value.total_jobs,
                                       r.worktree, theme::status_badge(to_string(r.status)),
                                       theme::dim(format_duration(r.duration)));
        std::cout << (r.status == JobStatus::Success ? theme::ok(line) : theme::fail(line));
        if (!r.error_message.empty() && r.status != JobStatus::Success) {
            std::cout << theme::log(r.error_message);
        }
        std::cout.flush();
    });

    CancelToken cancel;
    Result<std::vector<JobResult>> results = Result<std::vector<JobResult>>::Err("not run");
    {
        InterruptWatcher interrupt(cancel, []() {
            std::cout << "\n" << theme::info("Interrupted, stopping running agents...");
            std::cout.flush();
        });
        results = opts.sequential ? scheduler.execute_sequential(plan.value, cancel)
                                  : scheduler.execute(plan.value, cancel);
    }

    if (results.is_err()) {
        std::cout << theme::fail(results.error);
        return 1;
    }

    ExecutionSummary summary = aggregate(results.value, plan.value.id);
    std::cout << theme::divider();
    std::cout << render_console(summary);

    // Persist; a storage error does not change the run's outcome
    Storage storage(config_.defaults_section().output_dir);
    std::string session_id = generate_id();
    auto saved = storage.save_summary(summary, session_id);
    if (saved.is_ok()) {
        std::cout << "\n" << theme::ok("Results saved to " + saved.value + ".json");
    } else {
        std::cout << "\n" << theme::fail("Failed to save results: " + saved.error);
    }

    if (opts.transcripts) {
        auto dir = storage.save_transcripts(summary, session_id);
        if (dir.is_ok()) {
            std::cout << theme::ok("Transcripts saved to " + dir.value.string());
        } else {
            std::cout << theme::fail("Failed to save transcripts: " + dir.error);
        }
    }
    std::cout << "\n";

    if (summary.has_failures() && !opts.continue_on_failure) {
        return 1;
    }
    return 0;
}

// ── list ─────────────────────────────────────────────────────

int ParCLI::list(const std::vector<std::string>& args) {
    std::string what = args.empty() ? "worktrees" : args.front();
    if (what == "worktrees") return list_worktrees();
    if (what == "prompts") return list_prompts();
    if (what == "results") return list_results();

    std::cout << theme::fail("Unknown list target: " + what);
    std::cout << theme::step("Usage: par list [worktrees|prompts|results]");
    return 1;
}

int ParCLI::list_worktrees() const {
    auto worktrees = Discovery(config_).find_worktrees();
    std::cout << theme::section(fmt::format("Worktrees ({})", worktrees.size()));
    if (worktrees.empty()) {
        std::cout << theme::dim("    None found under the configured search paths.") << "\n";
        for (const auto& p : config_.worktrees().search_paths) {
            std::cout << theme::step(p.string());
        }
        return 0;
    }
    for (const auto& wt : worktrees) {
        std::string flags;
        if (wt.is_linked) flags += " linked";
        if (wt.is_dirty) flags += " dirty";
        std::cout << theme::step(fmt::format("{} {}{}", theme::bold(wt.name),
                                             theme::dim("[" + wt.branch + "]"),
                                             flags.empty() ? "" : theme::yellow(flags)));
        std::cout << theme::kv("path", wt.path.string());
        if (wt.project_name != wt.name) std::cout << theme::kv("project", wt.project_name);
        if (!wt.remote_url.empty()) std::cout << theme::kv("remote", wt.remote_url);
    }
    std::cout << "\n";
    return 0;
}

int ParCLI::list_prompts() const {
    PromptStore store(config_.prompts_dir());
    auto prompts = store.list();
    if (prompts.is_err()) {
        std::cout << theme::fail(prompts.error);
        return 1;
    }
    std::cout << theme::section(fmt::format("Prompts ({})", prompts.value.size()));
    if (prompts.value.empty()) {
        std::cout << theme::step("Add one with: par add <name> -f <file>");
        return 0;
    }
    for (const auto& p : prompts.value) {
        std::string label = theme::bold(p.name);
        if (p.is_template) label += theme::dim(" [template]");
        std::cout << theme::step(label);
        if (!p.description.empty()) std::cout << theme::log(p.description);
    }
    std::cout << "\n";
    return 0;
}

int ParCLI::list_results() const {
    Storage storage(config_.defaults_section().output_dir);
    auto files = storage.list_summaries();
    if (files.is_err()) {
        std::cout << theme::fail(files.error);
        return 1;
    }
    std::cout << theme::section(fmt::format("Results ({})", files.value.size()));
    for (const auto& f : files.value) {
        auto s = storage.load_summary(f);
        if (s.is_err()) {
            std::cout << theme::fail(f.filename().string() + theme::dim("  unreadable"));
            continue;
        }
        const auto& sum = s.value;
        std::string counts = fmt::format("{}/{} ok", sum.successful, sum.total_jobs);
        std::string line = fmt::format("{}  {}  {}", f.filename().string(), counts,
                                       theme::dim(format_duration(sum.duration)));
        std::cout << (sum.has_failures() ? theme::fail(line) : theme::ok(line));
    }
    std::cout << "\n";
    return 0;
}

// ── clean / show / add / init ────────────────────────────────

int ParCLI::clean(const CleanOptions& opts) {
    Storage storage(config_.defaults_section().output_dir);

    auto removed = opts.failed_only ? storage.clean_failed_runs()
                                    : storage.clean_old_results(opts.older_than);
    if (removed.is_err()) {
        std::cout << theme::fail(removed.error);
        return 1;
    }
    if (opts.failed_only) {
        std::cout << theme::ok(fmt::format("Removed {} failed runs", removed.value));
    } else {
        std::cout << theme::ok(fmt::format("Removed {} entries older than {}", removed.value,
                                           format_duration(opts.older_than)));
    }
    return 0;
}

int ParCLI::show(const std::vector<std::string>& args) {
    std::string file;
    ReportFormat format = ReportFormat::Detailed;

    for (size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--format") {
            if (i + 1 >= args.size()) {
                std::cout << theme::fail("--format requires a value");
                return 1;
            }
            auto f = parse_report_format(args[++i]);
            if (!f) {
                std::cout << theme::fail("Unknown format: " + args[i]);
                std::cout << theme::step("Formats: console, detailed, json, csv");
                return 1;
            }
            format = *f;
        } else if (file.empty()) {
            file = args[i];
        } else {
            std::cout << theme::fail("Unexpected argument: " + args[i]);
            return 1;
        }
    }

    Storage storage(config_.defaults_section().output_dir);
    if (file.empty()) {
        auto files = storage.list_summaries();
        if (files.is_err() || files.value.empty()) {
            std::cout << theme::fail("No saved results in " + storage.output_dir().string());
            return 1;
        }
        file = files.value.front().string();
    }

    auto summary = storage.load_summary(file);
    if (summary.is_err()) {
        std::cout << theme::fail(summary.error);
        return 1;
    }
    std::cout << render(format, summary.value);
    return 0;
}

int ParCLI::add(const AddOptions& opts) {
    PromptStore store(config_.prompts_dir());

    auto name_ok = validate_prompt_name(opts.name);
    if (name_ok.is_err()) {
        std::cout << theme::fail(name_ok.error);
        return 1;
    }
    if (store.exists(opts.name)) {
        std::cout << theme::fail(fmt::format("Prompt '{}' already exists", opts.name));
        std::cout << theme::step("Delete " + (store.storage_dir() / (opts.name + ".yaml")).string() + " first");
        return 1;
    }

    std::string content;
    if (!opts.file.empty()) {
        if (!read_file(expand_home(opts.file), content)) {
            std::cout << theme::fail("Cannot read " + opts.file);
            return 1;
        }
    } else {
        content.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }

    auto content_ok = validate_prompt_content(content);
    if (content_ok.is_err()) {
        std::cout << theme::fail(content_ok.error);
        return 1;
    }

    auto vars = parse_template_vars(opts.vars);
    if (vars.is_err()) {
        std::cout << theme::fail(vars.error);
        return 1;
    }

    Prompt prompt;
    prompt.name = opts.name;
    prompt.description = opts.description;
    prompt.content = content;
    prompt.is_template = opts.is_template || !template_placeholders(content).empty();
    prompt.variables = vars.value;

    auto saved = store.save(prompt);
    if (saved.is_err()) {
        std::cout << theme::fail(saved.error);
        return 1;
    }
    std::cout << theme::ok(fmt::format("Saved prompt '{}'{}", prompt.name,
                                       prompt.is_template ? " (template)" : ""));
    return 0;
}

int ParCLI::init() {
    if (config_exists()) {
        std::cout << theme::info("Config already exists at " + get_config_path().string());
        return 0;
    }
    auto r = create_default_config();
    if (r.is_err()) {
        std::cout << theme::fail(r.error);
        return 1;
    }
    std::cout << theme::ok("Wrote " + get_config_path().string());
    return 0;
}
