#include "args.hpp"
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>

namespace {

struct Flag {
    std::string name;
    std::optional<std::string> inline_value;   // from --name=value
};

Flag split_flag(const std::string& arg) {
    if (starts_with(arg, "--")) {
        auto eq = arg.find('=');
        if (eq != std::string::npos) {
            return {arg.substr(0, eq), arg.substr(eq + 1)};
        }
    }
    return {arg, std::nullopt};
}

Result<std::string> flag_value(const Flag& flag, const std::vector<std::string>& args, size_t& i) {
    if (flag.inline_value) return Result<std::string>::Ok(*flag.inline_value);
    if (i + 1 >= args.size()) {
        return Result<std::string>::Err(fmt::format("{} requires a value", flag.name));
    }
    return Result<std::string>::Ok(args[++i]);
}

bool is_flag(const std::string& arg) {
    return arg.size() > 1 && arg[0] == '-';
}

}  // namespace

Result<GlobalOptions> parse_global_args(int argc, char** argv) {
    GlobalOptions opts;
    std::vector<std::string> rest;
    std::vector<std::string> all(argv + 1, argv + argc);

    for (size_t i = 0; i < all.size(); ++i) {
        Flag f = split_flag(all[i]);
        if (f.name == "--config") {
            auto v = flag_value(f, all, i);
            if (v.is_err()) return Result<GlobalOptions>::Err(v.error);
            opts.config_path = v.value;
        } else {
            rest.push_back(all[i]);
        }
    }

    if (!rest.empty()) {
        opts.command = rest.front();
        opts.args.assign(rest.begin() + 1, rest.end());
    }
    return Result<GlobalOptions>::Ok(opts);
}

Result<RunOptions> parse_run_args(const std::vector<std::string>& args) {
    RunOptions opts;

    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (!is_flag(arg)) {
            if (!opts.prompt_name.empty()) {
                return Result<RunOptions>::Err(fmt::format("unexpected argument '{}'", arg));
            }
            opts.prompt_name = arg;
            continue;
        }

        Flag f = split_flag(arg);
        const std::string& name = f.name;

        if (name == "-j" || name == "--jobs") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            int jobs = safe_stoi(v.value, 0);
            if (jobs <= 0) {
                return Result<RunOptions>::Err(fmt::format("invalid job count '{}'", v.value));
            }
            opts.jobs = jobs;
        } else if (name == "-t" || name == "--timeout") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            auto d = parse_duration(v.value);
            if (!d || d->count() <= 0) {
                return Result<RunOptions>::Err(fmt::format("invalid timeout duration '{}'", v.value));
            }
            opts.timeout = *d;
        } else if (name == "-o" || name == "--output") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            opts.output_dir = v.value;
        } else if (name == "-w" || name == "--worktrees") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            opts.worktree_pattern = v.value;
        } else if (name == "-d" || name == "--directories") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            // Comma-separated or repeated
            size_t start = 0;
            while (start <= v.value.size()) {
                size_t comma = v.value.find(',', start);
                std::string dir = v.value.substr(start, comma == std::string::npos ? std::string::npos : comma - start);
                trim(dir);
                if (!dir.empty()) opts.directories.push_back(dir);
                if (comma == std::string::npos) break;
                start = comma + 1;
            }
        } else if (name == "--var" || name == "--template-vars") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            opts.vars.push_back(v.value);
        } else if (name == "-i" || name == "--instruction") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<RunOptions>::Err(v.error);
            opts.inline_text = v.value;
        } else if (name == "--strict") {
            opts.strict = true;
        } else if (name == "--sequential") {
            opts.sequential = true;
        } else if (name == "--dry-run") {
            opts.dry_run = true;
        } else if (name == "--transcripts") {
            opts.transcripts = true;
        } else if (name == "--continue-on-failure") {
            opts.continue_on_failure = true;
        } else {
            return Result<RunOptions>::Err(fmt::format("unknown option '{}'", arg));
        }
    }

    if (opts.prompt_name.empty()) {
        if (opts.inline_text.empty()) {
            return Result<RunOptions>::Err("missing prompt name");
        }
        opts.prompt_name = "inline";
    }
    return Result<RunOptions>::Ok(opts);
}

Result<CleanOptions> parse_clean_args(const std::vector<std::string>& args) {
    CleanOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        Flag f = split_flag(args[i]);
        if (f.name == "--older-than" || f.name == "--old") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<CleanOptions>::Err(v.error);
            auto d = parse_duration(v.value);
            if (!d) {
                return Result<CleanOptions>::Err(fmt::format("invalid duration '{}'", v.value));
            }
            opts.older_than = *d;
        } else if (f.name == "--failed") {
            opts.failed_only = true;
        } else {
            return Result<CleanOptions>::Err(fmt::format("unknown option '{}'", args[i]));
        }
    }
    return Result<CleanOptions>::Ok(opts);
}

Result<AddOptions> parse_add_args(const std::vector<std::string>& args) {
    AddOptions opts;
    for (size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        if (!is_flag(arg)) {
            if (!opts.name.empty()) {
                return Result<AddOptions>::Err(fmt::format("unexpected argument '{}'", arg));
            }
            opts.name = arg;
            continue;
        }

        Flag f = split_flag(arg);
        if (f.name == "-n" || f.name == "--name") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<AddOptions>::Err(v.error);
            opts.name = v.value;
        } else if (f.name == "-f" || f.name == "--file") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<AddOptions>::Err(v.error);
            opts.file = v.value;
        } else if (f.name == "--description") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<AddOptions>::Err(v.error);
            opts.description = v.value;
        } else if (f.name == "--var") {
            auto v = flag_value(f, args, i);
            if (v.is_err()) return Result<AddOptions>::Err(v.error);
            opts.vars.push_back(v.value);
        } else if (f.name == "--template") {
            opts.is_template = true;
        } else {
            return Result<AddOptions>::Err(fmt::format("unknown option '{}'", arg));
        }
    }

    if (opts.name.empty()) {
        return Result<AddOptions>::Err("missing prompt name");
    }
    return Result<AddOptions>::Ok(opts);
}
