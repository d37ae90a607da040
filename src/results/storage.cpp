#include "storage.hpp"
#include "reporter.hpp"
#include <core/constants.hpp>
#include <core/log.hpp>
#include <core/time_utils.hpp>
#include <core/utils.hpp>
#include <fmt/format.h>
#include <algorithm>
#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

static Result<void> write_text(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        return Result<void>::Err("cannot write " + path.string());
    }
    out << content;
    out.close();
    if (!out) {
        return Result<void>::Err("write failed for " + path.string());
    }
    return Result<void>::Ok();
}

static Result<void> ensure_dir(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot create {}: {}", dir.string(), ec.message()));
    }
    return Result<void>::Ok();
}

// Reports are keyed by the run's start so all files of one run pair up
static TimePoint key_time(const ExecutionSummary& summary) {
    return summary.start_time == TimePoint{} ? Clock::now() : summary.start_time;
}

Storage::Storage(fs::path output_dir) : output_dir_(std::move(output_dir)) {}

std::string Storage::run_key(TimePoint t, const std::string& session_id) {
    return fmt::format("{}_{}", format_file_stamp(t),
                       sanitize_filename(session_id.substr(0, SESSION_PREFIX_LEN)));
}

fs::path Storage::resolve(const fs::path& file) const {
    if (file.is_absolute() || file.has_parent_path()) return file;
    return output_dir_ / file;
}

Result<std::string> Storage::save_summary(const ExecutionSummary& summary,
                                          const std::string& session_id) const {
    auto dir = ensure_dir(output_dir_);
    if (dir.is_err()) return Result<std::string>::Err(dir.error);

    std::string prefix = (output_dir_ / (RESULTS_FILE_PREFIX + run_key(key_time(summary), session_id))).string();

    const std::pair<std::string, ReportFormat> files[] = {
        {prefix + ".json", ReportFormat::Json},
        {prefix + ".txt", ReportFormat::Console},
        {prefix + "_detailed.txt", ReportFormat::Detailed},
        {prefix + ".csv", ReportFormat::Csv},
    };
    // Every format is attempted; the first failure is reported
    std::string first_error;
    for (const auto& [path, format] : files) {
        Result<void> w = Result<void>::Ok();
        try {
            w = write_text(path, render(format, summary));
        } catch (const std::exception& e) {
            w = Result<void>::Err(fmt::format("cannot render {}: {}", path, e.what()));
        }
        if (w.is_err()) {
            par_log("STORAGE: " + w.error);
            if (first_error.empty()) first_error = w.error;
        }
    }
    if (!first_error.empty()) return Result<std::string>::Err(first_error);

    par_log("STORAGE: saved summary " + prefix);
    return Result<std::string>::Ok(prefix);
}

Result<fs::path> Storage::save_transcripts(const ExecutionSummary& summary,
                                           const std::string& session_id) const {
    fs::path dir = output_dir_ / (OUTPUTS_DIR_PREFIX + run_key(key_time(summary), session_id));
    auto made = ensure_dir(dir);
    if (made.is_err()) return Result<fs::path>::Err(made.error);

    std::set<std::string> used;
    for (const auto& r : summary.results) {
        std::string base = sanitize_filename(r.worktree);
        std::string name = base;
        for (int n = 2; !used.insert(name).second; ++n) {
            name = fmt::format("{}_{}", base, n);
        }

        std::string content;
        content += fmt::format("Job ID: {}\n", r.job_id);
        content += fmt::format("Worktree: {} ({})\n", r.worktree, r.worktree_path);
        content += fmt::format("Status: {}\n", to_string(r.status));
        content += fmt::format("Exit Code: {}\n", r.exit_code);
        content += fmt::format("Duration: {}\n", format_duration(r.duration));
        content += fmt::format("Start Time: {}\n", format_iso(r.start_time));
        content += fmt::format("End Time: {}\n", format_iso(r.end_time));
        if (!r.error_message.empty()) {
            content += fmt::format("Error: {}\n", r.error_message);
        }
        content += std::string(50, '=') + "\n\n";
        content += r.output;

        auto w = write_text(dir / (name + ".txt"), content);
        if (w.is_err()) return Result<fs::path>::Err(w.error);
    }
    return Result<fs::path>::Ok(dir);
}

Result<std::vector<fs::path>> Storage::list_summaries() const {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(output_dir_, ec)) {
        return Result<std::vector<fs::path>>::Ok(files);
    }

    fs::directory_iterator it(output_dir_, ec);
    if (ec) {
        return Result<std::vector<fs::path>>::Err(
            fmt::format("cannot list {}: {}", output_dir_.string(), ec.message()));
    }
    for (const auto& entry : it) {
        std::string name = entry.path().filename().string();
        if (starts_with(name, RESULTS_FILE_PREFIX) && entry.path().extension() == ".json") {
            files.push_back(entry.path());
        }
    }

    // The file stamp sorts chronologically
    std::sort(files.begin(), files.end(), [](const fs::path& a, const fs::path& b) {
        return a.filename().string() > b.filename().string();
    });
    return Result<std::vector<fs::path>>::Ok(files);
}

Result<ExecutionSummary> Storage::load_summary(const fs::path& file) const {
    fs::path path = resolve(file);
    std::string text;
    if (!read_file(path, text)) {
        return Result<ExecutionSummary>::Err("cannot read " + path.string());
    }
    auto parsed = parse_summary_json(text);
    if (parsed.is_err()) {
        return Result<ExecutionSummary>::Err(path.string() + ": " + parsed.error);
    }
    return parsed;
}

Result<void> Storage::delete_run(const fs::path& summary_file) const {
    fs::path path = resolve(summary_file);
    std::string name = path.filename().string();
    if (!starts_with(name, RESULTS_FILE_PREFIX) || path.extension() != ".json") {
        return Result<void>::Err("not a summary file: " + name);
    }

    std::string key = path.stem().string().substr(std::string(RESULTS_FILE_PREFIX).size());
    fs::path dir = path.parent_path();
    std::string prefix = RESULTS_FILE_PREFIX + key;

    std::error_code ec;
    for (const auto& suffix : {".json", ".txt", "_detailed.txt", ".csv"}) {
        fs::remove(dir / (prefix + suffix), ec);
        if (ec) {
            return Result<void>::Err(fmt::format("cannot remove {}{}: {}", prefix, suffix, ec.message()));
        }
    }
    fs::remove_all(dir / (OUTPUTS_DIR_PREFIX + key), ec);
    if (ec) {
        return Result<void>::Err(fmt::format("cannot remove transcripts for {}: {}", key, ec.message()));
    }
    par_log("STORAGE: deleted run " + key);
    return Result<void>::Ok();
}

Result<int> Storage::clean_old_results(Millis max_age) const {
    std::error_code ec;
    if (!fs::is_directory(output_dir_, ec)) {
        return Result<int>::Ok(0);
    }

    auto now = fs::file_time_type::clock::now();

    std::vector<fs::path> stale;
    fs::directory_iterator it(output_dir_, ec);
    if (ec) {
        return Result<int>::Err(fmt::format("cannot list {}: {}", output_dir_.string(), ec.message()));
    }
    for (const auto& entry : it) {
        std::error_code tec;
        auto mtime = entry.last_write_time(tec);
        if (tec) continue;
        // Compare in milliseconds; large ages would overflow the file clock's unit
        if (mtime < now && std::chrono::duration_cast<Millis>(now - mtime) > max_age) {
            stale.push_back(entry.path());
        }
    }

    int removed = 0;
    for (const auto& p : stale) {
        fs::remove_all(p, ec);
        if (ec) {
            return Result<int>::Err(fmt::format("cannot remove {}: {}", p.string(), ec.message()));
        }
        removed++;
    }
    par_log(fmt::format("STORAGE: cleaned {} entries older than {}", removed, format_duration(max_age)));
    return Result<int>::Ok(removed);
}

Result<int> Storage::clean_failed_runs() const {
    auto files = list_summaries();
    if (files.is_err()) return Result<int>::Err(files.error);

    int removed = 0;
    for (const auto& file : files.value) {
        auto summary = load_summary(file);
        if (summary.is_err()) {
            par_log("STORAGE: skipping unreadable summary: " + summary.error);
            continue;
        }
        if (!summary.value.has_failures()) continue;

        auto del = delete_run(file);
        if (del.is_err()) return Result<int>::Err(del.error);
        removed++;
    }
    return Result<int>::Ok(removed);
}
