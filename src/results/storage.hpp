#pragma once

#include <string>
#include <vector>
#include <filesystem>
#include <core/types.hpp>
#include "summary.hpp"

namespace fs = std::filesystem;

// Report files for one run share a "<YYYYmmdd_HHMMSS>_<session8>" key:
//   par_results_<key>.json, .txt, _detailed.txt, .csv
//   outputs_<key>/<worktree>.txt   (optional transcripts)
class Storage {
public:
    explicit Storage(fs::path output_dir);

    // Writes the four report files; returns the path prefix they share.
    Result<std::string> save_summary(const ExecutionSummary& summary,
                                     const std::string& session_id) const;

    // One transcript per job; returns the directory written.
    Result<fs::path> save_transcripts(const ExecutionSummary& summary,
                                      const std::string& session_id) const;

    // JSON summaries, newest first
    Result<std::vector<fs::path>> list_summaries() const;

    Result<ExecutionSummary> load_summary(const fs::path& file) const;

    // Removes every file of the run the summary belongs to
    Result<void> delete_run(const fs::path& summary_file) const;

    // Removes top-level entries not modified within `max_age`; returns the count
    Result<int> clean_old_results(Millis max_age) const;

    // Deletes runs whose summary records any non-successful job
    Result<int> clean_failed_runs() const;

    const fs::path& output_dir() const { return output_dir_; }

    // "<YYYYmmdd_HHMMSS>_<first 8 chars of session>"
    static std::string run_key(TimePoint t, const std::string& session_id);

private:
    fs::path output_dir_;

    fs::path resolve(const fs::path& file) const;
};
