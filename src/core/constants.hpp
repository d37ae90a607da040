#pragma once

#include <cstdint>

constexpr const char* PAR_VERSION = "0.4.0";

// ── Defaults ────────────────────────────────────────────────
constexpr int DEFAULT_JOBS                 = 3;
constexpr const char* DEFAULT_TIMEOUT      = "60m";
constexpr const char* DEFAULT_OUTPUT_DIR   = "~/.local/share/par/results";
constexpr const char* DEFAULT_PROMPTS_DIR  = "~/.local/share/par/prompts";
constexpr const char* DEFAULT_AGENT_BINARY = "claude";
constexpr const char* DEFAULT_PRINT_FLAG   = "--print";

// ── Timeouts ────────────────────────────────────────────────
constexpr int PREFLIGHT_TIMEOUT_MS   = 10000;  // agent --version probe
constexpr int KILL_GRACE_MS          = 2000;   // SIGTERM -> SIGKILL window
constexpr int PROCESS_POLL_MS        = 50;     // child output / deadline poll
constexpr int GIT_STATUS_TIMEOUT_MS  = 15000;  // git status --porcelain

// ── Validation ──────────────────────────────────────────────
constexpr std::uintmax_t LOW_DISK_THRESHOLD_BYTES = 1024ULL * 1024 * 1024;  // 1 GiB

// ── Reporting ───────────────────────────────────────────────
constexpr int REPORT_ERROR_WIDTH     = 60;     // error column in detailed table
constexpr int SESSION_PREFIX_LEN     = 8;      // chars of session id in file names
constexpr const char* RESULTS_FILE_PREFIX = "par_results_";
constexpr const char* OUTPUTS_DIR_PREFIX  = "outputs_";
