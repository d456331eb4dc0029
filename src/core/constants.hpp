#pragma once

#include <cstddef>

// ── Poll backoff ────────────────────────────────────────────
constexpr int POLL_INITIAL_DELAY_MS      = 2000;   // First sleep before a status check
constexpr double POLL_DELAY_GROWTH       = 1.2;    // Multiplier applied after each check
constexpr int POLL_MAX_DELAY_MS          = 60000;  // Backoff cap
constexpr int POLL_UNKNOWN_PAUSE_MS      = 5000;   // Extra pause when qstat gives no answer
constexpr int POLL_TIMEOUT_SECS          = 0;      // Client-side attempt timeout (0 = none)

// ── Retry / cleanup ─────────────────────────────────────────
constexpr int DEFAULT_MAX_ATTEMPTS       = 3;
constexpr int CLEANUP_RETRY_DELAY_MS     = 5000;   // Wait before the second rmtree attempt

// ── Default resource values ─────────────────────────────────
constexpr const char* DEFAULT_PARALLEL_ENV = "parallel";
constexpr int DEFAULT_THREADS            = 1;
constexpr const char* DEFAULT_JOB_TIME   = "00:59:00";
constexpr const char* DEFAULT_MEMORY     = "6G";
constexpr const char* DEFAULT_CONDA_ENV  = "snakemake";
constexpr const char* DEFAULT_CONDA_PATH = "/opt/miniconda3/bin";

// ── Scheduler commands ──────────────────────────────────────
constexpr const char* SGE_SUBMIT_CMD     = "qsub";
constexpr const char* SGE_STATUS_CMD     = "qstat";
constexpr const char* SGE_ACCOUNTING_CMD = "qacct";
constexpr const char* SGE_DELETE_CMD     = "qdel";

// ── Workspace file names ────────────────────────────────────
constexpr const char* PARAMS_FILE        = "job_params.yaml";
constexpr const char* EXEC_SCRIPT_FILE   = "script_exec.sh";
constexpr const char* SUBMIT_SCRIPT_FILE = "script.sh";
constexpr const char* RESULTS_FILE       = "results.yaml";
constexpr const char* STDOUT_FILE        = "stdout.txt";
constexpr const char* STDERR_FILE        = "stderr.txt";

// ── Logging ─────────────────────────────────────────────────
constexpr std::size_t LOG_OUTPUT_TRUNCATE = 500;   // Bytes of command output kept in the debug log
