#pragma once

// ── Remote shell ────────────────────────────────────────────
// Invocation: <ssh> -nqo BatchMode=yes <target> <command>
constexpr const char* DEFAULT_SSH_BIN = "/usr/bin/ssh";
constexpr const char* SSH_BATCH_FLAGS = "-nqo";
constexpr const char* SSH_BATCH_MODE  = "BatchMode=yes";
constexpr const char* SSH_VERSION_FLAG = "-V";

// ── Supervisor ──────────────────────────────────────────────
constexpr int POLL_INTERVAL_MS           = 50;    // Max sleep between Run Set scans
constexpr int DEFAULT_MAX_PROCS          = 1;
constexpr int DEFAULT_EXPECTED_EXIT_CODE = 0;
constexpr int EXEC_FAILED_EXIT_CODE      = 127;   // Child exit code when exec fails

// ── Config files ────────────────────────────────────────────
constexpr const char* GLOBAL_CONFIG_DIR  = ".sshbatch";
constexpr const char* CONFIG_FILE_NAME   = "config.yaml";
constexpr const char* PROJECT_CONFIG_NAME = "sshbatch.yaml";

// ── Display ─────────────────────────────────────────────────
constexpr int OUTPUT_PREVIEW_LINES = 20;   // Lines of output shown per target
constexpr const char* SSHBATCH_VERSION = "0.1.0";
