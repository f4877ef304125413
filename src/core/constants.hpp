#pragma once

// ── State layout ────────────────────────────────────────────
// Shared with every other launcher for the same project; must not change.
constexpr const char* STATE_DIR_NAME     = ".pyre";
constexpr const char* START_LOCK_NAME    = "client.lock";
constexpr const char* SERVER_DIR_NAME    = "server";
constexpr const char* SERVER_LOCK_NAME   = "server.lock";

// ── Configuration files ─────────────────────────────────────
constexpr const char* GLOBAL_DIR_NAME       = ".pyrelaunch";
constexpr const char* GLOBAL_CONFIG_NAME    = "config.yaml";
constexpr const char* PROJECT_CONFIG_NAME   = ".pyrelaunch.yaml";
constexpr const char* DEBUG_LOG_NAME        = "pyrelaunch_debug.log";

// ── Server ──────────────────────────────────────────────────
constexpr const char* DEFAULT_SERVER_BINARY = "pyre.bin";
constexpr const char* START_COMMAND         = "start";

// ── Timeouts ────────────────────────────────────────────────
constexpr int LOCK_POLL_INTERVAL_MS      = 20;    // Poll period for bounded lock waits
constexpr int MAX_WAIT_TIMEOUT_SECS      = 7 * 24 * 60 * 60;  // Longest accepted bounded wait

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                    = 0;
constexpr int EXIT_FAILURE_CODE          = 1;
constexpr int EXIT_LOCK_CONTENTION       = 2;

constexpr const char* PYRELAUNCH_VERSION = "0.1.0";
