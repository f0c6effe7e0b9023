#pragma once

// ── SSH client ──────────────────────────────────────────────
// Resolved through PATH by the launcher.
constexpr const char* SSH_PROGRAM        = "ssh";
constexpr int DEFAULT_SSH_PORT           = 22;

// ── Config file ─────────────────────────────────────────────
constexpr const char* CONFIG_FILE_NAME   = ".remote-cli-runner.ini";
constexpr const char* CONFIG_SECTION     = "remote";
constexpr const char* CONFIG_DEFAULTS    = "DEFAULT";   // inherited by every section

// ── Resolver ────────────────────────────────────────────────
constexpr const char* UNKNOWN_ADDRESS    = "unknown";

// ── Exit codes ──────────────────────────────────────────────
constexpr int EXIT_OK                    = 0;
constexpr int EXIT_FAILURE_CODE          = 1;
constexpr int EXIT_INTERRUPTED           = 130;   // 128 + SIGINT

// ── Timeouts ────────────────────────────────────────────────
constexpr int INTERRUPT_GRACE_MS         = 250;   // Child exit window after Ctrl-C
