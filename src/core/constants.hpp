#pragma once

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake budget
constexpr int SSH_CMD_TIMEOUT_SECS       = 300;   // Max time for a single remote command
constexpr int SSH_PROBE_TIMEOUT_SECS     = 20;    // Remote environment probe during init
constexpr int SSH_POLL_INTERVAL_MS       = 10;    // Sleep between EAGAIN retries
constexpr int SSH_KEEPALIVE_SECS         = 30;

// ── Pool defaults ───────────────────────────────────────────
constexpr int DEFAULT_CHANNEL_CAPACITY   = 5;     // consumers per channel
constexpr int DEFAULT_SSH_PORT           = 22;
constexpr int DEFAULT_TRIALS_PER_GPU     = 1;

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;

// ── Remote path templates ───────────────────────────────────
// fmt::format(REMOTE_CHANNEL_DIR, username, channel_id)
constexpr const char* REMOTE_CHANNEL_DIR   = "/tmp/shellpool-{}/ch-{}";

// ── Files ───────────────────────────────────────────────────
constexpr const char* CONFIG_FILE_NAME     = "shellpool.yaml";
constexpr const char* DEBUG_LOG_FILE_NAME  = "shellpool_debug.log";
