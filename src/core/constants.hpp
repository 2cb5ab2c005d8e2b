#pragma once

#include <cstdint>

// ── Timeouts ────────────────────────────────────────────────
constexpr int SSH_CONNECT_TIMEOUT_SECS   = 30;    // TCP connect + handshake, default
constexpr int REMOTE_CMD_TIMEOUT_SECS    = 120;   // mkdir/stat/sha256sum/mv on the remote
constexpr int SSH_KEEPALIVE_SECS         = 30;    // libssh2 keepalive interval
constexpr int CANCEL_POLL_MS             = 50;    // max latency of a cancellation check
constexpr int ACQUIRE_WAIT_SLICE_MS      = 50;    // condition-variable wait slice in acquire
constexpr int CLEANUP_TIMEOUT_SECS       = 15;    // removing a leftover staging file

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SCP_CHUNK_SIZE             = 64 * 1024;
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int HASH_READ_BUF_SIZE         = 64 * 1024;

// ── Transfer layout ─────────────────────────────────────────
constexpr const char* STAGING_SUFFIX     = ".partial";
constexpr int REMOTE_FILE_MODE           = 0644;

// ── Defaults ────────────────────────────────────────────────
constexpr const char* DEFAULT_HOST_ID    = "default";
constexpr const char* PLEXMOVER_VERSION  = "0.4.0";
constexpr int64_t PROGRESS_REPORT_BYTES  = 64LL * 1024 * 1024;  // status line every 64 MiB
