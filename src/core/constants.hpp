#pragma once

#include <cstddef>

// ── Timeouts ────────────────────────────────────────────────
constexpr int DIAL_TIMEOUT_SECS          = 10;    // TCP connect + SSH handshake limit
constexpr int IDLE_TIMEOUT_SECS          = 300;   // Pooled connection idle threshold
constexpr int SWEEP_INTERVAL_SECS        = 60;    // Idle sweeper period
constexpr int KEEPALIVE_INTERVAL_SECS    = 30;    // SSH keepalive period
constexpr int STOP_GRACE_MS              = 2000;  // Wait after SIGINT before force close
constexpr int CHANNEL_OPEN_TIMEOUT_SECS  = 30;    // Max wait for a sub-channel open
constexpr int EXIT_STATUS_TIMEOUT_SECS   = 30;    // Max wait for exit status after EOF
constexpr int SFTP_IO_TIMEOUT_SECS       = 60;    // Max wait for one SFTP request
constexpr int EVENT_STALL_WARN_MS        = 500;   // Log producers waiting on a full event queue

// ── Poll intervals ──────────────────────────────────────────
constexpr int READ_POLL_MS               = 100;   // Reader wake-up to check cancellation
constexpr int ACCEPT_POLL_MS             = 200;   // Accept loop wake-up to check stop flag
constexpr int EAGAIN_BACKOFF_MS          = 5;     // Sleep between libssh2 EAGAIN retries

// ── Buffer sizes ────────────────────────────────────────────
constexpr int SSH_READ_BUF_SIZE          = 4096;
constexpr int FORWARD_BUF_SIZE           = 16384;
constexpr size_t TRANSFER_CHUNK_SIZE     = 1024 * 1024;  // 1 MiB
constexpr size_t EVENT_QUEUE_CAPACITY    = 1024;

// ── History ─────────────────────────────────────────────────
constexpr size_t MAX_HISTORY_SIZE        = 100;

// ── Channel read results (besides byte counts) ──────────────
constexpr long CHANNEL_EOF               = 0;
constexpr long CHANNEL_ERROR             = -1;
constexpr long CHANNEL_TIMEOUT           = -2;    // no data before the deadline
