#pragma once

#include <cstdint>

// ── Connection ──────────────────────────────────────────────
constexpr int DEFAULT_SSH_PORT          = 22;
constexpr int CONNECT_TIMEOUT_SECS      = 30;    // Dial + handshake + auth budget per host
constexpr int SOCKET_WAIT_MS            = 1000;  // Poll slice while libssh2 returns EAGAIN

// ── Transfer ────────────────────────────────────────────────
constexpr int COPY_BUF_SIZE             = 1024;  // Fixed intermediate buffer per task
constexpr int64_t DEFAULT_MAX_TRANSFER_SIZE = 1099511627776LL;  // 1 TiB
constexpr int LOCAL_DIR_MODE            = 0755;
constexpr int LOCAL_FILE_MODE           = 0755;
constexpr int REMOTE_FILE_MODE          = 0644;

// ── Host key policy names (config values) ───────────────────
constexpr const char* HOST_KEY_POLICY_INSECURE = "insecure-accept-any";

// ── Result formatting ───────────────────────────────────────
constexpr int RESULT_HOST_WIDTH         = 21;
