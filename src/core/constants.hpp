#pragma once

// ── Version ─────────────────────────────────────────────────
constexpr const char* WCSTORE_VERSION = "0.4.0";

// ── Default on-disk names ───────────────────────────────────
// Overridable through the store: section of ~/.wcstore/config.yaml
constexpr const char* DEFAULT_STORE_DIR   = ".store";
constexpr const char* DEFAULT_DATA_DIR    = "data";
constexpr const char* DEFAULT_LOCK_FILE   = "wc.lock";

// ── Config locations ────────────────────────────────────────
constexpr const char* CONFIG_DIR_NAME     = ".wcstore";
constexpr const char* CONFIG_FILE_NAME    = "config.yaml";
constexpr const char* DEBUG_LOG_NAME      = "wcstore_debug.log";

// ── Atomic writes ───────────────────────────────────────────
constexpr int RENAME_MAX_RETRIES          = 3;     // on EBUSY / EINTR
constexpr int RENAME_RETRY_DELAY_MS       = 20;
