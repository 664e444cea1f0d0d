#pragma once

#include "fts/core/result.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <string>

namespace fts {

struct StoreConfig {
    std::string path = "field-time-sync.db";
    bool synchronous_full = true;     ///< fsync on every commit (survives power loss)
    int busy_timeout_ms = 5000;
};

struct SyncConfig {
    int max_retries = 3;                              ///< transient failures before an item is parked as Failed
    std::chrono::milliseconds backoff_unit{1000};     ///< delay = unit * 2^retryCount
    std::chrono::hours archive_retention{24 * 7};     ///< Synced -> Archived after this long
    bool drain_on_reconnect = true;
};

struct RemoteConfig {
    std::string host = "127.0.0.1";
    std::uint16_t port = 8080;
    std::string submit_path = "/api/v1/time-actions";
    int timeout_ms = 10000;
};

struct LoggingConfig {
    std::string level = "info";
    std::string pattern = "%Y-%m-%dT%H:%M:%S.%e%z [%^%l%$] %v";
};

struct EngineConfig {
    StoreConfig store;
    SyncConfig sync;
    RemoteConfig remote;
    LoggingConfig logging;
};

/**
 * @brief Build a config from a JSON document; absent keys keep their defaults
 *
 * {
 *   "store":   {"path": "...", "synchronous_full": true, "busy_timeout_ms": 5000},
 *   "sync":    {"max_retries": 3, "backoff_unit_ms": 1000, "archive_retention_hours": 168},
 *   "remote":  {"host": "...", "port": 8080, "submit_path": "...", "timeout_ms": 10000},
 *   "logging": {"level": "info", "pattern": "..."}
 * }
 */
Result<EngineConfig> config_from_json(const nlohmann::json& doc);

Result<EngineConfig> load_config(const std::string& path);

/**
 * @brief FTS_DB_PATH, FTS_REMOTE_HOST, FTS_REMOTE_PORT and FTS_LOG_LEVEL win over file values
 */
void apply_env_overrides(EngineConfig& config);

} // namespace fts
