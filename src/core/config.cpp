#include "fts/core/config.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <fstream>

namespace fts {
namespace {

using json = nlohmann::json;

template<typename T>
void read_key(const json& section, const char* key, T& target) {
    auto it = section.find(key);
    if (it != section.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

const json& section_or_empty(const json& doc, const char* name) {
    static const json empty = json::object();
    auto it = doc.find(name);
    return (it != doc.end() && it->is_object()) ? *it : empty;
}

} // namespace

Result<EngineConfig> config_from_json(const json& doc) {
    if (!doc.is_object()) {
        return Err<EngineConfig>(Error::invalid_argument("Config root must be a JSON object"));
    }

    EngineConfig config;
    try {
        const auto& store = section_or_empty(doc, "store");
        read_key(store, "path", config.store.path);
        read_key(store, "synchronous_full", config.store.synchronous_full);
        read_key(store, "busy_timeout_ms", config.store.busy_timeout_ms);

        const auto& sync = section_or_empty(doc, "sync");
        read_key(sync, "max_retries", config.sync.max_retries);
        read_key(sync, "drain_on_reconnect", config.sync.drain_on_reconnect);
        std::int64_t backoff_ms = config.sync.backoff_unit.count();
        read_key(sync, "backoff_unit_ms", backoff_ms);
        config.sync.backoff_unit = std::chrono::milliseconds(backoff_ms);
        std::int64_t retention_hours = config.sync.archive_retention.count();
        read_key(sync, "archive_retention_hours", retention_hours);
        config.sync.archive_retention = std::chrono::hours(retention_hours);

        const auto& remote = section_or_empty(doc, "remote");
        read_key(remote, "host", config.remote.host);
        read_key(remote, "port", config.remote.port);
        read_key(remote, "submit_path", config.remote.submit_path);
        read_key(remote, "timeout_ms", config.remote.timeout_ms);

        const auto& logging = section_or_empty(doc, "logging");
        read_key(logging, "level", config.logging.level);
        read_key(logging, "pattern", config.logging.pattern);
    } catch (const json::exception& e) {
        return Err<EngineConfig>(Error::invalid_argument(std::string("Invalid config value: ") + e.what()));
    }

    if (config.sync.max_retries < 0) {
        return Err<EngineConfig>(Error::invalid_argument("sync.max_retries must be >= 0"));
    }
    if (config.sync.backoff_unit.count() <= 0) {
        return Err<EngineConfig>(Error::invalid_argument("sync.backoff_unit_ms must be > 0"));
    }
    if (config.store.path.empty()) {
        return Err<EngineConfig>(Error::invalid_argument("store.path must not be empty"));
    }
    return Ok(config);
}

Result<EngineConfig> load_config(const std::string& path) {
    std::ifstream input(path);
    if (!input) {
        return Err<EngineConfig>(Error::io_failure("Cannot open config file: " + path));
    }

    json doc;
    try {
        input >> doc;
    } catch (const json::parse_error& e) {
        return Err<EngineConfig>(Error::invalid_argument("Config parse error in " + path + ": " + e.what()));
    }

    auto config = config_from_json(doc);
    if (config.is_ok()) {
        spdlog::debug("Loaded config from {}", path);
    }
    return config;
}

void apply_env_overrides(EngineConfig& config) {
    if (const char* db_path = std::getenv("FTS_DB_PATH")) {
        config.store.path = db_path;
    }
    if (const char* host = std::getenv("FTS_REMOTE_HOST")) {
        config.remote.host = host;
    }
    if (const char* port = std::getenv("FTS_REMOTE_PORT")) {
        char* end = nullptr;
        const long value = std::strtol(port, &end, 10);
        if (end != port && *end == '\0' && value > 0 && value <= 65535) {
            config.remote.port = static_cast<std::uint16_t>(value);
        } else {
            spdlog::warn("Ignoring invalid FTS_REMOTE_PORT '{}'", port);
        }
    }
    if (const char* level = std::getenv("FTS_LOG_LEVEL")) {
        config.logging.level = level;
    }
}

} // namespace fts
