#include "fts/core/logging.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>

namespace fts {
namespace {

constexpr const char* kLoggerName = "field-time-sync";

std::string resolve_level(const LoggingConfig& config) {
    if (const char* level = std::getenv("FTS_LOG_LEVEL")) {
        return level;
    }
    return config.level.empty() ? std::string("info") : config.level;
}

std::string resolve_pattern(const LoggingConfig& config) {
    if (const char* pattern = std::getenv("FTS_LOG_PATTERN")) {
        return pattern;
    }
    return config.pattern;
}

} // namespace

void init_logging(const LoggingConfig& config) {
    auto logger = spdlog::get(kLoggerName);
    if (!logger) {
        logger = spdlog::stdout_color_mt(kLoggerName);
    }
    logger->set_pattern(resolve_pattern(config));
    logger->set_level(spdlog::level::from_str(resolve_level(config)));
    spdlog::set_default_logger(logger);
    spdlog::flush_on(spdlog::level::warn);
}

void shutdown_logging() {
    spdlog::shutdown();
}

} // namespace fts
