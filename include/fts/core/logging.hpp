#pragma once

#include "fts/core/config.hpp"

namespace fts {

/**
 * @brief Install the process-wide spdlog logger
 *
 * FTS_LOG_LEVEL / FTS_LOG_PATTERN in the environment take precedence over
 * the config. Warnings and errors are flushed immediately so a crash right
 * after a failed transaction still leaves the message on disk/console.
 */
void init_logging(const LoggingConfig& config);

void shutdown_logging();

} // namespace fts
