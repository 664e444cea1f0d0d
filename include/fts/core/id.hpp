#pragma once

#include <string>

namespace fts {

/**
 * @brief Random RFC 4122 version-4 identifier in canonical text form
 *
 * Used for QueueItem ids (which double as idempotency keys) and for
 * ClockSession local ids. Stable across restarts because it is persisted.
 */
std::string generate_id();

} // namespace fts
