#pragma once

#include "fts/core/result.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace fts {

using SystemClock = std::chrono::system_clock;
using Timestamp = SystemClock::time_point;

std::int64_t to_unix_millis(Timestamp tp);
Timestamp from_unix_millis(std::int64_t millis);

/**
 * @brief Format as UTC ISO-8601, e.g. "2024-05-02T09:00:03Z"
 *
 * Milliseconds are appended only when non-zero ("...T09:00:03.250Z").
 */
std::string format_iso8601(Timestamp tp);

/**
 * @brief Parse "YYYY-MM-DDTHH:MM:SS[.fff]Z"
 *
 * Only the UTC designator is accepted; the remote authority always answers in UTC.
 */
Result<Timestamp> parse_iso8601(const std::string& text);

} // namespace fts
