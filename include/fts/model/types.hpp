#pragma once

#include "fts/core/time.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace fts::model {

enum class OperationType {
    CreateClockIn,
    CreateClockOut,
    UpdateRate
};

enum class QueueStatus {
    Pending,
    InFlight,
    Failed
};

/**
 * @brief Per-session lifecycle
 *
 * Idle -> Pending -> Active -> PendingClockOut -> Synced -> Archived, with
 * RolledBack reachable from Pending and PendingClockOut. Pending and
 * PendingClockOut are local-optimistic: the server has not confirmed them yet.
 */
enum class LifecycleState {
    Idle,
    Pending,
    Active,
    PendingClockOut,
    Synced,
    Archived,
    RolledBack
};

/**
 * @brief Precomputed location reading; in_zone is advisory and never blocks
 */
struct LocationReading {
    double latitude = 0.0;
    double longitude = 0.0;
    double accuracy_meters = 0.0;
    bool in_zone = false;

    bool operator==(const LocationReading& other) const {
        return latitude == other.latitude && longitude == other.longitude &&
               accuracy_meters == other.accuracy_meters && in_zone == other.in_zone;
    }
};

/**
 * @brief Immutable snapshot needed to replay one operation against the server
 */
struct ActionPayload {
    std::string session_id;                    ///< ClockSession local id
    std::string employee_id;
    std::string work_order_id;
    std::string rate_type;                     ///< Rate in effect (new rate for UpdateRate)
    Timestamp occurred_at{};                   ///< Clock-in / clock-out / rate-change time on device
    std::optional<LocationReading> location;
    std::string previous_rate_type;            ///< UpdateRate only: restored on rejection
};

struct QueueItem {
    std::string id;                            ///< Also the idempotency key sent to the server
    OperationType operation = OperationType::CreateClockIn;
    ActionPayload payload;                     ///< Write-once
    QueueStatus status = QueueStatus::Pending;
    int retry_count = 0;
    std::optional<std::string> last_error;     ///< Set only while status == Failed
    Timestamp created_at{};
    std::int64_t sequence = 0;                 ///< Enqueue order, write-once (causal order key)
    std::int64_t drain_position = 0;           ///< Drain order; manual retry moves it to the tail
};

/**
 * @brief Local authoritative view of one work period
 */
struct ClockSession {
    std::string local_id;
    std::optional<std::string> remote_id;      ///< Set once the server accepted the clock-in
    std::string employee_id;
    std::string work_order_id;
    std::string rate_type;
    Timestamp clock_in_time{};
    std::optional<Timestamp> clock_out_time;
    std::optional<LocationReading> clock_in_location;
    std::optional<LocationReading> clock_out_location;
    std::optional<std::int64_t> duration_seconds;   ///< Server-computed, present after clock-out sync
    LifecycleState state = LifecycleState::Idle;

    // Local-only fields; the server never sees or overwrites these.
    std::optional<std::string> last_error;     ///< Error banner text
    std::uint32_t ui_flags = 0;

    bool operator==(const ClockSession& other) const;
    bool operator!=(const ClockSession& other) const { return !(*this == other); }
};

/**
 * @brief Fields the remote authority returns when it accepts a submission
 *
 * Absent optionals mean "server has no opinion"; present values always win.
 */
struct AuthoritativeSessionFields {
    std::string remote_id;
    std::optional<Timestamp> clock_in_time;
    std::optional<Timestamp> clock_out_time;
    std::optional<std::int64_t> duration_seconds;
    std::optional<std::string> rate_type;
    std::optional<std::string> work_order_id;
};

/**
 * @brief Process-wide progress marker for "last synced" display
 */
struct SyncCursor {
    std::optional<Timestamp> last_synced_item_at;   ///< created_at of the last acknowledged item
    std::optional<Timestamp> last_attempt_at;
};

const char* to_string(OperationType type);
const char* to_string(QueueStatus status);
const char* to_string(LifecycleState state);

std::optional<OperationType> operation_from_string(const std::string& text);

/**
 * @brief Pending, Active or PendingClockOut: the employee is (optimistically) clocked in
 */
bool is_open(LifecycleState state) noexcept;

} // namespace fts::model
