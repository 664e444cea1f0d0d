#include "fts/model/types.hpp"

namespace fts::model {

bool ClockSession::operator==(const ClockSession& other) const {
    return local_id == other.local_id &&
           remote_id == other.remote_id &&
           employee_id == other.employee_id &&
           work_order_id == other.work_order_id &&
           rate_type == other.rate_type &&
           clock_in_time == other.clock_in_time &&
           clock_out_time == other.clock_out_time &&
           clock_in_location == other.clock_in_location &&
           clock_out_location == other.clock_out_location &&
           duration_seconds == other.duration_seconds &&
           state == other.state &&
           last_error == other.last_error &&
           ui_flags == other.ui_flags;
}

const char* to_string(OperationType type) {
    switch (type) {
        case OperationType::CreateClockIn: return "CreateClockIn";
        case OperationType::CreateClockOut: return "CreateClockOut";
        case OperationType::UpdateRate: return "UpdateRate";
    }
    return "Unknown";
}

const char* to_string(QueueStatus status) {
    switch (status) {
        case QueueStatus::Pending: return "Pending";
        case QueueStatus::InFlight: return "InFlight";
        case QueueStatus::Failed: return "Failed";
    }
    return "Unknown";
}

const char* to_string(LifecycleState state) {
    switch (state) {
        case LifecycleState::Idle: return "Idle";
        case LifecycleState::Pending: return "Pending";
        case LifecycleState::Active: return "Active";
        case LifecycleState::PendingClockOut: return "PendingClockOut";
        case LifecycleState::Synced: return "Synced";
        case LifecycleState::Archived: return "Archived";
        case LifecycleState::RolledBack: return "RolledBack";
    }
    return "Unknown";
}

std::optional<OperationType> operation_from_string(const std::string& text) {
    if (text == "CreateClockIn") return OperationType::CreateClockIn;
    if (text == "CreateClockOut") return OperationType::CreateClockOut;
    if (text == "UpdateRate") return OperationType::UpdateRate;
    return std::nullopt;
}

bool is_open(LifecycleState state) noexcept {
    return state == LifecycleState::Pending ||
           state == LifecycleState::Active ||
           state == LifecycleState::PendingClockOut;
}

} // namespace fts::model
