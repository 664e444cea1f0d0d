#include "fts/model/codec.hpp"

namespace fts::model {
namespace {

using json = nlohmann::json;

Result<Timestamp> timestamp_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return Err<Timestamp>(Error::invalid_argument(std::string("Missing timestamp field '") + key + "'"));
    }
    return parse_iso8601(it->get<std::string>());
}

Result<std::optional<Timestamp>> optional_timestamp_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        return Ok(std::optional<Timestamp>{});
    }
    if (!it->is_string()) {
        return Err<std::optional<Timestamp>>(Error::invalid_argument(std::string("Field '") + key + "' must be a string"));
    }
    auto parsed = parse_iso8601(it->get<std::string>());
    if (parsed.is_error()) {
        return Err<std::optional<Timestamp>>(parsed.error());
    }
    return Ok(std::optional<Timestamp>{parsed.value()});
}

std::optional<std::string> optional_string_field(const json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

} // namespace

Result<std::string> dump_json(const json& doc) {
    try {
        return Ok(doc.dump());
    } catch (const json::type_error& e) {
        return Err<std::string>(Error::invalid_argument(std::string("Cannot encode JSON: ") + e.what()));
    }
}

json location_to_json(const LocationReading& location) {
    json j;
    j["latitude"] = location.latitude;
    j["longitude"] = location.longitude;
    j["accuracy_meters"] = location.accuracy_meters;
    j["in_zone"] = location.in_zone;
    return j;
}

Result<LocationReading> location_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<LocationReading>(Error::invalid_argument("Location must be an object"));
    }
    try {
        LocationReading location;
        location.latitude = j.at("latitude").get<double>();
        location.longitude = j.at("longitude").get<double>();
        location.accuracy_meters = j.value("accuracy_meters", 0.0);
        location.in_zone = j.value("in_zone", false);
        return Ok(location);
    } catch (const json::exception& e) {
        return Err<LocationReading>(Error::invalid_argument(std::string("Invalid location: ") + e.what()));
    }
}

json payload_to_json(const ActionPayload& payload) {
    json j;
    j["session_id"] = payload.session_id;
    j["employee_id"] = payload.employee_id;
    j["work_order_id"] = payload.work_order_id;
    j["rate_type"] = payload.rate_type;
    j["occurred_at"] = format_iso8601(payload.occurred_at);
    j["location"] = payload.location ? location_to_json(*payload.location) : json(nullptr);
    if (!payload.previous_rate_type.empty()) {
        j["previous_rate_type"] = payload.previous_rate_type;
    }
    return j;
}

Result<ActionPayload> payload_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<ActionPayload>(Error::invalid_argument("Payload must be an object"));
    }

    ActionPayload payload;
    try {
        payload.session_id = j.at("session_id").get<std::string>();
        payload.employee_id = j.value("employee_id", "");
        payload.work_order_id = j.value("work_order_id", "");
        payload.rate_type = j.value("rate_type", "");
        payload.previous_rate_type = j.value("previous_rate_type", "");
    } catch (const json::exception& e) {
        return Err<ActionPayload>(Error::invalid_argument(std::string("Invalid payload: ") + e.what()));
    }

    auto occurred = timestamp_field(j, "occurred_at");
    if (occurred.is_error()) {
        return Err<ActionPayload>(occurred.error());
    }
    payload.occurred_at = occurred.value();

    auto loc = j.find("location");
    if (loc != j.end() && !loc->is_null()) {
        auto location = location_from_json(*loc);
        if (location.is_error()) {
            return Err<ActionPayload>(location.error());
        }
        payload.location = location.value();
    }
    return Ok(payload);
}

json submission_to_json(const Submission& submission) {
    json j;
    j["operation"] = to_string(submission.operation);
    j["idempotency_key"] = submission.idempotency_key;
    j["payload"] = payload_to_json(submission.payload);
    return j;
}

Result<Submission> submission_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<Submission>(Error::invalid_argument("Submission must be an object"));
    }

    Submission submission;
    const auto op_name = optional_string_field(j, "operation");
    const auto op = op_name ? operation_from_string(*op_name) : std::nullopt;
    if (!op) {
        return Err<Submission>(Error::invalid_argument("Unknown or missing operation"));
    }
    submission.operation = *op;
    submission.idempotency_key = optional_string_field(j, "idempotency_key").value_or("");

    auto payload_it = j.find("payload");
    if (payload_it == j.end()) {
        return Err<Submission>(Error::invalid_argument("Missing payload"));
    }
    auto payload = payload_from_json(*payload_it);
    if (payload.is_error()) {
        return Err<Submission>(payload.error());
    }
    submission.payload = payload.value();
    return Ok(submission);
}

json authoritative_fields_to_json(const AuthoritativeSessionFields& fields) {
    json j;
    j["remote_id"] = fields.remote_id;
    if (fields.clock_in_time) {
        j["clock_in_time"] = format_iso8601(*fields.clock_in_time);
    }
    if (fields.clock_out_time) {
        j["clock_out_time"] = format_iso8601(*fields.clock_out_time);
    }
    if (fields.duration_seconds) {
        j["duration_seconds"] = *fields.duration_seconds;
    }
    if (fields.rate_type) {
        j["rate_type"] = *fields.rate_type;
    }
    if (fields.work_order_id) {
        j["work_order_id"] = *fields.work_order_id;
    }
    return j;
}

Result<AuthoritativeSessionFields> authoritative_fields_from_json(const json& j) {
    if (!j.is_object()) {
        return Err<AuthoritativeSessionFields>(Error::invalid_argument("Response must be an object"));
    }

    AuthoritativeSessionFields fields;
    auto remote_id = optional_string_field(j, "remote_id");
    if (!remote_id || remote_id->empty()) {
        return Err<AuthoritativeSessionFields>(Error::invalid_argument("Response is missing remote_id"));
    }
    fields.remote_id = *remote_id;

    auto clock_in = optional_timestamp_field(j, "clock_in_time");
    if (clock_in.is_error()) {
        return Err<AuthoritativeSessionFields>(clock_in.error());
    }
    fields.clock_in_time = clock_in.value();

    auto clock_out = optional_timestamp_field(j, "clock_out_time");
    if (clock_out.is_error()) {
        return Err<AuthoritativeSessionFields>(clock_out.error());
    }
    fields.clock_out_time = clock_out.value();

    auto duration = j.find("duration_seconds");
    if (duration != j.end() && duration->is_number_integer()) {
        fields.duration_seconds = duration->get<std::int64_t>();
    }
    fields.rate_type = optional_string_field(j, "rate_type");
    fields.work_order_id = optional_string_field(j, "work_order_id");
    return Ok(fields);
}

} // namespace fts::model
