#pragma once

#include "fts/core/result.hpp"
#include "fts/model/types.hpp"

#include <nlohmann/json.hpp>

#include <string>

namespace fts::model {

/**
 * @brief JSON encoding shared by the store (payload/location columns) and the
 * HTTP wire format. Timestamps travel as UTC ISO-8601 strings.
 */

struct Submission {
    OperationType operation = OperationType::CreateClockIn;
    ActionPayload payload;
    std::string idempotency_key;
};

/**
 * @brief Serialize a document; strings that are not valid UTF-8 give InvalidArgument
 */
Result<std::string> dump_json(const nlohmann::json& doc);

nlohmann::json location_to_json(const LocationReading& location);
Result<LocationReading> location_from_json(const nlohmann::json& j);

nlohmann::json payload_to_json(const ActionPayload& payload);
Result<ActionPayload> payload_from_json(const nlohmann::json& j);

nlohmann::json submission_to_json(const Submission& submission);
Result<Submission> submission_from_json(const nlohmann::json& j);

nlohmann::json authoritative_fields_to_json(const AuthoritativeSessionFields& fields);
Result<AuthoritativeSessionFields> authoritative_fields_from_json(const nlohmann::json& j);

} // namespace fts::model
