#include "fts/model/codec.hpp"

#include <gtest/gtest.h>

using fts::ErrorCode;
using fts::from_unix_millis;
using namespace fts::model;
using json = nlohmann::json;

TEST(CodecTest, SubmissionCarriesOperationKeyAndPayload) {
    Submission submission;
    submission.operation = OperationType::CreateClockOut;
    submission.idempotency_key = "item-1";
    submission.payload.session_id = "s-1";
    submission.payload.employee_id = "E7";
    submission.payload.occurred_at = from_unix_millis(1714640403000);
    submission.payload.location = LocationReading{47.5, -122.3, 8.0, true};

    json j = submission_to_json(submission);
    EXPECT_EQ(j["operation"], "CreateClockOut");
    EXPECT_EQ(j["idempotency_key"], "item-1");
    EXPECT_EQ(j["payload"]["occurred_at"], "2024-05-02T09:00:03Z");
    EXPECT_FALSE(j["payload"].contains("previous_rate_type"));

    auto decoded = submission_from_json(j);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().operation, OperationType::CreateClockOut);
    EXPECT_EQ(decoded.value().payload.session_id, "s-1");
    ASSERT_TRUE(decoded.value().payload.location.has_value());
    EXPECT_EQ(*decoded.value().payload.location, *submission.payload.location);
}

TEST(CodecTest, NullLocationDecodesAsAbsent) {
    json j = {{"session_id", "s-1"}, {"occurred_at", "2024-05-02T09:00:03Z"}, {"location", nullptr}};
    auto payload = payload_from_json(j);
    ASSERT_TRUE(payload.is_ok());
    EXPECT_FALSE(payload.value().location.has_value());
}

TEST(CodecTest, UnknownOperationIsRejected) {
    json j = {{"operation", "DeleteEverything"},
              {"payload", {{"session_id", "s-1"}, {"occurred_at", "2024-05-02T09:00:03Z"}}}};
    auto decoded = submission_from_json(j);
    ASSERT_TRUE(decoded.is_error());
    EXPECT_EQ(decoded.error().code, ErrorCode::InvalidArgument);
}

TEST(CodecTest, PayloadWithoutTimestampIsRejected) {
    EXPECT_TRUE(payload_from_json(json{{"session_id", "s-1"}}).is_error());
}

TEST(CodecTest, AuthoritativeFieldsRequireRemoteId) {
    EXPECT_TRUE(authoritative_fields_from_json(json{{"clock_in_time", "2024-05-02T09:00:03Z"}}).is_error());
    EXPECT_TRUE(authoritative_fields_from_json(json{{"remote_id", ""}}).is_error());
}

TEST(CodecTest, AuthoritativeFieldsKeepAbsentFieldsAbsent) {
    auto fields = authoritative_fields_from_json(json{{"remote_id", "R1"}, {"duration_seconds", 28800}});
    ASSERT_TRUE(fields.is_ok());
    EXPECT_EQ(fields.value().remote_id, "R1");
    ASSERT_TRUE(fields.value().duration_seconds.has_value());
    EXPECT_EQ(*fields.value().duration_seconds, 28800);
    EXPECT_FALSE(fields.value().clock_in_time.has_value());
    EXPECT_FALSE(fields.value().rate_type.has_value());
}

TEST(CodecTest, AuthoritativeFieldsRejectBadTimestamp) {
    auto fields = authoritative_fields_from_json(json{{"remote_id", "R1"}, {"clock_in_time", "yesterday"}});
    EXPECT_TRUE(fields.is_error());
}
