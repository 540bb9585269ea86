/**
 * @file test_core_types.cpp
 * @brief Unit tests for core types (error_code, error, result, service_limits)
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/core/service_limits.h>
#include <kcenon/streamup/core/types.h>

#include <string>

namespace kcenon::streamup::test {

// =============================================================================
// error_code Tests
// =============================================================================

class ErrorCodeTest : public ::testing::Test {};

TEST_F(ErrorCodeTest, ErrorCodeRanges) {
    // Configuration errors: -100 to -119
    EXPECT_EQ(static_cast<int>(error_code::invalid_configuration), -100);
    EXPECT_EQ(static_cast<int>(error_code::unsupported_checksum), -106);

    // Local I/O errors: -120 to -139
    EXPECT_EQ(static_cast<int>(error_code::stream_read_error), -120);
    EXPECT_EQ(static_cast<int>(error_code::file_open_error), -122);

    // Transport errors: -140 to -159
    EXPECT_EQ(static_cast<int>(error_code::connection_failed), -140);
    EXPECT_EQ(static_cast<int>(error_code::transport_unavailable), -145);

    // Backend errors: -160 to -179
    EXPECT_EQ(static_cast<int>(error_code::backend_error), -160);
    EXPECT_EQ(static_cast<int>(error_code::invalid_response), -168);

    // Cancellation: -180 to -189
    EXPECT_EQ(static_cast<int>(error_code::cancelled), -180);

    // Internal: -200 to -219
    EXPECT_EQ(static_cast<int>(error_code::internal_error), -200);
}

TEST_F(ErrorCodeTest, ToString) {
    EXPECT_STREQ(to_string(error_code::success), "success");
    EXPECT_STREQ(to_string(error_code::size_exceeds_limits), "size exceeds service limits");
    EXPECT_STREQ(to_string(error_code::throttled), "request throttled");
    EXPECT_STREQ(to_string(error_code::cancelled), "cancelled");
}

TEST_F(ErrorCodeTest, RangePredicates) {
    EXPECT_TRUE(is_config_error(error_code::missing_field));
    EXPECT_FALSE(is_config_error(error_code::stream_read_error));

    EXPECT_TRUE(is_io_error(error_code::stream_write_error));
    EXPECT_FALSE(is_io_error(error_code::connection_failed));

    EXPECT_TRUE(is_transport_error(error_code::connection_reset));
    EXPECT_FALSE(is_transport_error(error_code::backend_error));

    EXPECT_TRUE(is_backend_error(error_code::access_denied));
    EXPECT_FALSE(is_backend_error(error_code::cancelled));

    EXPECT_TRUE(is_cancellation(error_code::cancelled));
    EXPECT_TRUE(is_cancellation(error_code::deadline_exceeded));
    EXPECT_FALSE(is_cancellation(error_code::internal_error));
}

// =============================================================================
// error Tests
// =============================================================================

class ErrorTest : public ::testing::Test {};

TEST_F(ErrorTest, DefaultIsSuccess) {
    error err;
    EXPECT_EQ(err.code, error_code::success);
    EXPECT_FALSE(static_cast<bool>(err));
}

TEST_F(ErrorTest, CodeOnlyUsesDefaultMessage) {
    error err(error_code::throttled);
    EXPECT_TRUE(static_cast<bool>(err));
    EXPECT_EQ(err.message, "request throttled");
}

TEST_F(ErrorTest, DescribeWithoutOperation) {
    error err{error_code::backend_error, "bucket missing"};
    EXPECT_EQ(err.describe(), "bucket missing");
}

TEST_F(ErrorTest, DescribeWithOperation) {
    error err{error_code::connection_reset, "connection reset by peer"};
    auto wrapped = err.during("uploading part 3");

    EXPECT_EQ(wrapped.describe(),
              "upload error during uploading part 3: connection reset by peer");
    EXPECT_TRUE(err.operation.empty());
}

TEST_F(ErrorTest, DescribeAppendsServiceCode) {
    error err{error_code::throttled, "please reduce your request rate"};
    err.service_code = "SlowDown";
    err.http_status = 503;

    auto wrapped = err.during("UploadPart");
    EXPECT_EQ(wrapped.describe(),
              "upload error during UploadPart: please reduce your request rate (SlowDown)");
    EXPECT_EQ(wrapped.http_status, 503);
}

TEST_F(ErrorTest, ValidationErrorFormat) {
    auto err = validation_error(error_code::missing_field, "bucket", "required");
    EXPECT_EQ(err.code, error_code::missing_field);
    EXPECT_EQ(err.message, "validation error for bucket: required");
}

// =============================================================================
// result Tests
// =============================================================================

class ResultTest : public ::testing::Test {};

TEST_F(ResultTest, HoldsValue) {
    result<int> r = 42;
    ASSERT_TRUE(r.has_value());
    EXPECT_EQ(r.value(), 42);
}

TEST_F(ResultTest, HoldsError) {
    result<std::string> r = unexpected{error{error_code::object_not_found, "no such key"}};
    ASSERT_FALSE(r.has_value());
    EXPECT_EQ(r.error().code, error_code::object_not_found);
    EXPECT_EQ(r.error().message, "no such key");
}

TEST_F(ResultTest, VoidResult) {
    result<void> ok;
    EXPECT_TRUE(ok.has_value());

    result<void> bad = unexpected{error{error_code::invalid_state}};
    EXPECT_FALSE(bad);
    EXPECT_EQ(bad.error().code, error_code::invalid_state);
}

TEST_F(ResultTest, MoveOutValue) {
    result<std::string> r = std::string("payload");
    auto moved = std::move(r).value();
    EXPECT_EQ(moved, "payload");
}

// =============================================================================
// service_limits Tests
// =============================================================================

class ServiceLimitsTest : public ::testing::Test {};

TEST_F(ServiceLimitsTest, DefaultsMatchS3) {
    service_limits limits;
    EXPECT_EQ(limits.min_part_size, 5 * mib);
    EXPECT_EQ(limits.max_part_size, 5 * gib);
    EXPECT_EQ(limits.max_parts, 10000u);
    EXPECT_EQ(limits, service_limits::s3());
}

TEST_F(ServiceLimitsTest, ProviderPresetsAreValid) {
    EXPECT_TRUE(service_limits::s3().validate());
    EXPECT_TRUE(service_limits::r2().validate());
    EXPECT_TRUE(service_limits::b2().validate());
    EXPECT_TRUE(service_limits::minio().validate());
}

TEST_F(ServiceLimitsTest, MaxObjectSize) {
    service_limits limits;
    EXPECT_EQ(limits.max_object_size(), 5 * gib * 10000);
}

TEST_F(ServiceLimitsTest, RejectsMinBelowFloor) {
    service_limits limits;
    limits.min_part_size = 4 * mib;

    auto r = limits.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_service_limits);
    EXPECT_NE(r.error().message.find("min_part_size"), std::string::npos);
}

TEST_F(ServiceLimitsTest, RejectsMaxAboveCeiling) {
    service_limits limits;
    limits.max_part_size = 6 * gib;
    EXPECT_FALSE(limits.validate());
}

TEST_F(ServiceLimitsTest, RejectsMinGreaterThanMax) {
    service_limits limits;
    limits.min_part_size = 100 * mib;
    limits.max_part_size = 50 * mib;

    auto r = limits.validate();
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("cannot be greater than max_part_size"), std::string::npos);
}

TEST_F(ServiceLimitsTest, RejectsPartCountOutOfRange) {
    service_limits zero;
    zero.max_parts = 0;
    EXPECT_FALSE(zero.validate());

    service_limits too_many;
    too_many.max_parts = 10001;
    EXPECT_FALSE(too_many.validate());
}

}  // namespace kcenon::streamup::test
