/**
 * @file test_upload_config.cpp
 * @brief Unit tests for upload configuration and its builder
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/upload/upload_config.h>

#include "integration/test_fixtures.h"

namespace kcenon::streamup::test {

class UploadConfigTest : public ::testing::Test {
protected:
    upload_config config_ = make_upload_config("backups/db.tar.gz", 70 * gib);
};

TEST_F(UploadConfigTest, DefaultsMatchDocumentedValues) {
    upload_config defaults;
    EXPECT_EQ(defaults.workers, 4u);
    EXPECT_EQ(defaults.queue_size, 10u);
    EXPECT_EQ(defaults.max_memory_mb, 0u);
    EXPECT_EQ(defaults.retry.max_retries, 3u);
    EXPECT_EQ(defaults.retry.initial_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(defaults.retry.max_delay, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(defaults.retry.multiplier, 2.0);
    EXPECT_TRUE(defaults.calculate_checksum);
    EXPECT_EQ(defaults.checksum_algorithm, "md5");
}

TEST_F(UploadConfigTest, ValidConfigPasses) {
    EXPECT_TRUE(config_.validate());
}

TEST_F(UploadConfigTest, ConnectionIsCheckedFirst) {
    config_.connection.bucket.clear();
    config_.key.clear();

    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_NE(r.error().message.find("bucket"), std::string::npos);

    auto transfer_only = config_.validate_transfer_settings();
    ASSERT_FALSE(transfer_only);
    EXPECT_EQ(transfer_only.error().message, "validation error for key: required");
}

TEST_F(UploadConfigTest, ZeroTotalSizeRejected) {
    config_.total_size = 0;
    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_configuration);
}

TEST_F(UploadConfigTest, OversizedObjectRejected) {
    config_.total_size = 5 * gib * 10000 + 1;
    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::size_exceeds_limits);
    EXPECT_NE(r.error().message.find("exceeds service limit"), std::string::npos);

    config_.total_size = 5 * gib * 10000;
    EXPECT_TRUE(config_.validate());
}

TEST_F(UploadConfigTest, InvalidLimitsRejected) {
    config_.limits.min_part_size = mib;
    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_service_limits);
}

TEST_F(UploadConfigTest, UnsupportedChecksumRejected) {
    config_.checksum_algorithm = "crc32";
    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::unsupported_checksum);
}

TEST_F(UploadConfigTest, KeyAndMetadataValidated) {
    config_.key = "../escape";
    EXPECT_FALSE(config_.validate());

    config_.key = "ok.bin";
    config_.metadata.user_metadata["note"] = "a\r\nb";
    auto r = config_.validate();
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, error_code::invalid_metadata);
}

TEST_F(UploadConfigTest, NormalizedReplacesZeroTuning) {
    config_.workers = 0;
    config_.queue_size = 0;
    config_.retry.max_retries = 0;
    config_.retry.initial_delay = std::chrono::milliseconds(0);
    config_.retry.max_delay = std::chrono::milliseconds(0);
    config_.retry.multiplier = 0.0;
    config_.checksum_algorithm.clear();

    auto normalized = config_.normalized();
    EXPECT_EQ(normalized.workers, upload_config::default_workers);
    EXPECT_EQ(normalized.queue_size, upload_config::default_queue_size);
    EXPECT_EQ(normalized.retry.max_retries, 0u);
    EXPECT_EQ(normalized.retry.initial_delay, std::chrono::milliseconds(1000));
    EXPECT_EQ(normalized.retry.max_delay, std::chrono::milliseconds(30000));
    EXPECT_DOUBLE_EQ(normalized.retry.multiplier, 2.0);
    EXPECT_EQ(normalized.checksum_algorithm, "md5");
}

class UploadConfigBuilderTest : public ::testing::Test {};

TEST_F(UploadConfigBuilderTest, BuildsValidConfig) {
    bool called = false;
    auto config = upload_config_builder()
                      .with_credentials("AKID", "secret")
                      .with_bucket("backups")
                      .with_account_id("acct")
                      .with_key("db/2024-01-01.tar.gz")
                      .with_total_size(70 * gib)
                      .with_workers(8)
                      .with_queue_size(6)
                      .with_memory_limit_mb(2048)
                      .with_content_type("application/x-tar")
                      .with_cache_control("max-age=60")
                      .with_user_metadata("owner", "ops")
                      .with_checksum("sha256")
                      .with_progress_callback([&](uint64_t, uint32_t) { called = true; })
                      .build();

    ASSERT_TRUE(config);
    const auto& c = config.value();
    EXPECT_EQ(c.connection.bucket, "backups");
    EXPECT_EQ(c.connection.resolved_region(), "auto");
    EXPECT_EQ(c.key, "db/2024-01-01.tar.gz");
    EXPECT_EQ(c.total_size, 70 * gib);
    EXPECT_EQ(c.workers, 8u);
    EXPECT_EQ(c.queue_size, 6u);
    EXPECT_EQ(c.max_memory_mb, 2048u);
    EXPECT_EQ(c.metadata.content_type, "application/x-tar");
    EXPECT_EQ(c.metadata.cache_control, "max-age=60");
    EXPECT_EQ(c.metadata.user_metadata.at("owner"), "ops");
    EXPECT_EQ(c.checksum_algorithm, "sha256");

    ASSERT_TRUE(c.on_progress);
    c.on_progress(1, 1);
    EXPECT_TRUE(called);
}

TEST_F(UploadConfigBuilderTest, BuildAppliesDefaults) {
    auto config = upload_config_builder()
                      .with_credentials("AKID", "secret")
                      .with_bucket("b")
                      .with_key("k")
                      .with_total_size(1)
                      .with_workers(0)
                      .build();
    ASSERT_TRUE(config);
    EXPECT_EQ(config.value().workers, upload_config::default_workers);
}

TEST_F(UploadConfigBuilderTest, BuildReportsValidationErrors) {
    auto config = upload_config_builder().with_bucket("b").with_key("k").with_total_size(1).build();
    ASSERT_FALSE(config);
    EXPECT_EQ(config.error().code, error_code::missing_field);
}

TEST_F(UploadConfigBuilderTest, WithoutChecksum) {
    auto config = upload_config_builder()
                      .with_credentials("AKID", "secret")
                      .with_bucket("b")
                      .with_key("k")
                      .with_total_size(1)
                      .without_checksum()
                      .build();
    ASSERT_TRUE(config);
    EXPECT_FALSE(config.value().calculate_checksum);
}

}  // namespace kcenon::streamup::test
