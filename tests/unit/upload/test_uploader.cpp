/**
 * @file test_uploader.cpp
 * @brief Unit tests for the multipart session controller
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/upload/uploader.h>

#include "integration/test_fixtures.h"

#include <algorithm>
#include <atomic>
#include <future>
#include <mutex>
#include <thread>

namespace kcenon::streamup::test {

class UploaderTest : public MemoryBackendFixture {
protected:
    static constexpr std::size_t object_size = 12 * mib;

    void SetUp() override {
        MemoryBackendFixture::SetUp();
        data_ = make_pattern(object_size);
    }

    byte_buffer data_;
};

TEST_F(UploaderTest, UploadsObjectAndReportsResult) {
    uploader up(make_upload_config("backups/data.bin", data_.size()), backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_TRUE(res) << res.error().describe();

    EXPECT_EQ(res.value().key, "backups/data.bin");
    EXPECT_EQ(res.value().upload_id, "mem-upload-1");
    EXPECT_EQ(res.value().location, "memory://backups/data.bin");
    EXPECT_EQ(res.value().part_size, 5 * mib);
    EXPECT_EQ(res.value().parts_uploaded, 3u);
    EXPECT_EQ(res.value().bytes_uploaded, object_size);
    EXPECT_FALSE(res.value().etag.empty());

    auto expected_md5 = checksum_accumulator::digest(checksum_algorithm::md5, data_);
    EXPECT_EQ(res.value().checksum, expected_md5);
    EXPECT_EQ(up.checksum(), expected_md5);

    EXPECT_EQ(up.state(), upload_state::done);
    EXPECT_EQ(up.part_size(), 5 * mib);
    EXPECT_EQ(up.upload_id(), "mem-upload-1");
    EXPECT_EQ(up.progress().bytes_uploaded, object_size);

    EXPECT_EQ(backend_->object_data("backups/data.bin"), data_);
    EXPECT_EQ(backend_->session_count(), 0u);
    EXPECT_EQ(backend_->abort_calls(), 0u);

    auto completed = backend_->last_completed_parts();
    ASSERT_EQ(completed.size(), 3u);
    EXPECT_EQ(completed[0].part_number, 1u);
    EXPECT_EQ(completed[2].part_number, 3u);
}

TEST_F(UploaderTest, Sha256Checksum) {
    auto config = make_upload_config("data.bin", data_.size());
    config.checksum_algorithm = "sha256";
    uploader up(config, backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().checksum,
              checksum_accumulator::digest(checksum_algorithm::sha256, data_));
}

TEST_F(UploaderTest, ChecksumDisabled) {
    auto config = make_upload_config("data.bin", data_.size());
    config.calculate_checksum = false;
    uploader up(config, backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_TRUE(res);
    EXPECT_TRUE(res.value().checksum.empty());
    EXPECT_TRUE(up.checksum().empty());
}

TEST_F(UploaderTest, ChecksumEmptyBeforeCompletion) {
    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    EXPECT_TRUE(up.checksum().empty());
    EXPECT_EQ(up.state(), upload_state::created);
    EXPECT_EQ(up.part_size(), 0u);
    EXPECT_TRUE(up.upload_id().empty());
}

TEST_F(UploaderTest, DetectsContentTypeAndEncoding) {
    uploader up(make_upload_config("archive.tar.gz", data_.size()), backend_);
    memory_source source(data_);
    ASSERT_TRUE(up.upload(source));

    auto metadata = backend_->object_metadata_of("archive.tar.gz");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->content_type, "application/gzip");
    EXPECT_EQ(metadata->content_encoding, "gzip");
}

TEST_F(UploaderTest, ExplicitMetadataIsKept) {
    auto config = make_upload_config("archive.tar.gz", data_.size());
    config.metadata.content_type = "application/x-custom";
    config.metadata.user_metadata["owner"] = "ops";
    uploader up(config, backend_);
    memory_source source(data_);
    ASSERT_TRUE(up.upload(source));

    auto metadata = backend_->object_metadata_of("archive.tar.gz");
    ASSERT_TRUE(metadata.has_value());
    EXPECT_EQ(metadata->content_type, "application/x-custom");
    EXPECT_EQ(metadata->user_metadata.at("owner"), "ops");
}

TEST_F(UploaderTest, ProgressCallbackSeesCumulativeTotals) {
    std::mutex mutex;
    std::vector<std::pair<uint64_t, uint32_t>> calls;

    auto config = make_upload_config("data.bin", data_.size());
    config.on_progress = [&](uint64_t bytes, uint32_t parts) {
        std::lock_guard<std::mutex> lock(mutex);
        calls.emplace_back(bytes, parts);
    };
    uploader up(config, backend_);
    memory_source source(data_);
    ASSERT_TRUE(up.upload(source));

    ASSERT_EQ(calls.size(), 3u);
    std::sort(calls.begin(), calls.end(),
              [](const auto& a, const auto& b) { return a.second < b.second; });
    for (std::size_t i = 0; i < calls.size(); ++i) {
        EXPECT_EQ(calls[i].second, i + 1);
        if (i > 0) {
            EXPECT_GT(calls[i].first, calls[i - 1].first);
        }
    }
    EXPECT_EQ(calls.back().first, object_size);
}

TEST_F(UploaderTest, UploaderIsSingleUse) {
    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    memory_source first(data_);
    ASSERT_TRUE(up.upload(first));

    memory_source second(data_);
    auto again = up.upload(second);
    ASSERT_FALSE(again);
    EXPECT_EQ(again.error().code, error_code::invalid_state);
    EXPECT_EQ(backend_->begin_calls(), 1u);
}

TEST_F(UploaderTest, InvalidSettingsFailBeforeAnyRemoteCall) {
    auto config = make_upload_config("", data_.size());
    uploader up(config, backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::missing_field);
    EXPECT_EQ(backend_->begin_calls(), 0u);
}

TEST_F(UploaderTest, OversizedDeclarationFailsBeforeAnyRemoteCall) {
    auto config = make_upload_config("huge.bin", 5 * gib * 10000 + 1);
    uploader up(config, backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::size_exceeds_limits);
    EXPECT_EQ(backend_->begin_calls(), 0u);
}

TEST_F(UploaderTest, PartFailureAbortsSessionOnce) {
    backend_->set_part_hook([](uint32_t part, uint32_t) -> std::optional<error> {
        if (part == 2) {
            return error{error_code::transport_unavailable, "no HTTP transport"};
        }
        return std::nullopt;
    });

    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::transport_unavailable);
    EXPECT_EQ(up.state(), upload_state::aborted);
    EXPECT_EQ(backend_->abort_calls(), 1u);
    EXPECT_EQ(backend_->complete_calls(), 0u);
    EXPECT_EQ(backend_->session_count(), 0u);
    EXPECT_FALSE(backend_->object_data("data.bin").has_value());
    EXPECT_TRUE(up.checksum().empty());
}

TEST_F(UploaderTest, AbortFailureDoesNotReplaceOriginalError) {
    backend_->fail_next_aborts(1);
    backend_->set_part_hook([](uint32_t, uint32_t) -> std::optional<error> {
        return error{error_code::invalid_state, "poison part"};
    });

    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::invalid_state);
    EXPECT_EQ(res.error().message, "poison part");
    EXPECT_EQ(backend_->abort_calls(), 1u);
    EXPECT_EQ(backend_->session_count(), 1u);
}

TEST_F(UploaderTest, EmptyStreamAbortsSession) {
    uploader up(make_upload_config("data.bin", 100), backend_);
    memory_source source(byte_buffer{});

    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::stream_read_error);
    EXPECT_EQ(res.error().describe(),
              "upload error during reading data: input stream is empty");
    EXPECT_EQ(backend_->abort_calls(), 1u);
    EXPECT_EQ(backend_->session_count(), 0u);
}

TEST_F(UploaderTest, AbortBeforeUploadMakesNoRemoteCalls) {
    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    EXPECT_TRUE(up.abort());

    memory_source source(data_);
    auto res = up.upload(source);
    ASSERT_FALSE(res);
    EXPECT_EQ(res.error().code, error_code::cancelled);
    EXPECT_EQ(up.state(), upload_state::aborted);
    EXPECT_EQ(backend_->begin_calls(), 0u);
    EXPECT_EQ(backend_->abort_calls(), 0u);
}

TEST_F(UploaderTest, AbortDuringUploadCancelsAndAbortsOnce) {
    std::promise<void> first_part;
    std::atomic<bool> signalled{false};
    std::atomic<bool> released{false};

    backend_->set_part_hook([&](uint32_t, uint32_t) -> std::optional<error> {
        if (!signalled.exchange(true)) {
            first_part.set_value();
        }
        for (int i = 0; i < 5000 && !released.load(); ++i) {
            std::this_thread::sleep_for(std::chrono::milliseconds(1));
        }
        return std::nullopt;
    });

    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    memory_source source(data_);

    auto pending = std::async(std::launch::async, [&] { return up.upload(source); });

    first_part.get_future().wait();
    EXPECT_EQ(up.state(), upload_state::uploading);
    EXPECT_TRUE(up.abort());
    released = true;

    auto res = pending.get();
    ASSERT_FALSE(res);
    EXPECT_TRUE(is_cancellation(res.error().code));
    EXPECT_EQ(up.state(), upload_state::aborted);
    EXPECT_EQ(backend_->abort_calls(), 1u);
    EXPECT_EQ(backend_->complete_calls(), 0u);
    EXPECT_EQ(backend_->session_count(), 0u);
}

TEST_F(UploaderTest, AbortAfterDoneIsNoOp) {
    uploader up(make_upload_config("data.bin", data_.size()), backend_);
    memory_source source(data_);
    ASSERT_TRUE(up.upload(source));

    EXPECT_TRUE(up.abort());
    EXPECT_EQ(up.state(), upload_state::done);
    EXPECT_EQ(backend_->abort_calls(), 0u);
    EXPECT_TRUE(backend_->object_data("data.bin").has_value());
}

TEST_F(UploaderTest, LongerStreamThanDeclaredStillUploads) {
    uploader up(make_upload_config("data.bin", 6 * mib), backend_);
    memory_source source(data_);

    auto res = up.upload(source);
    ASSERT_TRUE(res);
    EXPECT_EQ(res.value().bytes_uploaded, object_size);
}

class UploaderFactoryTest : public ::testing::Test {};

TEST_F(UploaderFactoryTest, CreateValidatesConnection) {
    auto config = make_upload_config("data.bin", 1024);
    config.connection.secret_access_key.clear();

    auto up = uploader::create(config);
    ASSERT_FALSE(up);
    EXPECT_EQ(up.error().code, error_code::missing_field);
}

TEST_F(UploaderFactoryTest, CreateWithValidConfig) {
    auto up = uploader::create(make_upload_config("data.bin", 1024));
    ASSERT_TRUE(up);
    EXPECT_EQ(up.value()->state(), upload_state::created);
}

}  // namespace kcenon::streamup::test
