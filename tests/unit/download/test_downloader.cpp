/**
 * @file test_downloader.cpp
 * @brief Unit tests for streaming object download
 */

#include <gtest/gtest.h>

#include <kcenon/streamup/download/downloader.h>

#include "integration/test_fixtures.h"

namespace kcenon::streamup::test {

namespace {

/**
 * @brief Reports a stale size from head_object
 */
class stale_size_backend : public forwarding_backend {
public:
    using forwarding_backend::forwarding_backend;

    auto head_object(const std::string& key) -> result<object_info> override {
        auto info = forwarding_backend::head_object(key);
        if (info) {
            auto stale = info.value();
            stale.size += 1;
            return stale;
        }
        return info;
    }
};

/**
 * @brief Serves readers that fail partway through the object
 */
class broken_reader_backend : public forwarding_backend {
public:
    broken_reader_backend(std::shared_ptr<memory_backend> inner, std::size_t fail_at)
        : forwarding_backend(inner), memory_(std::move(inner)), fail_at_(fail_at) {}

    auto get_object(const std::string& key) -> result<std::unique_ptr<byte_source>> override {
        auto data = memory_->object_data(key);
        if (!data) {
            return unexpected{error{error_code::object_not_found, "no such key: " + key}};
        }
        return std::unique_ptr<byte_source>(
            std::make_unique<failing_source>(std::move(*data), fail_at_));
    }

private:
    std::shared_ptr<memory_backend> memory_;
    std::size_t fail_at_;
};

}  // namespace

class DownloaderTest : public MemoryBackendFixture {
protected:
    void SetUp() override {
        MemoryBackendFixture::SetUp();
        data_ = make_pattern(mib + 123);
        backend_->put_object("reports/q1.bin", data_);
    }

    auto make_config(const std::string& key = "reports/q1.bin") -> download_config {
        download_config config;
        config.connection = test_connection();
        config.key = key;
        return config;
    }

    byte_buffer data_;
};

TEST_F(DownloaderTest, DownloadsWholeObject) {
    downloader dl(make_config(), backend_);
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_TRUE(written) << written.error().describe();
    EXPECT_EQ(written.value(), data_.size());
    EXPECT_EQ(dl.bytes_downloaded(), data_.size());
    EXPECT_EQ(sink.data(), data_);
    EXPECT_TRUE(dl.checksum().empty());
}

TEST_F(DownloaderTest, GetSizeUsesMetadata) {
    downloader dl(make_config(), backend_);
    auto size = dl.get_size();
    ASSERT_TRUE(size);
    EXPECT_EQ(size.value(), data_.size());
}

TEST_F(DownloaderTest, Md5ChecksumCoversWrittenBytes) {
    auto config = make_config();
    config.calculate_checksum = true;
    downloader dl(config, backend_);
    memory_sink sink;

    ASSERT_TRUE(dl.download(sink));
    EXPECT_EQ(dl.checksum(), checksum_accumulator::digest(checksum_algorithm::md5, data_));
}

TEST_F(DownloaderTest, Sha256Checksum) {
    auto config = make_config();
    config.calculate_checksum = true;
    config.checksum_algorithm = "sha256";
    downloader dl(config, backend_);
    memory_sink sink;

    ASSERT_TRUE(dl.download(sink));
    EXPECT_EQ(dl.checksum(), checksum_accumulator::digest(checksum_algorithm::sha256, data_));
}

TEST_F(DownloaderTest, EmptyObject) {
    backend_->put_object("empty.txt", {});
    auto config = make_config("empty.txt");
    config.calculate_checksum = true;
    downloader dl(config, backend_);
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_TRUE(written);
    EXPECT_EQ(written.value(), 0u);
    EXPECT_EQ(dl.checksum(), "d41d8cd98f00b204e9800998ecf8427e");
}

TEST_F(DownloaderTest, ProgressReportsCumulativeBytes) {
    std::vector<uint64_t> reported;
    auto config = make_config();
    config.buffer_size = 256 * kib;
    downloader dl(config, backend_);
    dl.set_progress_callback([&](uint64_t bytes) { reported.push_back(bytes); });
    memory_sink sink;

    ASSERT_TRUE(dl.download(sink));
    ASSERT_EQ(reported.size(), 5u);
    EXPECT_EQ(reported.front(), 256 * kib);
    for (std::size_t i = 1; i < reported.size(); ++i) {
        EXPECT_GT(reported[i], reported[i - 1]);
    }
    EXPECT_EQ(reported.back(), data_.size());
}

TEST_F(DownloaderTest, MissingObject) {
    downloader dl(make_config("missing.bin"), backend_);
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::object_not_found);
    EXPECT_EQ(written.error().message,
              "failed to get object metadata: no such key: missing.bin (NoSuchKey)");
    EXPECT_EQ(written.error().http_status, 404);
}

TEST_F(DownloaderTest, SinkFailureStopsDownload) {
    auto config = make_config();
    config.calculate_checksum = true;
    config.buffer_size = 64 * kib;
    downloader dl(config, backend_);
    failing_sink sink(100 * kib);

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::stream_write_error);
    EXPECT_EQ(written.error().message, "failed to download object: disk full");
    EXPECT_EQ(dl.bytes_downloaded(), 64 * kib);
    EXPECT_TRUE(dl.checksum().empty());
}

TEST_F(DownloaderTest, ReaderFailureStopsDownload) {
    auto broken = std::make_shared<broken_reader_backend>(backend_, 300 * kib);
    downloader dl(make_config(), broken);
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::stream_read_error);
    EXPECT_EQ(written.error().message, "failed to download object: disk read failed");
    EXPECT_EQ(sink.data().size(), 300 * kib);
}

TEST_F(DownloaderTest, SizeMismatchFails) {
    auto stale = std::make_shared<stale_size_backend>(backend_);
    auto config = make_config();
    config.calculate_checksum = true;
    downloader dl(config, stale);
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::invalid_response);
    EXPECT_NE(written.error().message.find("object size changed"), std::string::npos);
    EXPECT_TRUE(dl.checksum().empty());
}

TEST_F(DownloaderTest, AbortBeforeDownload) {
    downloader dl(make_config(), backend_);
    dl.abort();
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::cancelled);
    EXPECT_TRUE(sink.data().empty());
}

TEST_F(DownloaderTest, AbortFromProgressCallback) {
    auto config = make_config();
    config.buffer_size = 128 * kib;
    downloader dl(config, backend_);
    dl.set_progress_callback([&dl](uint64_t) { dl.abort(); });
    memory_sink sink;

    auto written = dl.download(sink);
    ASSERT_FALSE(written);
    EXPECT_EQ(written.error().code, error_code::cancelled);
    EXPECT_EQ(dl.bytes_downloaded(), 128 * kib);
}

TEST_F(DownloaderTest, InvalidSettingsRejected) {
    memory_sink sink;

    auto config = make_config("");
    EXPECT_EQ(downloader(config, backend_).download(sink).error().code,
              error_code::missing_field);

    config = make_config();
    config.buffer_size = 0;
    EXPECT_EQ(downloader(config, backend_).download(sink).error().code,
              error_code::invalid_configuration);

    config = make_config();
    config.calculate_checksum = true;
    config.checksum_algorithm = "crc32";
    EXPECT_EQ(downloader(config, backend_).download(sink).error().code,
              error_code::unsupported_checksum);
}

TEST_F(DownloaderTest, CreateValidatesConnection) {
    auto config = make_config();
    config.connection.bucket.clear();

    auto dl = downloader::create(config);
    ASSERT_FALSE(dl);
    EXPECT_EQ(dl.error().code, error_code::missing_field);

    ASSERT_TRUE(downloader::create(make_config()));
}

}  // namespace kcenon::streamup::test
