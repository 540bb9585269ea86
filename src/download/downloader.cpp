/**
 * @file downloader.cpp
 * @brief Streaming object download
 * @version 0.1.0
 */

#include "kcenon/streamup/download/downloader.h"

#include "kcenon/streamup/backend/s3_backend.h"
#include "kcenon/streamup/core/cancellation.h"
#include "kcenon/streamup/core/checksum.h"
#include "kcenon/streamup/core/logging.h"
#include "kcenon/streamup/core/validation.h"

#include <atomic>
#include <chrono>
#include <mutex>
#include <span>
#include <utility>

namespace kcenon::streamup {

namespace {

/**
 * @brief Prefix a cause with what the downloader was doing
 */
auto download_error(const error& cause, const std::string& what) -> error {
    auto err = cause;
    err.message = what + ": " + cause.describe();
    err.operation.clear();
    return err;
}

}  // namespace

// ============================================================================
// download_config
// ============================================================================

auto download_config::validate() const -> result<void> {
    if (auto valid = connection.validate(); !valid) {
        return valid;
    }
    return validate_transfer_settings();
}

auto download_config::validate_transfer_settings() const -> result<void> {
    if (key.empty()) {
        return unexpected{validation_error(error_code::missing_field, "key", "required")};
    }
    if (calculate_checksum && !checksum_algorithm.empty() && checksum_algorithm != "md5" &&
        checksum_algorithm != "sha256") {
        return unexpected{validation_error(error_code::unsupported_checksum,
                                           "checksum_algorithm",
                                           "must be 'md5' or 'sha256'")};
    }
    if (buffer_size == 0) {
        return unexpected{validation_error(error_code::invalid_configuration, "buffer_size",
                                           "must be greater than 0")};
    }
    return {};
}

// ============================================================================
// downloader
// ============================================================================

struct downloader::impl {
    download_config config;
    std::shared_ptr<storage_backend> backend;
    std::shared_ptr<cancellation_token> token = cancellation_token::create();

    std::atomic<uint64_t> bytes_downloaded{0};

    mutable std::mutex checksum_mutex;
    std::string checksum;

    impl(download_config cfg, std::shared_ptr<storage_backend> storage)
        : config(std::move(cfg)), backend(std::move(storage)) {}
};

auto downloader::create(const download_config& config) -> result<std::unique_ptr<downloader>> {
    if (auto valid = config.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto backend = s3_backend::create(config.connection);
    if (!backend) {
        return unexpected{backend.error()};
    }
    return std::make_unique<downloader>(config, backend.value());
}

downloader::downloader(download_config config, std::shared_ptr<storage_backend> backend)
    : impl_(std::make_unique<impl>(std::move(config), std::move(backend))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

downloader::~downloader() = default;

void downloader::set_progress_callback(download_progress_callback callback) {
    impl_->config.on_progress = std::move(callback);
}

auto downloader::get_size() -> result<uint64_t> {
    if (!impl_->backend) {
        return unexpected{error{error_code::invalid_state, "no storage backend"}};
    }
    auto info = impl_->backend->head_object(impl_->config.key);
    if (!info) {
        return unexpected{download_error(info.error(), "failed to get object metadata")};
    }
    return info.value().size;
}

auto downloader::download(byte_sink& sink) -> result<uint64_t> {
    const auto& config = impl_->config;
    if (!impl_->backend) {
        return unexpected{error{error_code::invalid_state, "no storage backend"}};
    }
    if (auto valid = config.validate_transfer_settings(); !valid) {
        return unexpected{valid.error()};
    }

    {
        std::lock_guard<std::mutex> lock(impl_->checksum_mutex);
        impl_->checksum.clear();
    }
    impl_->bytes_downloaded = 0;

    std::unique_ptr<checksum_accumulator> hasher;
    if (config.calculate_checksum) {
        auto algorithm = parse_checksum_algorithm(
            config.checksum_algorithm.empty() ? "md5" : config.checksum_algorithm);
        if (!algorithm) {
            return unexpected{validation_error(error_code::unsupported_checksum,
                                               "checksum_algorithm",
                                               "must be 'md5' or 'sha256'")};
        }
        hasher = std::make_unique<checksum_accumulator>(*algorithm);
    }

    auto size = get_size();
    if (!size) {
        return unexpected{size.error()};
    }

    transfer_log_context ctx;
    ctx.key = config.key;
    ctx.total_bytes = size.value();
    SU_LOG_INFO_CTX(log_category::download,
                    "starting download of " + format_size(size.value()), ctx);

    const auto started = std::chrono::steady_clock::now();

    auto reader = impl_->backend->get_object(config.key);
    if (!reader) {
        return unexpected{download_error(reader.error(), "failed to get object")};
    }

    byte_buffer buffer(config.buffer_size);
    uint64_t written = 0;

    for (;;) {
        if (impl_->token->is_cancelled()) {
            SU_LOG_INFO_CTX(log_category::download, "download cancelled", ctx);
            return unexpected{error{error_code::cancelled, "download cancelled"}};
        }

        auto read = reader.value()->read(buffer);
        if (!read) {
            return unexpected{download_error(read.error(), "failed to download object")};
        }
        if (read.value() == 0) {
            break;
        }

        const std::span<const std::byte> block(buffer.data(), read.value());
        if (auto stored = sink.write(block); !stored) {
            return unexpected{download_error(stored.error(), "failed to download object")};
        }
        if (hasher) {
            if (auto hashed = hasher->update(block); !hashed) {
                return unexpected{hashed.error()};
            }
        }

        written += read.value();
        impl_->bytes_downloaded = written;
        if (config.on_progress) {
            config.on_progress(written);
        }
    }

    if (auto flushed = sink.flush(); !flushed) {
        return unexpected{download_error(flushed.error(), "failed to download object")};
    }

    if (written != size.value()) {
        return unexpected{error{error_code::invalid_response,
            "object size changed during download: expected " + std::to_string(size.value()) +
            " bytes, received " + std::to_string(written)}};
    }

    if (hasher) {
        auto digest = hasher->finalize();
        if (!digest) {
            return unexpected{digest.error()};
        }
        std::lock_guard<std::mutex> lock(impl_->checksum_mutex);
        impl_->checksum = digest.value();
    }

    ctx.bytes = written;
    ctx.duration_ms = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count());
    SU_LOG_INFO_CTX(log_category::download, "download completed", ctx);
    return written;
}

auto downloader::checksum() const -> std::string {
    std::lock_guard<std::mutex> lock(impl_->checksum_mutex);
    return impl_->checksum;
}

void downloader::abort() {
    impl_->token->cancel();
}

auto downloader::bytes_downloaded() const -> uint64_t {
    return impl_->bytes_downloaded.load();
}

}  // namespace kcenon::streamup
