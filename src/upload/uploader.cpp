/**
 * @file uploader.cpp
 * @brief Multipart session lifecycle around the upload pipeline
 * @version 0.1.0
 */

#include "kcenon/streamup/upload/uploader.h"

#include "kcenon/streamup/backend/s3_backend.h"
#include "kcenon/streamup/core/cancellation.h"
#include "kcenon/streamup/core/checksum.h"
#include "kcenon/streamup/core/content_type.h"
#include "kcenon/streamup/core/logging.h"
#include "kcenon/streamup/core/part_size_calculator.h"
#include "kcenon/streamup/core/validation.h"
#include "kcenon/streamup/upload/upload_pipeline.h"

#include <atomic>
#include <mutex>
#include <utility>

namespace kcenon::streamup {

namespace {

/**
 * @brief Fill in the content type and encoding derived from the key
 */
auto prepare_metadata(const upload_config& config) -> object_metadata {
    auto metadata = config.metadata;
    if (metadata.content_type.empty()) {
        metadata.content_type = detect_content_type(config.key);
    }
    if (metadata.content_encoding.empty()) {
        metadata.content_encoding = detect_content_encoding(config.key);
    }
    return metadata;
}

}  // namespace

struct uploader::impl {
    upload_config config;
    std::shared_ptr<storage_backend> backend;
    std::shared_ptr<cancellation_token> token = cancellation_token::create();

    progress_tracker progress;
    std::unique_ptr<checksum_accumulator> checksum;

    std::atomic<upload_state> state{upload_state::created};
    std::atomic<uint64_t> part_size{0};
    std::atomic<bool> started{false};
    std::atomic<bool> remote_aborted{false};

    mutable std::mutex session_mutex;
    std::string upload_id;

    impl(upload_config cfg, std::shared_ptr<storage_backend> storage)
        : config(cfg.normalized()),
          backend(std::move(storage)),
          progress(config.on_progress) {}

    auto current_upload_id() const -> std::string {
        std::lock_guard<std::mutex> lock(session_mutex);
        return upload_id;
    }

    auto log_context() const -> transfer_log_context {
        transfer_log_context ctx;
        ctx.key = config.key;
        ctx.upload_id = current_upload_id();
        return ctx;
    }

    /**
     * @brief Abort the remote session once across every caller
     */
    auto abort_remote() -> result<void> {
        auto id = current_upload_id();
        if (id.empty()) {
            return {};
        }
        if (remote_aborted.exchange(true)) {
            return {};
        }

        auto ctx = log_context();
        SU_LOG_INFO_CTX(log_category::upload, "aborting multipart upload", ctx);
        auto aborted = backend->abort_multipart(config.key, id);
        if (!aborted) {
            return unexpected{aborted.error().during("AbortMultipartUpload")};
        }
        return {};
    }

    /**
     * @brief Move to aborted, abort the remote session and return the error
     */
    auto fail(const error& err) -> unexpected {
        state = upload_state::aborted;

        auto ctx = log_context();
        ctx.error_message = err.describe();
        if (is_cancellation(err.code)) {
            SU_LOG_INFO_CTX(log_category::upload, "upload cancelled", ctx);
        } else {
            SU_LOG_ERROR_CTX(log_category::upload, "upload failed", ctx);
        }

        if (auto aborted = abort_remote(); !aborted) {
            ctx.error_message = aborted.error().describe();
            SU_LOG_ERROR_CTX(log_category::upload,
                             "failed to abort multipart upload, incomplete parts may remain",
                             ctx);
        }
        return unexpected{err};
    }
};

auto uploader::create(const upload_config& config) -> result<std::unique_ptr<uploader>> {
    auto normalized = config.normalized();
    if (auto valid = normalized.validate(); !valid) {
        return unexpected{valid.error()};
    }

    auto backend = s3_backend::create(normalized.connection);
    if (!backend) {
        return unexpected{backend.error()};
    }
    return std::make_unique<uploader>(std::move(normalized), backend.value());
}

uploader::uploader(upload_config config, std::shared_ptr<storage_backend> backend)
    : impl_(std::make_unique<impl>(std::move(config), std::move(backend))) {
    // Initialize logger (safe to call multiple times)
    get_logger().initialize();
}

uploader::~uploader() = default;

auto uploader::upload(byte_source& source) -> result<upload_result> {
    if (impl_->started.exchange(true)) {
        return unexpected{error{error_code::invalid_state, "uploader has already been used"}};
    }
    if (!impl_->backend) {
        return unexpected{error{error_code::invalid_state, "no storage backend"}};
    }

    const auto& config = impl_->config;
    if (auto valid = config.validate_transfer_settings(); !valid) {
        return unexpected{valid.error()};
    }

    auto part_size = part_size_calculator::calculate(config.total_size, config.max_memory_mb,
                                                     config.workers, config.queue_size,
                                                     config.limits);
    if (!part_size) {
        return unexpected{part_size.error()};
    }
    impl_->part_size = part_size.value();

    if (config.calculate_checksum) {
        auto algorithm = parse_checksum_algorithm(config.checksum_algorithm);
        if (!algorithm) {
            return unexpected{validation_error(error_code::unsupported_checksum,
                                               "checksum_algorithm",
                                               "must be 'md5' or 'sha256'")};
        }
        impl_->checksum = std::make_unique<checksum_accumulator>(*algorithm);
    }

    if (impl_->token->is_cancelled()) {
        impl_->state = upload_state::aborted;
        return unexpected{error{error_code::cancelled, "upload cancelled"}};
    }

    auto ctx = impl_->log_context();
    ctx.total_bytes = config.total_size;
    ctx.part_size = part_size.value();
    ctx.total_parts = static_cast<uint32_t>(
        part_size_calculator::part_count(config.total_size, part_size.value()));
    SU_LOG_INFO_CTX(log_category::upload,
                    "starting upload of " + format_size(config.total_size) + " in parts of " +
                        format_size(part_size.value()),
                    ctx);

    const auto started = std::chrono::steady_clock::now();
    impl_->state = upload_state::uploading;

    auto upload_id = impl_->backend->begin_multipart(config.key, prepare_metadata(config));
    if (!upload_id) {
        return impl_->fail(upload_id.error().during("CreateMultipartUpload"));
    }
    {
        std::lock_guard<std::mutex> lock(impl_->session_mutex);
        impl_->upload_id = upload_id.value();
    }

    pipeline_settings settings;
    settings.key = config.key;
    settings.upload_id = upload_id.value();
    settings.part_size = part_size.value();
    settings.workers = config.workers;
    settings.queue_size = config.queue_size;
    settings.max_parts = config.limits.max_parts;
    settings.total_size = config.total_size;
    settings.retry = config.retry;

    upload_pipeline pipeline(impl_->backend, settings, impl_->token, impl_->checksum.get(),
                             impl_->progress);
    auto parts = pipeline.run(source);
    if (!parts) {
        return impl_->fail(parts.error());
    }
    if (impl_->token->is_cancelled()) {
        return impl_->fail(error{error_code::cancelled, "upload cancelled"});
    }

    impl_->state = upload_state::completing;
    auto completion = impl_->backend->complete_multipart(config.key, upload_id.value(),
                                                         parts.value());
    if (!completion) {
        return impl_->fail(completion.error().during("CompleteMultipartUpload"));
    }

    upload_result res;
    if (impl_->checksum) {
        auto digest = impl_->checksum->finalize();
        if (digest) {
            res.checksum = digest.value();
        } else {
            SU_LOG_ERROR(log_category::upload,
                         "checksum finalization failed: " + digest.error().describe());
        }
    }
    impl_->state = upload_state::done;

    const auto totals = impl_->progress.snapshot();
    res.key = config.key;
    res.upload_id = upload_id.value();
    res.etag = completion.value().etag;
    res.location = completion.value().location;
    res.bytes_uploaded = totals.bytes_uploaded;
    res.parts_uploaded = totals.parts_uploaded;
    res.part_size = part_size.value();
    res.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);

    ctx.upload_id = res.upload_id;
    ctx.bytes = res.bytes_uploaded;
    ctx.total_parts = res.parts_uploaded;
    ctx.duration_ms = static_cast<uint64_t>(res.duration.count());
    SU_LOG_INFO_CTX(log_category::upload, "upload completed", ctx);
    return res;
}

auto uploader::abort() -> result<void> {
    impl_->token->cancel();
    if (impl_->state.load() == upload_state::done) {
        return {};
    }
    return impl_->abort_remote();
}

auto uploader::checksum() const -> std::string {
    if (impl_->state.load() != upload_state::done || !impl_->checksum) {
        return {};
    }
    return impl_->checksum->hex_digest();
}

auto uploader::progress() const -> upload_progress {
    return impl_->progress.snapshot();
}

auto uploader::part_size() const -> uint64_t {
    return impl_->part_size.load();
}

auto uploader::state() const -> upload_state {
    return impl_->state.load();
}

auto uploader::upload_id() const -> std::string {
    return impl_->current_upload_id();
}

}  // namespace kcenon::streamup
