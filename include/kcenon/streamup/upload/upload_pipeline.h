/**
 * @file upload_pipeline.h
 * @brief Producer, worker pool and collector of a multipart upload
 * @version 0.1.0
 *
 * Data flow:
 *   byte_source -> producer -> part channel -> N workers -> result channel
 *   -> collector -> parts sorted by part number
 *
 * The producer runs on the calling thread. Workers and the collector run on
 * a pipeline_executor sized workers + 1. Both channels are bounded by the
 * queue size, so at most workers + queue_size part buffers are resident.
 */

#ifndef KCENON_STREAMUP_UPLOAD_UPLOAD_PIPELINE_H
#define KCENON_STREAMUP_UPLOAD_UPLOAD_PIPELINE_H

#include "kcenon/streamup/backend/storage_backend.h"
#include "kcenon/streamup/core/bounded_channel.h"
#include "kcenon/streamup/core/cancellation.h"
#include "kcenon/streamup/core/checksum.h"
#include "kcenon/streamup/core/retry_policy.h"
#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/io/byte_stream.h"
#include "kcenon/streamup/upload/upload_session.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Parameters of one pipeline run
 */
struct pipeline_settings {
    std::string key;
    std::string upload_id;

    /// Bytes per part (the last part may be shorter)
    uint64_t part_size = 0;

    std::size_t workers = upload_config::default_workers;
    std::size_t queue_size = upload_config::default_queue_size;

    /// Parts the service accepts; the producer fails beyond this
    uint32_t max_parts = service_limits::ceiling_parts;

    /// Declared object size, used for diagnostics only
    uint64_t total_size = 0;

    retry_config retry;
};

/**
 * @brief Runs the producer, workers and collector of one upload
 *
 * The first error from any actor wins and cancels the shared token; the
 * remaining actors drain their channels and their errors are dropped.
 * Cancelling the token from outside stops the producer at its next read or
 * push, abandons worker retries and makes run() return a cancelled error.
 *
 * The checksum accumulator, when given, is fed by the producer only, in
 * source order, before each part is queued.
 */
class upload_pipeline {
public:
    upload_pipeline(std::shared_ptr<storage_backend> backend,
                    pipeline_settings settings,
                    std::shared_ptr<cancellation_token> token,
                    checksum_accumulator* checksum,
                    progress_tracker& progress);

    upload_pipeline(const upload_pipeline&) = delete;
    auto operator=(const upload_pipeline&) -> upload_pipeline& = delete;

    /**
     * @brief Upload every part of the source
     * @return Completion list sorted ascending by part number
     */
    [[nodiscard]] auto run(byte_source& source) -> result<std::vector<completed_part>>;

    /**
     * @brief Parts handed to the workers by the last run
     */
    [[nodiscard]] auto parts_produced() const noexcept -> uint32_t { return parts_produced_; }

    /**
     * @brief Bytes read from the source by the last run
     */
    [[nodiscard]] auto bytes_read() const noexcept -> uint64_t { return bytes_read_; }

private:
    auto produce(byte_source& source, bounded_channel<upload_part>& parts) -> result<void>;
    void work(bounded_channel<upload_part>& parts, bounded_channel<part_result>& results);
    auto upload_with_retry(const upload_part& part) -> result<std::string>;
    auto collect(bounded_channel<part_result>& results) -> std::vector<completed_part>;

    /// Record an error and cancel the other actors if it is the first
    void fail(error err);

    std::shared_ptr<storage_backend> backend_;
    pipeline_settings settings_;
    std::shared_ptr<cancellation_token> token_;
    checksum_accumulator* checksum_;
    progress_tracker& progress_;
    retry_policy retry_;

    first_error_slot first_error_;
    uint32_t parts_produced_{0};
    uint64_t bytes_read_{0};
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_UPLOAD_UPLOAD_PIPELINE_H
