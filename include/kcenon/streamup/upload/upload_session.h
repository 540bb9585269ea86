/**
 * @file upload_session.h
 * @brief State shared by the actors of one multipart upload
 * @version 0.1.0
 */

#ifndef KCENON_STREAMUP_UPLOAD_UPLOAD_SESSION_H
#define KCENON_STREAMUP_UPLOAD_UPLOAD_SESSION_H

#include "kcenon/streamup/core/types.h"
#include "kcenon/streamup/upload/upload_config.h"

#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>

namespace kcenon::streamup {

/**
 * @brief Lifecycle of an upload session
 *
 * created -> uploading -> completing -> done. Any failure or cancellation
 * during uploading or completing moves the session to aborted.
 */
enum class upload_state {
    created,
    uploading,
    completing,
    done,
    aborted,
};

[[nodiscard]] constexpr auto to_string(upload_state state) -> const char* {
    switch (state) {
        case upload_state::created: return "created";
        case upload_state::uploading: return "uploading";
        case upload_state::completing: return "completing";
        case upload_state::done: return "done";
        case upload_state::aborted: return "aborted";
        default: return "unknown";
    }
}

/**
 * @brief One slice of the input, owned by whichever actor holds it
 */
struct upload_part {
    /// 1-based, contiguous sequence number
    uint32_t part_number = 0;

    byte_buffer data;
};

/**
 * @brief Outcome of one part upload
 */
struct part_result {
    uint32_t part_number = 0;

    /// Completion token on success
    std::string etag;

    /// Terminal error on failure
    std::optional<error> failure;

    [[nodiscard]] static auto ok(uint32_t part_number, std::string etag) -> part_result;
    [[nodiscard]] static auto fail(uint32_t part_number, error err) -> part_result;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return !failure.has_value(); }
};

/**
 * @brief Holds the first error reported by any pipeline actor
 *
 * Later errors are discarded.
 *
 * @note Thread-safe.
 */
class first_error_slot {
public:
    /**
     * @brief Store the error if the slot is empty
     * @return true if this call stored it
     */
    auto try_set(error err) -> bool;

    [[nodiscard]] auto has_error() const -> bool;
    [[nodiscard]] auto get() const -> std::optional<error>;

private:
    mutable std::mutex mutex_;
    std::optional<error> error_;
};

/**
 * @brief Cumulative upload progress
 */
struct upload_progress {
    uint64_t bytes_uploaded = 0;
    uint32_t parts_uploaded = 0;
};

/**
 * @brief Progress counters updated by workers after each successful part
 *
 * A part is recorded once, after its final successful attempt, so retries
 * never count twice. The user callback runs on the worker that recorded the
 * part, without any lock held, so a slow callback only delays that worker.
 * Callbacks from different workers may overlap and may arrive out of order;
 * each carries the totals of the record that triggered it.
 */
class progress_tracker {
public:
    explicit progress_tracker(progress_callback callback = {});

    progress_tracker(const progress_tracker&) = delete;
    auto operator=(const progress_tracker&) -> progress_tracker& = delete;

    /**
     * @brief Count a completed part and notify the callback
     * @return Totals after this part
     */
    auto record_part(uint64_t bytes) -> upload_progress;

    [[nodiscard]] auto snapshot() const -> upload_progress;

private:
    std::atomic<uint64_t> bytes_{0};
    std::atomic<uint32_t> parts_{0};

    progress_callback callback_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_UPLOAD_UPLOAD_SESSION_H
