/**
 * @file upload_session.cpp
 * @brief Part results, first-error slot and progress counters
 * @version 0.1.0
 */

#include "kcenon/streamup/upload/upload_session.h"

#include <utility>

namespace kcenon::streamup {

auto part_result::ok(uint32_t part_number, std::string etag) -> part_result {
    part_result res;
    res.part_number = part_number;
    res.etag = std::move(etag);
    return res;
}

auto part_result::fail(uint32_t part_number, error err) -> part_result {
    part_result res;
    res.part_number = part_number;
    res.failure = std::move(err);
    return res;
}

auto first_error_slot::try_set(error err) -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    if (error_.has_value()) {
        return false;
    }
    error_ = std::move(err);
    return true;
}

auto first_error_slot::has_error() const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_.has_value();
}

auto first_error_slot::get() const -> std::optional<error> {
    std::lock_guard<std::mutex> lock(mutex_);
    return error_;
}

progress_tracker::progress_tracker(progress_callback callback)
    : callback_(std::move(callback)) {}

auto progress_tracker::record_part(uint64_t bytes) -> upload_progress {
    upload_progress totals;
    totals.bytes_uploaded = bytes_.fetch_add(bytes, std::memory_order_relaxed) + bytes;
    totals.parts_uploaded = parts_.fetch_add(1, std::memory_order_relaxed) + 1;
    if (callback_) {
        callback_(totals.bytes_uploaded, totals.parts_uploaded);
    }
    return totals;
}

auto progress_tracker::snapshot() const -> upload_progress {
    upload_progress totals;
    totals.bytes_uploaded = bytes_.load(std::memory_order_relaxed);
    totals.parts_uploaded = parts_.load(std::memory_order_relaxed);
    return totals;
}

}  // namespace kcenon::streamup
