/**
 * @file retry_policy.cpp
 * @brief Retry classification and backoff
 */

#include "kcenon/streamup/core/retry_policy.h"

#include <algorithm>
#include <cmath>

namespace kcenon::streamup {

auto retry_policy::is_transient_service_code(std::string_view code) -> bool {
    if (code == "InternalError" || code == "ServiceUnavailable" ||
        code == "SlowDown" || code == "RequestTimeout") {
        return true;
    }
    return code.size() >= 3 && code.front() == '5';
}

auto retry_policy::should_retry(const error& err) -> bool {
    if (!err) {
        return false;
    }
    if (is_cancellation(err.code)) {
        return false;
    }
    if (is_config_error(err.code) || is_io_error(err.code) ||
        err.code == error_code::invalid_state ||
        err.code == error_code::transport_unavailable) {
        return false;
    }
    if (is_transport_error(err.code)) {
        return true;
    }
    if (is_backend_error(err.code)) {
        if (err.code == error_code::service_unavailable ||
            err.code == error_code::throttled ||
            err.code == error_code::request_timeout ||
            err.code == error_code::internal_service_error) {
            return true;
        }
        if (is_transient_service_code(err.service_code)) {
            return true;
        }
        if (err.http_status >= 500 && err.http_status < 600) {
            return true;
        }
    }
    // Unclassified failures are retried
    return true;
}

auto retry_policy::backoff(uint32_t attempt) const -> std::chrono::milliseconds {
    const auto base = static_cast<double>(config_.initial_delay.count());
    const auto ceiling = static_cast<double>(config_.max_delay.count());

    auto delay = base * std::pow(config_.multiplier, static_cast<double>(attempt));
    if (!std::isfinite(delay) || delay > ceiling) {
        delay = ceiling;
    }
    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

}  // namespace kcenon::streamup
