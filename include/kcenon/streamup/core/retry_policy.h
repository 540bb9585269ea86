/**
 * @file retry_policy.h
 * @brief Error classification and exponential backoff for part uploads
 */

#ifndef KCENON_STREAMUP_CORE_RETRY_POLICY_H
#define KCENON_STREAMUP_CORE_RETRY_POLICY_H

#include "kcenon/streamup/core/cancellation.h"
#include "kcenon/streamup/core/types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <string_view>

namespace kcenon::streamup {

/**
 * @brief Retry tuning
 */
struct retry_config {
    /// Retries after the first attempt (total attempts = max_retries + 1)
    uint32_t max_retries = 3;

    /// Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    /// Backoff ceiling
    std::chrono::milliseconds max_delay{30000};

    /// Growth factor per attempt
    double multiplier = 2.0;
};

/**
 * @brief Classifies failures and computes backoff delays
 *
 * Classification order:
 * 1. cancellation and deadline errors never retry
 * 2. local configuration, I/O and internal-state errors never retry,
 *    nor does a missing HTTP transport
 * 3. other transport errors retry
 * 4. backend errors retry when tagged transient (InternalError,
 *    ServiceUnavailable, SlowDown, RequestTimeout, any 5xx code or status)
 * 5. anything else retries
 */
class retry_policy {
public:
    using attempt_observer = std::function<void(uint32_t attempt, const error& err,
                                                std::chrono::milliseconds delay)>;

    retry_policy() = default;
    explicit retry_policy(retry_config config) : config_(config) {}

    /**
     * @brief Whether an error is worth another attempt
     */
    [[nodiscard]] static auto should_retry(const error& err) -> bool;

    /**
     * @brief Whether a service error code marks a transient condition
     */
    [[nodiscard]] static auto is_transient_service_code(std::string_view code) -> bool;

    /**
     * @brief Delay before retrying after a 0-indexed attempt
     *
     * min(max_delay, initial_delay * multiplier^attempt)
     */
    [[nodiscard]] auto backoff(uint32_t attempt) const -> std::chrono::milliseconds;

    /**
     * @brief Run an operation with retries
     *
     * The token is checked before each attempt and backoff sleeps return
     * early with a cancelled error once it is cancelled. On exhaustion the
     * last error is returned.
     *
     * @param op Operation to attempt
     * @param token Cancellation scope
     * @param observer Optional hook invoked before each backoff sleep
     */
    template <typename T>
    [[nodiscard]] auto execute(const std::function<result<T>()>& op,
                               cancellation_token& token,
                               const attempt_observer& observer = {}) const -> result<T> {
        for (uint32_t attempt = 0;; ++attempt) {
            if (token.is_cancelled()) {
                return unexpected{error{error_code::cancelled, "operation cancelled"}};
            }

            auto res = op();
            if (res.has_value()) {
                return res;
            }

            const auto& err = res.error();
            if (!should_retry(err) || attempt >= config_.max_retries) {
                return res;
            }

            auto delay = backoff(attempt);
            if (observer) {
                observer(attempt, err, delay);
            }
            if (token.wait_for(delay)) {
                return unexpected{error{error_code::cancelled,
                                        "cancelled during retry backoff"}};
            }
        }
    }

    [[nodiscard]] auto config() const noexcept -> const retry_config& { return config_; }

private:
    retry_config config_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_RETRY_POLICY_H
