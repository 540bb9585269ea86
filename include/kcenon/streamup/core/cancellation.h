/**
 * @file cancellation.h
 * @brief Cooperative cancellation shared by pipeline actors
 */

#ifndef KCENON_STREAMUP_CORE_CANCELLATION_H
#define KCENON_STREAMUP_CORE_CANCELLATION_H

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace kcenon::streamup {

class cancellation_registration;

/**
 * @brief Shared cancellation signal
 *
 * cancel() is idempotent. Blocking points either poll is_cancelled(),
 * sleep through wait_for(), or register a wake-up callback that runs once
 * when cancellation happens.
 *
 * @note Thread-safe.
 */
class cancellation_token : public std::enable_shared_from_this<cancellation_token> {
public:
    using callback = std::function<void()>;

    [[nodiscard]] static auto create() -> std::shared_ptr<cancellation_token>;

    cancellation_token(const cancellation_token&) = delete;
    auto operator=(const cancellation_token&) -> cancellation_token& = delete;

    /**
     * @brief Request cancellation
     * @return true if this call performed the transition
     */
    auto cancel() -> bool;

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Sleep for the given duration unless cancelled first
     * @return true if the token is cancelled when the call returns
     */
    auto wait_for(std::chrono::milliseconds duration) -> bool;

    /**
     * @brief Run a callback on cancellation
     *
     * If already cancelled the callback runs immediately on the calling
     * thread. The callback must not register or unregister callbacks.
     */
    [[nodiscard]] auto on_cancel(callback cb) -> cancellation_registration;

private:
    friend class cancellation_registration;

    cancellation_token() = default;

    void unregister(uint64_t id);

    std::atomic<bool> cancelled_{false};

    std::mutex sleep_mutex_;
    std::condition_variable sleep_cv_;

    // Held while callbacks run so unregister() waits for in-flight calls
    std::mutex callbacks_mutex_;
    std::map<uint64_t, callback> callbacks_;
    uint64_t next_id_{1};
};

/**
 * @brief RAII handle that removes a cancellation callback
 */
class cancellation_registration {
public:
    cancellation_registration() = default;
    cancellation_registration(std::weak_ptr<cancellation_token> token, uint64_t id)
        : token_(std::move(token)), id_(id) {}

    ~cancellation_registration() { reset(); }

    cancellation_registration(const cancellation_registration&) = delete;
    auto operator=(const cancellation_registration&) -> cancellation_registration& = delete;

    cancellation_registration(cancellation_registration&& other) noexcept
        : token_(std::move(other.token_)), id_(other.id_) {
        other.id_ = 0;
    }

    auto operator=(cancellation_registration&& other) noexcept -> cancellation_registration& {
        if (this != &other) {
            reset();
            token_ = std::move(other.token_);
            id_ = other.id_;
            other.id_ = 0;
        }
        return *this;
    }

    void reset() {
        if (id_ != 0) {
            if (auto token = token_.lock()) {
                token->unregister(id_);
            }
            id_ = 0;
        }
    }

private:
    std::weak_ptr<cancellation_token> token_;
    uint64_t id_{0};
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_CANCELLATION_H
