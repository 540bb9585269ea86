/**
 * @file cancellation.cpp
 * @brief Cooperative cancellation implementation
 */

#include "kcenon/streamup/core/cancellation.h"

namespace kcenon::streamup {

auto cancellation_token::create() -> std::shared_ptr<cancellation_token> {
    return std::shared_ptr<cancellation_token>(new cancellation_token());
}

auto cancellation_token::cancel() -> bool {
    {
        std::lock_guard<std::mutex> lock(sleep_mutex_);
        bool expected = false;
        if (!cancelled_.compare_exchange_strong(expected, true, std::memory_order_acq_rel)) {
            return false;
        }
    }
    sleep_cv_.notify_all();

    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    for (auto& [id, cb] : callbacks_) {
        if (cb) {
            cb();
        }
    }
    return true;
}

auto cancellation_token::wait_for(std::chrono::milliseconds duration) -> bool {
    std::unique_lock<std::mutex> lock(sleep_mutex_);
    sleep_cv_.wait_for(lock, duration, [this] { return is_cancelled(); });
    return is_cancelled();
}

auto cancellation_token::on_cancel(callback cb) -> cancellation_registration {
    std::unique_lock<std::mutex> lock(callbacks_mutex_);
    if (is_cancelled()) {
        lock.unlock();
        if (cb) {
            cb();
        }
        return {};
    }
    auto id = next_id_++;
    callbacks_.emplace(id, std::move(cb));
    return cancellation_registration(weak_from_this(), id);
}

void cancellation_token::unregister(uint64_t id) {
    std::lock_guard<std::mutex> lock(callbacks_mutex_);
    callbacks_.erase(id);
}

}  // namespace kcenon::streamup
