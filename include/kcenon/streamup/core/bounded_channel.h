/**
 * @file bounded_channel.h
 * @brief Fixed-capacity blocking channel used for pipeline backpressure
 */

#ifndef KCENON_STREAMUP_CORE_BOUNDED_CHANNEL_H
#define KCENON_STREAMUP_CORE_BOUNDED_CHANNEL_H

#include "kcenon/streamup/core/cancellation.h"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Outcome of a channel push
 */
enum class channel_status {
    ok,
    closed,
    cancelled,
};

/**
 * @brief Multi-producer multi-consumer channel backed by a ring buffer
 *
 * push() blocks while the buffer is full, pop() blocks while it is empty
 * and open. After close() pushes fail and pops drain the remaining items
 * before returning std::nullopt. The capacity never grows.
 *
 * @tparam T Element type (moved in and out)
 */
template <typename T>
class bounded_channel {
public:
    explicit bounded_channel(std::size_t capacity)
        : slots_(capacity == 0 ? 1 : capacity) {}

    bounded_channel(const bounded_channel&) = delete;
    auto operator=(const bounded_channel&) -> bounded_channel& = delete;

    /**
     * @brief A capacity slot held for an item that is not built yet
     *
     * The slot counts against capacity from reserve() until push() or
     * destruction, so a producer can hold it while it allocates and fills
     * the item. Destroying an unused slot gives it back.
     */
    class slot {
    public:
        slot(slot&& other) noexcept
            : owner_(std::exchange(other.owner_, nullptr)), status_(other.status_) {}
        slot(const slot&) = delete;
        auto operator=(const slot&) -> slot& = delete;
        auto operator=(slot&&) -> slot& = delete;

        ~slot() {
            if (owner_ != nullptr) {
                owner_->release();
            }
        }

        [[nodiscard]] auto status() const noexcept -> channel_status { return status_; }

        /**
         * @brief Fill the slot; the slot is spent afterwards
         */
        auto push(T item) -> channel_status {
            auto* owner = std::exchange(owner_, nullptr);
            if (owner == nullptr) {
                return status_ == channel_status::ok ? channel_status::closed : status_;
            }
            return owner->push_reserved(std::move(item));
        }

    private:
        friend class bounded_channel;

        slot(bounded_channel* owner, channel_status status) : owner_(owner), status_(status) {}

        bounded_channel* owner_;
        channel_status status_;
    };

    /**
     * @brief Wait for free capacity and hold it, giving up when the token is cancelled
     *
     * The caller must arrange for wake_all() to run on cancellation.
     */
    auto reserve(const cancellation_token& token) -> slot {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [&] { return closed_ || token.is_cancelled() || has_room(); });
        if (token.is_cancelled()) {
            return slot(nullptr, channel_status::cancelled);
        }
        if (closed_) {
            return slot(nullptr, channel_status::closed);
        }
        ++reserved_;
        return slot(this, channel_status::ok);
    }

    /**
     * @brief Push an item, blocking while full
     */
    auto push(T item) -> channel_status {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [this] { return closed_ || has_room(); });
        if (closed_) {
            return channel_status::closed;
        }
        enqueue(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Push an item, giving up when the token is cancelled
     *
     * The caller must arrange for wake_all() to run on cancellation.
     */
    auto push(T item, const cancellation_token& token) -> channel_status {
        std::unique_lock<std::mutex> lock(mutex_);
        not_full_.wait(lock, [&] {
            return closed_ || token.is_cancelled() || has_room();
        });
        if (token.is_cancelled()) {
            return channel_status::cancelled;
        }
        if (closed_) {
            return channel_status::closed;
        }
        enqueue(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return channel_status::ok;
    }

    /**
     * @brief Pop an item, blocking while empty and open
     * @return The item, or std::nullopt once closed and drained
     */
    auto pop() -> std::optional<T> {
        std::unique_lock<std::mutex> lock(mutex_);
        not_empty_.wait(lock, [this] { return closed_ || count_ > 0; });
        if (count_ == 0) {
            return std::nullopt;
        }
        T item = std::move(*slots_[head_]);
        slots_[head_].reset();
        head_ = (head_ + 1) % slots_.size();
        --count_;
        lock.unlock();
        not_full_.notify_one();
        return item;
    }

    /**
     * @brief Close the channel; idempotent
     */
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    /**
     * @brief Wake blocked callers so they re-check their predicates
     */
    void wake_all() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
        }
        not_full_.notify_all();
        not_empty_.notify_all();
    }

    [[nodiscard]] auto size() const -> std::size_t {
        std::lock_guard<std::mutex> lock(mutex_);
        return count_;
    }

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return slots_.size(); }

    [[nodiscard]] auto is_closed() const -> bool {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

private:
    [[nodiscard]] auto has_room() const -> bool { return count_ + reserved_ < slots_.size(); }

    auto push_reserved(T item) -> channel_status {
        std::unique_lock<std::mutex> lock(mutex_);
        --reserved_;
        if (closed_) {
            lock.unlock();
            not_full_.notify_one();
            return channel_status::closed;
        }
        enqueue(std::move(item));
        lock.unlock();
        not_empty_.notify_one();
        return channel_status::ok;
    }

    void release() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            --reserved_;
        }
        not_full_.notify_one();
    }

    void enqueue(T item) {
        auto tail = (head_ + count_) % slots_.size();
        slots_[tail].emplace(std::move(item));
        ++count_;
    }

    std::vector<std::optional<T>> slots_;
    std::size_t head_{0};
    std::size_t count_{0};
    std::size_t reserved_{0};
    bool closed_{false};

    mutable std::mutex mutex_;
    std::condition_variable not_full_;
    std::condition_variable not_empty_;
};

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_BOUNDED_CHANNEL_H
