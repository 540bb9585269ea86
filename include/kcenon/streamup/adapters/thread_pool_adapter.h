// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Executors that run upload pipeline actors
 *
 * The upload pipeline runs its workers and its collector as long-lived
 * tasks that block on bounded channels. An executor must therefore give
 * every submitted task its own thread for as long as it runs; pools are
 * sized to the number of actors.
 *
 * Features:
 * - Stage-based task tracking ("upload_worker", "collector")
 * - Integration with thread_system when available
 * - Fallback to std::async when thread_system is unavailable
 */

#ifndef KCENON_STREAMUP_ADAPTERS_THREAD_POOL_ADAPTER_H
#define KCENON_STREAMUP_ADAPTERS_THREAD_POOL_ADAPTER_H

#include <atomic>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "kcenon/streamup/config/feature_flags.h"

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace kcenon::streamup::adapters {

/**
 * @brief Runs pipeline actors concurrently
 *
 * Exceptions thrown by a task are delivered through its future.
 */
class pipeline_executor {
public:
    virtual ~pipeline_executor() = default;

    /**
     * @brief Submit a task for execution
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Submit a task counted under a pipeline stage
     * @param task The task to execute
     * @param stage_name Stage label used by pending_tasks(stage)
     */
    virtual std::future<void> submit_to_stage(std::function<void()> task,
                                              const std::string& stage_name) = 0;

    /**
     * @brief Number of tasks that can run at once
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;

    /**
     * @brief Tasks submitted to a stage that have not finished
     */
    [[nodiscard]] virtual size_t pending_tasks(const std::string& stage_name) const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Executor backed by a thread_system thread_pool
 *
 * @note Thread-safe.
 */
class thread_system_executor : public pipeline_executor {
public:
    /**
     * @brief Wrap an existing, started pool
     * @param pool thread_system pool
     * @param pool_name Name for identification in logs
     * @param worker_count Number of workers in the pool
     */
    thread_system_executor(std::shared_ptr<kcenon::thread::thread_pool> pool,
                           const std::string& pool_name,
                           size_t worker_count);

    ~thread_system_executor() override;

    thread_system_executor(const thread_system_executor&) = delete;
    thread_system_executor& operator=(const thread_system_executor&) = delete;

    /**
     * @brief Create a started pool with exactly worker_count workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_executor> create(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

    [[nodiscard]] std::string pool_name() const;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Fallback executor using std::async
 *
 * Every task gets its own thread, so worker_count() only reports the
 * requested concurrency.
 */
class async_executor : public pipeline_executor {
public:
    explicit async_executor(size_t worker_count);
    ~async_executor() override;

    async_executor(const async_executor&) = delete;
    async_executor& operator=(const async_executor&) = delete;

    std::future<void> submit(std::function<void()> task) override;
    std::future<void> submit_to_stage(std::function<void()> task,
                                      const std::string& stage_name) override;

    [[nodiscard]] size_t worker_count() const override;
    [[nodiscard]] size_t pending_tasks(const std::string& stage_name) const override;

private:
    struct impl;
    std::unique_ptr<impl> pimpl_;
};

/**
 * @brief Selects the best available executor
 *
 * 1. thread_system_executor (when KCENON_WITH_THREAD_SYSTEM)
 * 2. async_executor (fallback)
 */
class executor_factory {
public:
    /**
     * @brief Create an executor able to run worker_count blocking tasks
     * @param worker_count Concurrent task capacity (0 is treated as 1)
     * @param pool_name Name for identification
     */
    [[nodiscard]] static std::shared_ptr<pipeline_executor> create(
        size_t worker_count, const std::string& pool_name = "streamup_pool");

    [[nodiscard]] static constexpr bool has_thread_system() noexcept {
#if KCENON_WITH_THREAD_SYSTEM
        return true;
#else
        return false;
#endif
    }
};

}  // namespace kcenon::streamup::adapters

#endif  // KCENON_STREAMUP_ADAPTERS_THREAD_POOL_ADAPTER_H
