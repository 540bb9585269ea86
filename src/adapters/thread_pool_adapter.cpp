// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Pipeline executor implementations
 */

#include "kcenon/streamup/adapters/thread_pool_adapter.h"

#include <exception>
#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
// Suppress deprecation warnings from thread_system headers
#pragma clang diagnostic push
#pragma clang diagnostic ignored "-Wdeprecated-declarations"
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#pragma clang diagnostic pop
#endif

namespace kcenon::streamup::adapters {

// ============================================================================
// Stage tracking helper (shared implementation)
// ============================================================================

namespace {

class stage_tracker {
public:
    void increment(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        ++counts_[stage_name];
    }

    void decrement(const std::string& stage_name) {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        if (it != counts_.end() && it->second > 0) {
            --it->second;
        }
    }

    [[nodiscard]] size_t count(const std::string& stage_name) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = counts_.find(stage_name);
        return it != counts_.end() ? it->second : 0;
    }

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, size_t> counts_;
};

/**
 * @brief Wrap a task so its outcome reaches a promise and the stage count
 *        drops when it finishes
 */
auto make_tracked_task(std::function<void()> task,
                       std::shared_ptr<std::promise<void>> promise,
                       std::shared_ptr<stage_tracker> tracker,
                       std::string stage) -> std::function<void()> {
    return [task = std::move(task), promise = std::move(promise),
            tracker = std::move(tracker), stage = std::move(stage)]() {
        std::exception_ptr failure;
        try {
            task();
        } catch (...) {
            failure = std::current_exception();
        }
        if (tracker && !stage.empty()) {
            tracker->decrement(stage);
        }
        if (failure) {
            promise->set_exception(failure);
        } else {
            promise->set_value();
        }
    };
}

}  // namespace

// ============================================================================
// thread_system_executor implementation
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Job that wraps a function for thread_system execution
 */
class function_job : public kcenon::thread::job {
public:
    explicit function_job(std::function<void()> func, const std::string& name = "pipeline_task")
        : job(name), func_(std::move(func)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        if (func_) {
            func_();
        }
        return common::ok();
    }

private:
    std::function<void()> func_;
};

struct thread_system_executor::impl {
    std::shared_ptr<kcenon::thread::thread_pool> pool;
    std::string pool_name;
    size_t worker_count{0};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

thread_system_executor::thread_system_executor(
    std::shared_ptr<kcenon::thread::thread_pool> pool,
    const std::string& pool_name,
    size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->pool = std::move(pool);
    pimpl_->pool_name = pool_name;
    pimpl_->worker_count = worker_count;
}

thread_system_executor::~thread_system_executor() {
    // Submitted tasks are joined through their futures before the executor
    // goes away, so a graceful stop returns promptly
    if (pimpl_ && pimpl_->pool) {
        pimpl_->pool->stop(false);
    }
}

std::shared_ptr<thread_system_executor> thread_system_executor::create(
    size_t worker_count, const std::string& pool_name) {
    if (worker_count == 0) {
        worker_count = 1;
    }

    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);

    for (size_t i = 0; i < worker_count; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }

    pool->start();

    return std::make_shared<thread_system_executor>(std::move(pool), pool_name, worker_count);
}

std::future<void> thread_system_executor::submit(std::function<void()> task) {
    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<function_job>(
        make_tracked_task(std::move(task), promise, nullptr, {}), "pipeline_task");
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

std::future<void> thread_system_executor::submit_to_stage(std::function<void()> task,
                                                          const std::string& stage_name) {
    pimpl_->tracker->increment(stage_name);

    auto promise = std::make_shared<std::promise<void>>();
    auto future = promise->get_future();

    auto job = std::make_unique<function_job>(
        make_tracked_task(std::move(task), promise, pimpl_->tracker, stage_name), stage_name);
    pimpl_->pool->enqueue(std::move(job));

    return future;
}

size_t thread_system_executor::worker_count() const {
    return pimpl_->worker_count;
}

size_t thread_system_executor::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

std::string thread_system_executor::pool_name() const {
    return pimpl_->pool_name;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// async_executor implementation
// ============================================================================

struct async_executor::impl {
    size_t worker_count{1};
    std::shared_ptr<stage_tracker> tracker = std::make_shared<stage_tracker>();
};

async_executor::async_executor(size_t worker_count)
    : pimpl_(std::make_unique<impl>()) {
    pimpl_->worker_count = worker_count == 0 ? 1 : worker_count;
}

async_executor::~async_executor() = default;

std::future<void> async_executor::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

std::future<void> async_executor::submit_to_stage(std::function<void()> task,
                                                  const std::string& stage_name) {
    pimpl_->tracker->increment(stage_name);

    auto tracker = pimpl_->tracker;
    return std::async(std::launch::async,
                      [tracker, task = std::move(task), stage = stage_name]() {
                          try {
                              task();
                          } catch (...) {
                              tracker->decrement(stage);
                              throw;
                          }
                          tracker->decrement(stage);
                      });
}

size_t async_executor::worker_count() const {
    return pimpl_->worker_count;
}

size_t async_executor::pending_tasks(const std::string& stage_name) const {
    return pimpl_->tracker->count(stage_name);
}

// ============================================================================
// executor_factory implementation
// ============================================================================

std::shared_ptr<pipeline_executor> executor_factory::create(size_t worker_count,
                                                            const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_executor::create(worker_count, pool_name);
#else
    (void)pool_name;
    return std::make_shared<async_executor>(worker_count);
#endif
}

}  // namespace kcenon::streamup::adapters
