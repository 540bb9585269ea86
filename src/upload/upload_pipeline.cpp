/**
 * @file upload_pipeline.cpp
 * @brief Producer, worker pool and collector of a multipart upload
 * @version 0.1.0
 */

#include "kcenon/streamup/upload/upload_pipeline.h"

#include "kcenon/streamup/adapters/thread_pool_adapter.h"
#include "kcenon/streamup/core/logging.h"
#include "kcenon/streamup/core/part_size_calculator.h"
#include "kcenon/streamup/core/validation.h"

#include <algorithm>
#include <chrono>
#include <exception>
#include <functional>
#include <future>
#include <span>
#include <utility>

namespace kcenon::streamup {

namespace {

constexpr const char* worker_stage = "upload_worker";
constexpr const char* collector_stage = "collector";

auto cancelled_error() -> error {
    return error{error_code::cancelled, "upload cancelled"};
}

/**
 * @brief Closes both channels and joins every actor when run() leaves scope
 *
 * Workers and the collector hold references to the channels on run()'s
 * stack, so they must finish before it unwinds, including by exception.
 */
class pipeline_shutdown {
public:
    pipeline_shutdown(bounded_channel<upload_part>& parts,
                      bounded_channel<part_result>& results,
                      std::vector<std::future<void>>& workers,
                      std::future<void>& collector)
        : parts_(parts), results_(results), workers_(workers), collector_(collector) {}

    pipeline_shutdown(const pipeline_shutdown&) = delete;
    auto operator=(const pipeline_shutdown&) -> pipeline_shutdown& = delete;

    ~pipeline_shutdown() { join(); }

    void join() {
        if (joined_) {
            return;
        }
        joined_ = true;

        // Workers drain whatever is still queued, then exit
        parts_.close();
        for (auto& task : workers_) {
            if (task.valid()) {
                task.wait();
            }
        }
        results_.close();
        if (collector_.valid()) {
            collector_.wait();
        }
    }

private:
    bounded_channel<upload_part>& parts_;
    bounded_channel<part_result>& results_;
    std::vector<std::future<void>>& workers_;
    std::future<void>& collector_;
    bool joined_ = false;
};

}  // namespace

upload_pipeline::upload_pipeline(std::shared_ptr<storage_backend> backend,
                                 pipeline_settings settings,
                                 std::shared_ptr<cancellation_token> token,
                                 checksum_accumulator* checksum,
                                 progress_tracker& progress)
    : backend_(std::move(backend)),
      settings_(std::move(settings)),
      token_(std::move(token)),
      checksum_(checksum),
      progress_(progress),
      retry_(settings_.retry) {}

auto upload_pipeline::run(byte_source& source) -> result<std::vector<completed_part>> {
    parts_produced_ = 0;
    bytes_read_ = 0;

    if (settings_.part_size == 0) {
        return unexpected{error{error_code::invalid_configuration, "part size must be positive"}};
    }

    const auto workers = std::max<std::size_t>(1, settings_.workers);

    transfer_log_context ctx;
    ctx.key = settings_.key;
    ctx.upload_id = settings_.upload_id;
    ctx.part_size = settings_.part_size;
    ctx.total_bytes = settings_.total_size;
    ctx.total_parts = static_cast<uint32_t>(
        part_size_calculator::part_count(settings_.total_size, settings_.part_size));
    SU_LOG_DEBUG_CTX(log_category::pipeline,
                     "starting pipeline with " + std::to_string(workers) + " workers, queue " +
                         std::to_string(settings_.queue_size) + ", peak memory " +
                         format_size(part_size_calculator::memory_usage(
                             settings_.part_size, workers, settings_.queue_size)),
                     ctx);

    bounded_channel<upload_part> parts(settings_.queue_size);
    bounded_channel<part_result> results(settings_.queue_size);

    auto executor = adapters::executor_factory::create(workers + 1, "streamup_upload");

    std::vector<std::future<void>> worker_tasks;
    worker_tasks.reserve(workers);
    std::vector<completed_part> completed;
    std::future<void> collector_task;
    pipeline_shutdown shutdown(parts, results, worker_tasks, collector_task);

    for (std::size_t i = 0; i < workers; ++i) {
        worker_tasks.push_back(executor->submit_to_stage(
            [this, &parts, &results]() {
                try {
                    work(parts, results);
                } catch (const std::exception& e) {
                    fail(error{error_code::internal_error,
                               std::string("upload worker failed: ") + e.what()});
                }
            },
            worker_stage));
    }

    collector_task = executor->submit_to_stage(
        [this, &results, &completed]() {
            try {
                completed = collect(results);
            } catch (const std::exception& e) {
                fail(error{error_code::internal_error,
                           std::string("result collector failed: ") + e.what()});
                // Workers block on a full result channel unless it keeps draining
                while (results.pop()) {
                }
            }
        },
        collector_stage);

    {
        // A cancelled token must release a producer blocked on a full channel
        auto wake = token_->on_cancel([&parts]() { parts.wake_all(); });
        try {
            if (auto produced = produce(source, parts); !produced) {
                fail(produced.error());
            }
        } catch (const std::exception& e) {
            fail(error{error_code::stream_read_error,
                       std::string("producer failed: ") + e.what()}.during("reading data"));
        }
    }

    shutdown.join();

    for (auto& task : worker_tasks) {
        task.get();
    }
    collector_task.get();

    if (auto err = first_error_.get(); err.has_value()) {
        ctx.error_message = err->describe();
        SU_LOG_DEBUG_CTX(log_category::pipeline, "pipeline failed", ctx);
        return unexpected{*err};
    }

    if (completed.size() != parts_produced_) {
        return unexpected{error{error_code::internal_error,
            "collected " + std::to_string(completed.size()) + " parts but produced " +
            std::to_string(parts_produced_)}};
    }

    ctx.total_parts = parts_produced_;
    ctx.bytes = bytes_read_;
    SU_LOG_DEBUG_CTX(log_category::pipeline, "pipeline finished", ctx);
    return completed;
}

auto upload_pipeline::produce(byte_source& source, bounded_channel<upload_part>& parts)
    -> result<void> {
    const auto part_size = static_cast<std::size_t>(settings_.part_size);
    uint32_t part_number = 1;

    for (;;) {
        if (token_->is_cancelled()) {
            return unexpected{cancelled_error()};
        }

        // Hold a queue slot before allocating so a filled buffer always has room
        auto slot = parts.reserve(*token_);
        if (slot.status() == channel_status::cancelled) {
            return unexpected{cancelled_error()};
        }
        if (slot.status() == channel_status::closed) {
            return unexpected{error{error_code::invalid_state, "part channel closed"}};
        }

        byte_buffer buffer(part_size);
        auto read = read_full(source, buffer);
        if (!read) {
            return unexpected{read.error().during("reading data")};
        }
        const auto count = read.value();

        if (count > 0) {
            if (part_number > settings_.max_parts) {
                return unexpected{error{error_code::size_exceeds_limits,
                    "input exceeds " + std::to_string(settings_.max_parts) + " parts of " +
                    format_size(settings_.part_size) + " (declared size " +
                    std::to_string(settings_.total_size) + " bytes)"}.during("reading data")};
            }

            buffer.resize(count);

            // Hash before the part leaves this thread so the digest follows source order
            if (checksum_ != nullptr) {
                if (auto hashed = checksum_->update(buffer); !hashed) {
                    return unexpected{hashed.error().during("hashing data")};
                }
            }
            bytes_read_ += count;

            if (slot.push(upload_part{part_number, std::move(buffer)}) ==
                channel_status::closed) {
                return unexpected{error{error_code::invalid_state, "part channel closed"}};
            }

            SU_LOG_TRACE(log_category::pipeline,
                         "queued part " + std::to_string(part_number) + " (" +
                             std::to_string(count) + " bytes)");
            parts_produced_ = part_number;
            ++part_number;
        }

        if (count < part_size) {
            break;
        }
    }

    if (parts_produced_ == 0) {
        return unexpected{error{error_code::stream_read_error, "input stream is empty"}
                              .during("reading data")};
    }

    if (settings_.total_size != 0 && bytes_read_ != settings_.total_size) {
        SU_LOG_WARN(log_category::pipeline,
                    "read " + std::to_string(bytes_read_) + " bytes but declared size was " +
                        std::to_string(settings_.total_size));
    }
    return {};
}

void upload_pipeline::work(bounded_channel<upload_part>& parts,
                           bounded_channel<part_result>& results) {
    auto publish = [&results](part_result res) {
        if (results.push(std::move(res)) != channel_status::ok) {
            SU_LOG_ERROR(log_category::pipeline, "result channel closed before workers finished");
        }
    };

    while (auto part = parts.pop()) {
        const auto number = part->part_number;

        if (token_->is_cancelled()) {
            publish(part_result::fail(number, cancelled_error()));
            continue;
        }

        const auto started = std::chrono::steady_clock::now();
        auto etag = upload_with_retry(*part);
        if (!etag) {
            publish(part_result::fail(number, etag.error()));
            continue;
        }

        const auto size = static_cast<uint64_t>(part->data.size());
        part->data = byte_buffer{};

        auto totals = progress_.record_part(size);

        transfer_log_context ctx;
        ctx.key = settings_.key;
        ctx.part_number = number;
        ctx.bytes = size;
        ctx.total_bytes = totals.bytes_uploaded;
        ctx.duration_ms = static_cast<uint64_t>(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
        SU_LOG_DEBUG_CTX(log_category::pipeline, "part uploaded", ctx);

        publish(part_result::ok(number, std::move(etag.value())));
    }
}

auto upload_pipeline::upload_with_retry(const upload_part& part) -> result<std::string> {
    const std::function<result<std::string>()> attempt = [this, &part]() -> result<std::string> {
        try {
            return backend_->upload_part(settings_.key, settings_.upload_id, part.part_number,
                                         std::span<const std::byte>(part.data));
        } catch (const std::exception& e) {
            return unexpected{error{error_code::internal_error,
                                    std::string("upload_part threw: ") + e.what()}
                                  .during("UploadPart")};
        }
    };

    const auto observer = [this, &part](uint32_t attempt_index, const error& err,
                                        std::chrono::milliseconds delay) {
        transfer_log_context ctx;
        ctx.key = settings_.key;
        ctx.upload_id = settings_.upload_id;
        ctx.part_number = part.part_number;
        ctx.attempt = attempt_index + 1;
        ctx.duration_ms = static_cast<uint64_t>(delay.count());
        ctx.error_message = err.describe();
        SU_LOG_WARN_CTX(log_category::retry,
                        "part " + std::to_string(part.part_number) + " failed, retrying in " +
                            std::to_string(delay.count()) + " ms",
                        ctx);
    };

    auto res = retry_.execute<std::string>(attempt, *token_, observer);
    if (!res && !is_cancellation(res.error().code)) {
        transfer_log_context ctx;
        ctx.key = settings_.key;
        ctx.upload_id = settings_.upload_id;
        ctx.part_number = part.part_number;
        ctx.error_message = res.error().describe();
        SU_LOG_ERROR_CTX(log_category::retry,
                         "part " + std::to_string(part.part_number) + " failed permanently",
                         ctx);
    }
    return res;
}

auto upload_pipeline::collect(bounded_channel<part_result>& results)
    -> std::vector<completed_part> {
    std::vector<completed_part> completed;

    // Keep draining after a failure; workers would otherwise block on push
    while (auto res = results.pop()) {
        if (!res->succeeded()) {
            fail(res->failure->during("uploading part " + std::to_string(res->part_number)));
            continue;
        }
        if (first_error_.has_error()) {
            continue;
        }
        completed.push_back(completed_part{res->part_number, std::move(res->etag)});
    }

    std::sort(completed.begin(), completed.end(),
              [](const completed_part& a, const completed_part& b) {
                  return a.part_number < b.part_number;
              });
    return completed;
}

void upload_pipeline::fail(error err) {
    if (first_error_.try_set(std::move(err))) {
        token_->cancel();
    }
}

}  // namespace kcenon::streamup
