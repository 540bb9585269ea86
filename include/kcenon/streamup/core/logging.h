// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

#include "kcenon/streamup/config/feature_flags.h"

#if KCENON_WITH_LOGGER_SYSTEM
#define STREAMUP_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::streamup {

/**
 * @brief Log categories for streamup
 */
struct log_category {
    static constexpr std::string_view upload = "streamup.upload";
    static constexpr std::string_view pipeline = "streamup.pipeline";
    static constexpr std::string_view retry = "streamup.retry";
    static constexpr std::string_view download = "streamup.download";
    static constexpr std::string_view backend = "streamup.backend";
    static constexpr std::string_view maintenance = "streamup.maintenance";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

/**
 * @brief Convert log level to string
 */
inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Configuration for credential masking
 */
struct masking_config {
    bool mask_signatures = true;
    bool mask_access_keys = true;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Redacts credentials from log messages
 *
 * Signature and session-token values are replaced entirely. Access key ids
 * (both those embedded in "Credential=" scopes and those registered with
 * add_secret()) keep their first visible_chars characters.
 */
class secret_masker {
public:
    explicit secret_masker(masking_config config = masking_config::all_masked())
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.mask_signatures && !config_.mask_access_keys) {
            return input;
        }

        std::string result = input;

        if (config_.mask_signatures) {
            result = mask_signature_values(result);
        }

        if (config_.mask_access_keys) {
            result = mask_credential_scopes(result);
            for (const auto& secret : secrets_) {
                result = replace_all(result, secret, mask_value(secret));
            }
        }

        return result;
    }

    /**
     * @brief Mask a single value, keeping a short visible prefix
     */
    [[nodiscard]] auto mask_value(const std::string& value) const -> std::string {
        if (value.size() <= config_.visible_chars) {
            return std::string(value.size(), config_.mask_char[0]);
        }
        return value.substr(0, config_.visible_chars) +
               std::string(value.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Register a literal secret (access key id, secret key) to redact
     */
    void add_secret(std::string secret) {
        if (secret.empty()) {
            return;
        }
        if (std::find(secrets_.begin(), secrets_.end(), secret) == secrets_.end()) {
            secrets_.push_back(std::move(secret));
        }
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_signature_values(const std::string& input) const -> std::string {
        static const std::regex signature_pattern(
            R"((Signature=|X-Amz-Signature=|x-amz-security-token[:=]\s*)([A-Za-z0-9/+=%]+))",
            std::regex::icase);
        return std::regex_replace(input, signature_pattern, "$1[REDACTED]");
    }

    [[nodiscard]] auto mask_credential_scopes(const std::string& input) const -> std::string {
        static const std::regex credential_pattern(R"(Credential=([A-Za-z0-9]+)/)");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), credential_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, static_cast<size_t>(match.position()) - last_pos);
            result += "Credential=" + mask_value(match[1].str()) + "/";
            last_pos = static_cast<size_t>(match.position() + match.length());
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] static auto replace_all(std::string input,
                                          const std::string& needle,
                                          const std::string& replacement) -> std::string {
        size_t pos = 0;
        while ((pos = input.find(needle, pos)) != std::string::npos) {
            input.replace(pos, needle.size(), replacement);
            pos += replacement.size();
        }
        return input;
    }

    masking_config config_;
    std::vector<std::string> secrets_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for transfer operations
 */
struct transfer_log_context {
    std::string key;
    std::string upload_id;
    std::optional<uint32_t> part_number;
    std::optional<uint32_t> total_parts;
    std::optional<uint32_t> attempt;
    std::optional<uint64_t> bytes;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> part_size;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const secret_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!key.empty()) add_field("key", key);
        if (!upload_id.empty()) add_field("upload_id", upload_id);
        if (part_number) add_uint("part_number", *part_number);
        if (total_parts) add_uint("total_parts", *total_parts);
        if (attempt) add_uint("attempt", *attempt);
        if (bytes) add_uint("bytes", *bytes);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (part_size) add_uint("part_size", *part_size);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const secret_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::upload)
 *     .with_message("Upload completed")
 *     .with_key("backups/db.tar.zst")
 *     .with_upload_id("2~abc")
 *     .with_total_bytes(73400320)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_key(std::string_view key) -> log_entry_builder& {
        ensure_context();
        entry_.context->key = std::string(key);
        return *this;
    }

    auto with_upload_id(std::string_view id) -> log_entry_builder& {
        ensure_context();
        entry_.context->upload_id = std::string(id);
        return *this;
    }

    auto with_part_number(uint32_t part) -> log_entry_builder& {
        ensure_context();
        entry_.context->part_number = part;
        return *this;
    }

    auto with_attempt(uint32_t attempt) -> log_entry_builder& {
        ensure_context();
        entry_.context->attempt = attempt;
        return *this;
    }

    auto with_total_bytes(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->total_bytes = bytes;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context();
        entry_.context->duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Traditional text format
    json    ///< JSON lines
};

/**
 * @brief Process-wide logger used by every streamup component
 */
class streamup_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view,
                                            const transfer_log_context*)>;

    streamup_logger() = default;
    ~streamup_logger() = default;

    streamup_logger(const streamup_logger&) = delete;
    streamup_logger& operator=(const streamup_logger&) = delete;

    /**
     * @brief Initialize the logger backend
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef STREAMUP_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef STREAMUP_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef STREAMUP_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    /**
     * @brief Register a credential that must never be logged in clear text
     */
    void register_secret(std::string secret) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.add_secret(std::move(secret));
    }

    /**
     * @brief Install a callback that receives every emitted record
     *
     * The message passed to the callback is already masked.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the stderr fallback sink (callbacks still fire)
     */
    void set_console_output(bool enabled) {
        console_output_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        secret_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string masked = current_masker.mask(std::string(message));

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, masked, context);
            }
        }

        std::string line_out;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            line_out = builder.build().to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << masked;
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            line_out = oss.str();
        }

        emit(level, line_out, file, line, function);
    }

    void flush() {
#ifdef STREAMUP_USE_LOGGER_SYSTEM
        std::lock_guard<std::mutex> lock(backend_mutex_);
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              const std::string& text,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#ifdef STREAMUP_USE_LOGGER_SYSTEM
        {
            std::lock_guard<std::mutex> lock(backend_mutex_);
            if (logger_) {
                if (file && line > 0 && function) {
                    logger_->log(to_logger_level(level), text, file, line, function);
                } else {
                    logger_->log(to_logger_level(level), text);
                }
                return;
            }
        }
#endif
        if (!console_output_.load()) {
            return;
        }
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_timestamp() << " [" << log_level_to_string(level) << "] "
                  << text << "\n";
    }

#ifdef STREAMUP_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
    std::mutex backend_mutex_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> console_output_{true};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    secret_masker masker_;
    mutable std::mutex config_mutex_;
};

/**
 * @brief Get global logger instance
 */
inline streamup_logger& get_logger() {
    static streamup_logger instance;
    return instance;
}

// Logging macros for convenience
#define SU_LOG(level, category, message) \
    kcenon::streamup::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define SU_LOG_CTX(level, category, message, context) \
    kcenon::streamup::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define SU_LOG_TRACE(category, message) \
    SU_LOG(kcenon::streamup::log_level::trace, category, message)

#define SU_LOG_DEBUG(category, message) \
    SU_LOG(kcenon::streamup::log_level::debug, category, message)

#define SU_LOG_INFO(category, message) \
    SU_LOG(kcenon::streamup::log_level::info, category, message)

#define SU_LOG_WARN(category, message) \
    SU_LOG(kcenon::streamup::log_level::warn, category, message)

#define SU_LOG_ERROR(category, message) \
    SU_LOG(kcenon::streamup::log_level::error, category, message)

#define SU_LOG_DEBUG_CTX(category, message, ctx) \
    SU_LOG_CTX(kcenon::streamup::log_level::debug, category, message, ctx)

#define SU_LOG_INFO_CTX(category, message, ctx) \
    SU_LOG_CTX(kcenon::streamup::log_level::info, category, message, ctx)

#define SU_LOG_WARN_CTX(category, message, ctx) \
    SU_LOG_CTX(kcenon::streamup::log_level::warn, category, message, ctx)

#define SU_LOG_ERROR_CTX(category, message, ctx) \
    SU_LOG_CTX(kcenon::streamup::log_level::error, category, message, ctx)

}  // namespace kcenon::streamup
