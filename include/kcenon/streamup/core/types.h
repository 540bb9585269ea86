/**
 * @file types.h
 * @brief Core type definitions for streamup
 */

#ifndef KCENON_STREAMUP_CORE_TYPES_H
#define KCENON_STREAMUP_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief Error codes for streaming transfer operations
 *
 * Error code ranges:
 * - -100 to -119: Configuration / validation errors
 * - -120 to -139: Local I/O errors
 * - -140 to -159: Transport errors
 * - -160 to -179: Backend (service) errors
 * - -180 to -189: Cancellation
 * - -200 to -219: Internal errors
 */
enum class error_code : int32_t {
    success = 0,

    // Configuration errors (-100 to -119)
    invalid_configuration = -100,
    missing_field = -101,
    invalid_service_limits = -102,
    size_exceeds_limits = -103,
    invalid_object_key = -104,
    invalid_metadata = -105,
    unsupported_checksum = -106,

    // Local I/O errors (-120 to -139)
    stream_read_error = -120,
    stream_write_error = -121,
    file_open_error = -122,

    // Transport errors (-140 to -159)
    connection_failed = -140,
    connection_timeout = -141,
    connection_reset = -142,
    connection_refused = -143,
    network_error = -144,
    transport_unavailable = -145,

    // Backend errors (-160 to -179)
    backend_error = -160,
    service_unavailable = -161,
    throttled = -162,
    request_timeout = -163,
    internal_service_error = -164,
    object_not_found = -165,
    upload_not_found = -166,
    access_denied = -167,
    invalid_response = -168,

    // Cancellation (-180 to -189)
    cancelled = -180,
    deadline_exceeded = -181,

    // Internal errors (-200 to -219)
    internal_error = -200,
    invalid_state = -201,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::missing_field:
            return "missing required field";
        case error_code::invalid_service_limits:
            return "invalid service limits";
        case error_code::size_exceeds_limits:
            return "size exceeds service limits";
        case error_code::invalid_object_key:
            return "invalid object key";
        case error_code::invalid_metadata:
            return "invalid metadata";
        case error_code::unsupported_checksum:
            return "unsupported checksum algorithm";
        case error_code::stream_read_error:
            return "stream read error";
        case error_code::stream_write_error:
            return "stream write error";
        case error_code::file_open_error:
            return "file open error";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_reset:
            return "connection reset";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::network_error:
            return "network error";
        case error_code::transport_unavailable:
            return "transport unavailable";
        case error_code::backend_error:
            return "backend error";
        case error_code::service_unavailable:
            return "service unavailable";
        case error_code::throttled:
            return "request throttled";
        case error_code::request_timeout:
            return "request timeout";
        case error_code::internal_service_error:
            return "internal service error";
        case error_code::object_not_found:
            return "object not found";
        case error_code::upload_not_found:
            return "upload not found";
        case error_code::access_denied:
            return "access denied";
        case error_code::invalid_response:
            return "invalid response";
        case error_code::cancelled:
            return "cancelled";
        case error_code::deadline_exceeded:
            return "deadline exceeded";
        case error_code::internal_error:
            return "internal error";
        case error_code::invalid_state:
            return "invalid state";
        default:
            return "unknown error";
    }
}

/**
 * @brief Check if error code is in the configuration range
 */
[[nodiscard]] constexpr auto is_config_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is a local I/O error
 */
[[nodiscard]] constexpr auto is_io_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -120 && v >= -139;
}

/**
 * @brief Check if error code is a transport error
 */
[[nodiscard]] constexpr auto is_transport_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -140 && v >= -159;
}

/**
 * @brief Check if error code is a backend error
 */
[[nodiscard]] constexpr auto is_backend_error(error_code code) noexcept -> bool {
    auto v = static_cast<int32_t>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Check if error code represents cancellation
 */
[[nodiscard]] constexpr auto is_cancellation(error_code code) noexcept -> bool {
    return code == error_code::cancelled || code == error_code::deadline_exceeded;
}

/**
 * @brief Error type carrying code, message and remote context
 *
 * Backend failures keep the HTTP status and the service error code
 * (e.g. "SlowDown") so the retry policy can classify them.
 */
struct error {
    error_code code;
    std::string message;
    int http_status = 0;
    std::string service_code;
    std::string operation;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }

    /**
     * @brief Attach the failing operation name
     */
    [[nodiscard]] auto during(std::string op) const -> error {
        auto copy = *this;
        copy.operation = std::move(op);
        return copy;
    }

    /**
     * @brief Human-readable description including the operation
     */
    [[nodiscard]] auto describe() const -> std::string {
        std::string cause = message.empty() ? std::string(to_string(code)) : message;
        if (!service_code.empty()) {
            cause += " (" + service_code + ")";
        }
        if (operation.empty()) {
            return cause;
        }
        return "upload error during " + operation + ": " + cause;
    }
};

/**
 * @brief Build a configuration error for a named field
 */
[[nodiscard]] inline auto validation_error(error_code code,
                                           std::string_view field,
                                           std::string_view message) -> error {
    return error{code, "validation error for " + std::string(field) + ": " +
                           std::string(message)};
}

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/// Owned chunk of bytes
using byte_buffer = std::vector<std::byte>;

/// Size constants
inline constexpr uint64_t kib = 1024ULL;
inline constexpr uint64_t mib = 1024ULL * kib;
inline constexpr uint64_t gib = 1024ULL * mib;

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_CORE_TYPES_H
