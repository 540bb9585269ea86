/**
 * @file http_client.h
 * @brief HTTP transport used by the S3 backend
 * @version 0.1.0
 *
 * Wraps the network_system HTTP client behind a small interface so the S3
 * backend can be exercised against a scripted transport in tests.
 */

#ifndef KCENON_STREAMUP_BACKEND_HTTP_CLIENT_H
#define KCENON_STREAMUP_BACKEND_HTTP_CLIENT_H

#include "kcenon/streamup/core/types.h"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::streamup {

/**
 * @brief HTTP response
 */
struct http_response {
    /// HTTP status code
    int status_code = 0;

    /// Response headers
    std::map<std::string, std::string> headers;

    /// Response body
    std::vector<uint8_t> body;

    [[nodiscard]] auto body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string value) {
            std::transform(value.begin(), value.end(), value.begin(),
                           [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
            return value;
        };
        auto wanted = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == wanted) {
                return v;
            }
        }
        return std::nullopt;
    }
};

using http_headers = std::map<std::string, std::string>;

/**
 * @brief Abstract HTTP transport
 *
 * Implementations return a response for every HTTP status; only transport
 * failures (no response at all) are reported as errors.
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(const std::string& url,
                                   const std::map<std::string, std::string>& query,
                                   const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto post(const std::string& url,
                                    const std::string& body,
                                    const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(const std::string& url,
                                   const std::string& body,
                                   const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto del(const std::string& url,
                                   const http_headers& headers) -> result<http_response> = 0;

    [[nodiscard]] virtual auto head(const std::string& url,
                                    const http_headers& headers) -> result<http_response> = 0;
};

/**
 * @brief Error for a request that produced no HTTP response
 *
 * @param method HTTP method
 * @param url Request URL
 * @param cause Message from the transport library (may be empty)
 */
[[nodiscard]] auto http_transport_error(const std::string& method, const std::string& url,
                                        const std::string& cause) -> error;

/**
 * @brief HTTP client backed by network_system
 *
 * Without network_system every request fails with transport_unavailable.
 *
 * @note Thread-safe for concurrent requests.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;

    [[nodiscard]] auto get(const std::string& url,
                           const std::map<std::string, std::string>& query,
                           const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto post(const std::string& url,
                            const std::string& body,
                            const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto put(const std::string& url,
                           const std::string& body,
                           const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto del(const std::string& url,
                           const http_headers& headers) -> result<http_response> override;

    [[nodiscard]] auto head(const std::string& url,
                            const http_headers& headers) -> result<http_response> override;

    /**
     * @brief Whether a real transport was compiled in
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Create the default HTTP client
 */
[[nodiscard]] auto make_http_client(
    std::chrono::milliseconds timeout = std::chrono::milliseconds(30000))
    -> std::shared_ptr<http_client_interface>;

}  // namespace kcenon::streamup

#endif  // KCENON_STREAMUP_BACKEND_HTTP_CLIENT_H
