/**
 * @file http_client.cpp
 * @brief network_system HTTP client adapter
 * @version 0.1.0
 */

#include "kcenon/streamup/backend/http_client.h"

#include "kcenon/streamup/config/feature_flags.h"

#include <string>
#include <utility>

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace kcenon::streamup {

auto http_transport_error(const std::string& method, const std::string& url,
                          const std::string& cause) -> error {
    std::string message = "HTTP " + method + " " + url + " failed";
    if (!cause.empty()) {
        message += ": " + cause;
    }
    return error{error_code::network_error, std::move(message)};
}

namespace {

[[maybe_unused]] auto transport_missing() -> error {
    return error{error_code::transport_unavailable,
                 "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"};
}

}  // namespace

struct network_http_client::impl {
#if KCENON_WITH_NETWORK_SYSTEM
    std::shared_ptr<kcenon::network::core::http_client> client;
#endif
    bool available = false;

    explicit impl(std::chrono::milliseconds timeout) {
#if KCENON_WITH_NETWORK_SYSTEM
        client = std::make_shared<kcenon::network::core::http_client>(timeout);
        available = true;
#else
        (void)timeout;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert(const kcenon::network::internal::http_response& resp) -> http_response {
        http_response out;
        out.status_code = resp.status_code;
        out.headers = resp.headers;
        out.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return out;
    }
#endif
};

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

auto network_http_client::get(const std::string& url,
                              const std::map<std::string, std::string>& query,
                              const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->get(url, query, headers);
    if (response.is_err()) {
        return unexpected{http_transport_error("GET", url, response.error().message)};
    }
    return impl::convert(response.value());
#else
    (void)url;
    (void)query;
    (void)headers;
    return unexpected{transport_missing()};
#endif
}

auto network_http_client::post(const std::string& url,
                               const std::string& body,
                               const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->post(url, body, headers);
    if (response.is_err()) {
        return unexpected{http_transport_error("POST", url, response.error().message)};
    }
    return impl::convert(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{transport_missing()};
#endif
}

auto network_http_client::put(const std::string& url,
                              const std::string& body,
                              const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->put(url, body, headers);
    if (response.is_err()) {
        return unexpected{http_transport_error("PUT", url, response.error().message)};
    }
    return impl::convert(response.value());
#else
    (void)url;
    (void)body;
    (void)headers;
    return unexpected{transport_missing()};
#endif
}

auto network_http_client::del(const std::string& url,
                              const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->del(url, headers);
    if (response.is_err()) {
        return unexpected{http_transport_error("DELETE", url, response.error().message)};
    }
    return impl::convert(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{transport_missing()};
#endif
}

auto network_http_client::head(const std::string& url,
                               const http_headers& headers) -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    auto response = impl_->client->head(url, headers);
    if (response.is_err()) {
        return unexpected{http_transport_error("HEAD", url, response.error().message)};
    }
    return impl::convert(response.value());
#else
    (void)url;
    (void)headers;
    return unexpected{transport_missing()};
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

auto make_http_client(std::chrono::milliseconds timeout)
    -> std::shared_ptr<http_client_interface> {
    return std::make_shared<network_http_client>(timeout);
}

}  // namespace kcenon::streamup
