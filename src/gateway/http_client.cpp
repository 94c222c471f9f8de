/**
 * @file http_client.cpp
 * @brief network_system-backed HTTP client
 */

#include "garage/transfer/gateway/http_client.h"

#include "garage/transfer/config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/core/http_client.h>
#endif

namespace garage::transfer {

// ============================================================================
// Implementation
// ============================================================================

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
        available = false;
#endif
    }

#if KCENON_WITH_NETWORK_SYSTEM
    static auto convert_response(
        const kcenon::network::internal::http_response& resp) -> http_response {
        http_response result;
        result.status_code = resp.status_code;
        result.headers = resp.headers;
        result.body = std::vector<uint8_t>(resp.body.begin(), resp.body.end());
        return result;
    }

    template <typename Response>
    auto finish(Response&& response, const char* method, const std::string& url)
        -> result<http_response> {
        if (response.is_err()) {
            return unexpected{error{error_code::request_failed,
                std::string("HTTP ") + method + " " + url + " failed"}};
        }
        return convert_response(response.value());
    }
#endif

    static auto unavailable() -> result<http_response> {
        return unexpected{error{error_code::backend_unavailable,
            "HTTP client not available (KCENON_WITH_NETWORK_SYSTEM not defined)"}};
    }
};

// ============================================================================
// Constructor / Destructor
// ============================================================================

network_http_client::network_http_client(std::chrono::milliseconds timeout)
    : impl_(std::make_unique<impl>(timeout)) {}

network_http_client::~network_http_client() = default;

// ============================================================================
// HTTP Operations
// ============================================================================

auto network_http_client::get(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->get(url, {}, headers), "GET", url);
#else
    (void)url;
    (void)headers;
    return impl::unavailable();
#endif
}

auto network_http_client::post(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->post(url, body, headers), "POST", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::unavailable();
#endif
}

auto network_http_client::put(
    const std::string& url,
    const std::string& body,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->put(url, body, headers), "PUT", url);
#else
    (void)url;
    (void)body;
    (void)headers;
    return impl::unavailable();
#endif
}

auto network_http_client::del(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->del(url, headers), "DELETE", url);
#else
    (void)url;
    (void)headers;
    return impl::unavailable();
#endif
}

auto network_http_client::head(
    const std::string& url,
    const std::map<std::string, std::string>& headers)
    -> result<http_response> {
#if KCENON_WITH_NETWORK_SYSTEM
    return impl_->finish(impl_->client->head(url, headers), "HEAD", url);
#else
    (void)url;
    (void)headers;
    return impl::unavailable();
#endif
}

auto network_http_client::is_available() const noexcept -> bool {
    return impl_->available;
}

}  // namespace garage::transfer
