/**
 * @file http_client.h
 * @brief HTTP client seam used by the S3 gateway
 *
 * network_http_client wraps the network_system HTTP client. Without
 * network_system every request fails with backend_unavailable. Tests
 * substitute their own http_client_interface.
 */

#ifndef GARAGE_TRANSFER_GATEWAY_HTTP_CLIENT_H
#define GARAGE_TRANSFER_GATEWAY_HTTP_CLIENT_H

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "garage/transfer/core/types.h"

// Forward declaration for network_system HTTP client
namespace kcenon::network::core {
class http_client;
}

namespace garage::transfer {

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

    [[nodiscard]] auto get_body_string() const -> std::string {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Get header value by key (case-insensitive)
     */
    [[nodiscard]] auto get_header(const std::string& key) const
        -> std::optional<std::string> {
        auto it = headers.find(key);
        if (it != headers.end()) {
            return it->second;
        }

        auto lower = [](std::string s) {
            std::transform(s.begin(), s.end(), s.begin(),
                           [](unsigned char c) { return std::tolower(c); });
            return s;
        };
        auto lower_key = lower(key);
        for (const auto& [k, v] : headers) {
            if (lower(k) == lower_key) {
                return v;
            }
        }
        return std::nullopt;
    }

    [[nodiscard]] auto is_success() const noexcept -> bool {
        return status_code >= 200 && status_code < 300;
    }
};

/**
 * @brief Abstract HTTP client
 *
 * URLs passed in carry their query string already encoded. An error
 * result means no response was received (connection failure, timeout).
 */
class http_client_interface {
public:
    virtual ~http_client_interface() = default;

    [[nodiscard]] virtual auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto del(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;

    [[nodiscard]] virtual auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> = 0;
};

/**
 * @brief http_client_interface backed by network_system
 *
 * @note This client is thread-safe for concurrent operations.
 */
class network_http_client : public http_client_interface {
public:
    explicit network_http_client(
        std::chrono::milliseconds timeout = std::chrono::milliseconds(30000));

    ~network_http_client() override;

    network_http_client(const network_http_client&) = delete;
    auto operator=(const network_http_client&) -> network_http_client& = delete;

    [[nodiscard]] auto get(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto post(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto put(
        const std::string& url,
        const std::string& body,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto del(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    [[nodiscard]] auto head(
        const std::string& url,
        const std::map<std::string, std::string>& headers)
        -> result<http_response> override;

    /**
     * @brief Check if the HTTP client is available
     * @return true if network_system is available, false otherwise
     */
    [[nodiscard]] auto is_available() const noexcept -> bool;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GATEWAY_HTTP_CLIENT_H
