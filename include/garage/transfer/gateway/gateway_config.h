/**
 * @file gateway_config.h
 * @brief Configuration for the S3-compatible gateway
 *
 * Holds endpoint, credentials, retry policy and multipart thresholds for
 * s3_gateway. Use gateway_config_builder to assemble a configuration.
 */

#ifndef GARAGE_TRANSFER_GATEWAY_GATEWAY_CONFIG_H
#define GARAGE_TRANSFER_GATEWAY_GATEWAY_CONFIG_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace garage::transfer {

/**
 * @brief Retry policy for gateway requests
 */
struct retry_policy {
    /// Maximum number of attempts, including the first one
    std::size_t max_attempts = 3;

    /// Initial delay between retries
    std::chrono::milliseconds initial_delay{200};

    /// Maximum delay between retries
    std::chrono::milliseconds max_delay{5000};

    /// Multiplier for exponential backoff
    double backoff_multiplier = 2.0;

    /// Add jitter to retry delays
    bool use_jitter = true;

    /// Retry on 429 and 503
    bool retry_on_rate_limit = true;

    /// Retry when no response was received
    bool retry_on_connection_error = true;

    /// Retry on server errors (5xx)
    bool retry_on_server_error = true;
};

/**
 * @brief Multipart upload settings
 */
struct multipart_settings {
    /// Enable multipart upload
    bool enabled = true;

    /// Objects of at least this size use multipart upload (default: 8MB)
    uint64_t threshold = 8 * 1024 * 1024;

    /// Size of every part but the last (default: 8MB, S3 minimum is 5MB)
    uint64_t part_size = 8 * 1024 * 1024;
};

/**
 * @brief Static access key pair
 */
struct static_credentials {
    /// Access key ID
    std::string access_key_id;

    /// Secret access key
    std::string secret_access_key;

    /// Optional session token (for temporary credentials)
    std::optional<std::string> session_token;
};

/**
 * @brief S3-compatible gateway configuration
 */
struct s3_gateway_config {
    /// Endpoint URL, e.g. "http://localhost:3900"
    std::string endpoint;

    /// Signing region ("garage" for Garage clusters)
    std::string region = "garage";

    /// Use path-style URLs (endpoint/bucket/key)
    bool use_path_style = true;

    /// Enable SSL/TLS
    bool use_ssl = true;

    /// Request timeout
    std::chrono::milliseconds request_timeout{30000};

    static_credentials credentials;

    retry_policy retry;

    multipart_settings multipart;

    /// Chunk size used when streaming downloads into a sink
    std::size_t download_chunk_size = 64 * 1024;
};

/**
 * @brief Fluent builder for s3_gateway_config
 *
 * @code
 * auto config = gateway_config_builder()
 *     .with_endpoint("http://localhost:3900")
 *     .with_credentials("GK...", "secret")
 *     .build();
 * @endcode
 */
class gateway_config_builder {
public:
    auto with_endpoint(const std::string& endpoint) -> gateway_config_builder& {
        config_.endpoint = endpoint;
        if (endpoint.rfind("http://", 0) == 0) {
            config_.use_ssl = false;
        } else if (endpoint.rfind("https://", 0) == 0) {
            config_.use_ssl = true;
        }
        return *this;
    }

    auto with_region(const std::string& region) -> gateway_config_builder& {
        config_.region = region;
        return *this;
    }

    auto with_credentials(const std::string& access_key_id,
                          const std::string& secret_access_key)
        -> gateway_config_builder& {
        config_.credentials.access_key_id = access_key_id;
        config_.credentials.secret_access_key = secret_access_key;
        return *this;
    }

    auto with_session_token(const std::string& token) -> gateway_config_builder& {
        config_.credentials.session_token = token;
        return *this;
    }

    auto with_path_style(bool enable) -> gateway_config_builder& {
        config_.use_path_style = enable;
        return *this;
    }

    auto with_request_timeout(std::chrono::milliseconds timeout) -> gateway_config_builder& {
        config_.request_timeout = timeout;
        return *this;
    }

    auto with_retry_policy(const retry_policy& policy) -> gateway_config_builder& {
        config_.retry = policy;
        return *this;
    }

    auto with_multipart(uint64_t threshold, uint64_t part_size) -> gateway_config_builder& {
        config_.multipart.threshold = threshold;
        config_.multipart.part_size = part_size;
        return *this;
    }

    [[nodiscard]] auto build() const -> s3_gateway_config {
        return config_;
    }

private:
    s3_gateway_config config_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GATEWAY_GATEWAY_CONFIG_H
