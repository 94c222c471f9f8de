/**
 * @file s3_signer.h
 * @brief AWS Signature Version 4 signing for S3 requests and presigned URLs
 *
 * The signer is stateless apart from its credentials and region, so one
 * instance can be shared by every worker thread. The signing time is a
 * parameter to make signatures reproducible.
 */

#ifndef GARAGE_TRANSFER_GATEWAY_S3_SIGNER_H
#define GARAGE_TRANSFER_GATEWAY_S3_SIGNER_H

#include <chrono>
#include <map>
#include <string>

#include "garage/transfer/core/types.h"
#include "gateway_config.h"

namespace garage::transfer {

/**
 * @brief Parsed endpoint URL
 */
struct endpoint_info {
    std::string host;
    std::string port;
    bool use_ssl = true;

    [[nodiscard]] auto scheme() const -> std::string {
        return use_ssl ? "https" : "http";
    }

    /**
     * @brief Value of the Host header, with the port when it is not the
     *        scheme default
     */
    [[nodiscard]] auto host_header() const -> std::string {
        if (port.empty() || (use_ssl && port == "443") || (!use_ssl && port == "80")) {
            return host;
        }
        return host + ":" + port;
    }
};

/**
 * @brief Split an endpoint URL into scheme, host and port
 * @return endpoint_info, or configuration_error when no host is present
 */
[[nodiscard]] auto parse_endpoint(const std::string& endpoint) -> result<endpoint_info>;

/**
 * @brief SigV4 signer bound to one credential pair, region and host
 */
class s3_signer {
public:
    s3_signer(static_credentials credentials, std::string region, std::string host);

    /**
     * @brief Compute the headers that authenticate a request
     * @param method HTTP method
     * @param canonical_uri Already percent-encoded path, e.g. "/bucket/a%20b.txt"
     * @param query Query parameters, unencoded
     * @param payload_hash Hex SHA-256 of the body, or "UNSIGNED-PAYLOAD"
     * @param signed_extra Additional headers to sign and send (e.g. Range)
     * @param now Signing time
     * @return Headers to send: Host, x-amz-date, x-amz-content-sha256,
     *         optional x-amz-security-token, the extra headers and Authorization
     */
    [[nodiscard]] auto sign_request(
        const std::string& method,
        const std::string& canonical_uri,
        const std::map<std::string, std::string>& query,
        const std::string& payload_hash,
        const std::map<std::string, std::string>& signed_extra,
        std::chrono::system_clock::time_point now) const
        -> std::map<std::string, std::string>;

    /**
     * @brief Build a presigned URL with query-string authentication
     * @param method "GET" or "PUT"
     * @param scheme "http" or "https"
     * @param canonical_uri Already percent-encoded path
     * @param expires Validity in seconds
     * @param now Signing time
     */
    [[nodiscard]] auto presign_url(
        const std::string& method,
        const std::string& scheme,
        const std::string& canonical_uri,
        std::chrono::seconds expires,
        std::chrono::system_clock::time_point now) const -> std::string;

    /**
     * @brief Sorted, percent-encoded query string as SigV4 expects it
     */
    [[nodiscard]] static auto canonical_query_string(
        const std::map<std::string, std::string>& query) -> std::string;

    [[nodiscard]] auto host() const -> const std::string& { return host_; }

private:
    [[nodiscard]] auto credential_scope(const std::string& date_stamp) const -> std::string;
    [[nodiscard]] auto signature(const std::string& date_stamp,
                                 const std::string& amz_date,
                                 const std::string& canonical_request) const -> std::string;

    static_credentials credentials_;
    std::string region_;
    std::string host_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GATEWAY_S3_SIGNER_H
