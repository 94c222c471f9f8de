/**
 * @file s3_gateway.h
 * @brief S3-compatible object store gateway (Garage, MinIO, AWS S3)
 *
 * Path-style addressing, SigV4-signed requests, ListObjectsV2 paging,
 * multipart upload above a size threshold and retry with exponential
 * backoff on throttling, server errors and connection failures.
 */

#ifndef GARAGE_TRANSFER_GATEWAY_S3_GATEWAY_H
#define GARAGE_TRANSFER_GATEWAY_S3_GATEWAY_H

#include <memory>
#include <string>

#include "gateway_config.h"
#include "http_client.h"
#include "object_store_gateway.h"

namespace garage::transfer {

/**
 * @brief object_store_gateway speaking the S3 REST protocol
 *
 * @code
 * auto gateway = s3_gateway::create(config);
 * if (!gateway) {
 *     // handle configuration error
 * }
 * auto page = gateway.value()->list_page("photos", "2024/", std::nullopt);
 * @endcode
 *
 * @note Thread-safe: the gateway holds no per-request state.
 */
class s3_gateway : public object_store_gateway {
public:
    /**
     * @brief Create a gateway
     * @param config Endpoint, credentials and tuning
     * @param http HTTP client to use; a network_http_client when null
     * @return Gateway, or configuration_error for an unusable configuration
     */
    [[nodiscard]] static auto create(
        const s3_gateway_config& config,
        std::shared_ptr<http_client_interface> http = nullptr)
        -> result<std::unique_ptr<s3_gateway>>;

    ~s3_gateway() override;

    s3_gateway(const s3_gateway&) = delete;
    auto operator=(const s3_gateway&) -> s3_gateway& = delete;

    [[nodiscard]] auto list_page(
        const std::string& bucket,
        const std::string& prefix,
        const std::optional<std::string>& continuation_token)
        -> result<list_page_result> override;

    /**
     * @note The HTTP client returns whole bodies, so the object is held in
     *       memory and progress is reported while it is copied to the sink.
     */
    [[nodiscard]] auto get_object(
        const std::string& bucket,
        const std::string& key,
        std::ostream& sink,
        const byte_progress_callback& on_progress) -> result<uint64_t> override;

    [[nodiscard]] auto put_object(
        const std::string& bucket,
        const std::string& key,
        std::istream& source,
        uint64_t size,
        const byte_progress_callback& on_progress) -> result<uint64_t> override;

    [[nodiscard]] auto delete_object(
        const std::string& bucket,
        const std::string& key) -> result<void> override;

    [[nodiscard]] auto head_object(
        const std::string& bucket,
        const std::string& key) -> result<object_summary> override;

    [[nodiscard]] auto presign(
        const std::string& bucket,
        const std::string& key,
        presign_method method,
        std::chrono::seconds expires) -> result<std::string> override;

    [[nodiscard]] auto config() const -> const s3_gateway_config&;

    /**
     * @brief Parse a ListObjectsV2 response body
     * @return Page, or response_parse_error for a malformed document
     */
    [[nodiscard]] static auto parse_list_objects_response(const std::string& xml)
        -> result<list_page_result>;

    /**
     * @brief Turn a non-2xx response into an error
     * @param status_code HTTP status
     * @param body Response body, usually an S3 <Error> document
     * @param context Operation description for the message
     */
    [[nodiscard]] static auto map_error_response(int status_code,
                                                 const std::string& body,
                                                 const std::string& context) -> error;

private:
    s3_gateway();

    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GATEWAY_S3_GATEWAY_H
