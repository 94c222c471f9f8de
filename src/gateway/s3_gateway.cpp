/**
 * @file s3_gateway.cpp
 * @brief S3-compatible gateway implementation
 */

#include "garage/transfer/gateway/s3_gateway.h"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <thread>
#include <vector>

#include "garage/transfer/core/logging.h"
#include "garage/transfer/gateway/gateway_utils.h"
#include "garage/transfer/gateway/s3_signer.h"

namespace garage::transfer {

using namespace gateway_utils;

namespace {

constexpr std::chrono::seconds max_presign_expiry{7 * 24 * 3600};

enum class http_method { get, post, put, del, head };

auto method_name(http_method method) -> const char* {
    switch (method) {
        case http_method::get:
            return "GET";
        case http_method::post:
            return "POST";
        case http_method::put:
            return "PUT";
        case http_method::del:
            return "DELETE";
        case http_method::head:
            return "HEAD";
        default:
            return "GET";
    }
}

auto parse_uint64(const std::string& text) -> std::optional<uint64_t> {
    if (text.empty() ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    try {
        return static_cast<uint64_t>(std::stoull(text));
    } catch (const std::out_of_range&) {
        return std::nullopt;
    }
}

auto read_exact(std::istream& source, uint64_t count, std::string& out) -> bool {
    out.resize(static_cast<std::size_t>(count));
    if (count == 0) {
        return true;
    }
    source.read(out.data(), static_cast<std::streamsize>(count));
    return static_cast<uint64_t>(source.gcount()) == count;
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct s3_gateway::impl {
    s3_gateway_config config;
    endpoint_info endpoint;
    std::unique_ptr<s3_signer> signer;
    std::shared_ptr<http_client_interface> http;

    [[nodiscard]] auto object_path(const std::string& bucket, const std::string& key) const
        -> std::string {
        std::string path = "/" + url_encode(bucket);
        if (!key.empty()) {
            path += "/" + url_encode(key, false);
        }
        return path;
    }

    [[nodiscard]] auto build_url(const std::string& path,
                                 const std::map<std::string, std::string>& query) const
        -> std::string {
        std::string url = endpoint.scheme() + "://" + endpoint.host_header() + path;
        if (!query.empty()) {
            url += "?" + s3_signer::canonical_query_string(query);
        }
        return url;
    }

    auto send(http_method method,
              const std::string& url,
              const std::string& body,
              const std::map<std::string, std::string>& headers) -> result<http_response> {
        switch (method) {
            case http_method::get:
                return http->get(url, headers);
            case http_method::post:
                return http->post(url, body, headers);
            case http_method::put:
                return http->put(url, body, headers);
            case http_method::del:
                return http->del(url, headers);
            case http_method::head:
                return http->head(url, headers);
            default:
                return unexpected{error{error_code::internal_error, "Unknown HTTP method"}};
        }
    }

    /**
     * @brief Sign and send a request, retrying per the retry policy
     *
     * Returns the last response received, whatever its status; an error
     * only when no response could be obtained.
     */
    auto execute(http_method method,
                 const std::string& path,
                 const std::map<std::string, std::string>& query,
                 const std::string& body,
                 const std::map<std::string, std::string>& signed_extra = {})
        -> result<http_response> {
        const auto url = build_url(path, query);
        const auto payload_hash = sha256_hex(body);
        const auto max_attempts = std::max<std::size_t>(config.retry.max_attempts, 1);

        for (std::size_t attempt = 1;; ++attempt) {
            auto headers = signer->sign_request(method_name(method), path, query,
                                                payload_hash, signed_extra,
                                                std::chrono::system_clock::now());

            auto response = send(method, url, body, headers);
            if (!response) {
                if (response.error().code == error_code::backend_unavailable ||
                    !config.retry.retry_on_connection_error || attempt >= max_attempts) {
                    return response;
                }
                GT_LOG_DEBUG(log_category::gateway,
                             std::string(method_name(method)) + " " + path +
                                 " got no response, retrying (attempt " +
                                 std::to_string(attempt) + ")");
            } else if (is_retryable_status(response.value().status_code, config.retry) &&
                       attempt < max_attempts) {
                GT_LOG_DEBUG(log_category::gateway,
                             std::string(method_name(method)) + " " + path + " returned " +
                                 std::to_string(response.value().status_code) +
                                 ", retrying (attempt " + std::to_string(attempt) + ")");
            } else {
                return response;
            }

            std::this_thread::sleep_for(calculate_retry_delay(config.retry, attempt));
        }
    }

    auto abort_multipart(const std::string& path, const std::string& upload_id) -> void {
        auto response = execute(http_method::del, path, {{"uploadId", upload_id}}, "");
        if (!response || !response.value().is_success()) {
            GT_LOG_WARN(log_category::gateway,
                        "Failed to abort multipart upload " + upload_id + " for " + path);
        }
    }

    auto put_single(const std::string& bucket, const std::string& key,
                    std::istream& source, uint64_t size,
                    const byte_progress_callback& on_progress) -> result<uint64_t> {
        std::string body;
        if (!read_exact(source, size, body)) {
            return unexpected{error{error_code::file_read_error,
                "Short read while uploading " + key}};
        }

        auto path = object_path(bucket, key);
        auto response = execute(http_method::put, path, {}, body);
        if (!response) {
            return unexpected{response.error()};
        }
        if (!response.value().is_success()) {
            return unexpected{map_error_response(response.value().status_code,
                                                 response.value().get_body_string(),
                                                 "PUT " + bucket + "/" + key)};
        }

        if (on_progress) {
            on_progress(size, size);
        }
        return size;
    }

    auto put_multipart(const std::string& bucket, const std::string& key,
                       std::istream& source, uint64_t size,
                       const byte_progress_callback& on_progress) -> result<uint64_t> {
        auto path = object_path(bucket, key);
        const auto context = "multipart upload of " + bucket + "/" + key;

        auto initiated = execute(http_method::post, path, {{"uploads", ""}}, "");
        if (!initiated) {
            return unexpected{initiated.error()};
        }
        if (!initiated.value().is_success()) {
            return unexpected{map_error_response(initiated.value().status_code,
                                                 initiated.value().get_body_string(),
                                                 "Initiate " + context)};
        }
        auto upload_id = extract_xml_element(initiated.value().get_body_string(), "UploadId");
        if (!upload_id || upload_id->empty()) {
            return unexpected{error{error_code::response_parse_error,
                "No UploadId in response to initiate " + context}};
        }

        const auto part_size = std::max<uint64_t>(config.multipart.part_size, 1);
        std::vector<std::pair<int, std::string>> parts;
        uint64_t sent = 0;
        int part_number = 0;

        while (sent < size) {
            ++part_number;
            auto chunk = std::min(part_size, size - sent);

            std::string body;
            if (!read_exact(source, chunk, body)) {
                abort_multipart(path, *upload_id);
                return unexpected{error{error_code::file_read_error,
                    "Short read while uploading " + key}};
            }

            auto response = execute(http_method::put, path,
                                    {{"partNumber", std::to_string(part_number)},
                                     {"uploadId", *upload_id}},
                                    body);
            if (!response || !response.value().is_success()) {
                abort_multipart(path, *upload_id);
                if (!response) {
                    return unexpected{response.error()};
                }
                return unexpected{map_error_response(
                    response.value().status_code, response.value().get_body_string(),
                    "Part " + std::to_string(part_number) + " of " + context)};
            }

            auto etag = response.value().get_header("ETag");
            if (!etag) {
                abort_multipart(path, *upload_id);
                return unexpected{error{error_code::response_parse_error,
                    "No ETag for part " + std::to_string(part_number) + " of " + context}};
            }

            parts.emplace_back(part_number, *etag);
            sent += chunk;
            if (on_progress) {
                on_progress(sent, size);
            }
        }

        std::ostringstream complete_body;
        complete_body << "<CompleteMultipartUpload>";
        for (const auto& [number, etag] : parts) {
            complete_body << "<Part><PartNumber>" << number << "</PartNumber>"
                          << "<ETag>" << etag << "</ETag></Part>";
        }
        complete_body << "</CompleteMultipartUpload>";

        auto completed = execute(http_method::post, path, {{"uploadId", *upload_id}},
                                 complete_body.str());
        if (!completed) {
            abort_multipart(path, *upload_id);
            return unexpected{completed.error()};
        }

        // Complete may report failure inside a 200 response
        auto completed_body = completed.value().get_body_string();
        if (!completed.value().is_success() ||
            completed_body.find("<Error>") != std::string::npos) {
            abort_multipart(path, *upload_id);
            auto status = completed.value().is_success() ? 500 : completed.value().status_code;
            return unexpected{map_error_response(status, completed_body, "Complete " + context)};
        }

        GT_LOG_DEBUG(log_category::gateway,
                     "Completed " + context + " in " + std::to_string(parts.size()) + " parts");
        return sent;
    }
};

// ============================================================================
// Construction
// ============================================================================

s3_gateway::s3_gateway() : impl_(std::make_unique<impl>()) {}

s3_gateway::~s3_gateway() = default;

auto s3_gateway::create(const s3_gateway_config& config,
                        std::shared_ptr<http_client_interface> http)
    -> result<std::unique_ptr<s3_gateway>> {
    if (config.endpoint.empty()) {
        return unexpected{error{error_code::configuration_error, "S3 endpoint is empty"}};
    }
    if (config.credentials.access_key_id.empty() ||
        config.credentials.secret_access_key.empty()) {
        return unexpected{error{error_code::configuration_error,
            "S3 access key and secret key are required"}};
    }
    if (config.multipart.enabled && config.multipart.part_size < 5 * 1024 * 1024) {
        return unexpected{error{error_code::configuration_error,
            "Multipart part size must be at least 5MB"}};
    }

    auto endpoint = parse_endpoint(config.endpoint);
    if (!endpoint) {
        return unexpected{endpoint.error()};
    }

    std::unique_ptr<s3_gateway> gateway(new s3_gateway());
    gateway->impl_->config = config;
    gateway->impl_->config.region = config.region.empty() ? "garage" : config.region;
    gateway->impl_->endpoint = endpoint.value();
    gateway->impl_->signer = std::make_unique<s3_signer>(
        config.credentials, gateway->impl_->config.region, endpoint.value().host_header());
    gateway->impl_->http = http ? std::move(http)
                                : std::make_shared<network_http_client>(config.request_timeout);

    GT_LOG_DEBUG(log_category::gateway,
                 "S3 gateway for " + endpoint.value().scheme() + "://" +
                     endpoint.value().host_header() + " (region " +
                     gateway->impl_->config.region + ")");
    return result<std::unique_ptr<s3_gateway>>(std::move(gateway));
}

auto s3_gateway::config() const -> const s3_gateway_config& {
    return impl_->config;
}

// ============================================================================
// Object Store Operations
// ============================================================================

auto s3_gateway::list_page(const std::string& bucket,
                           const std::string& prefix,
                           const std::optional<std::string>& continuation_token)
    -> result<list_page_result> {
    std::map<std::string, std::string> query{{"list-type", "2"}};
    if (!prefix.empty()) {
        query["prefix"] = prefix;
    }
    if (continuation_token) {
        query["continuation-token"] = *continuation_token;
    }

    auto response = impl_->execute(http_method::get, impl_->object_path(bucket, ""), query, "");
    if (!response) {
        return unexpected{response.error()};
    }
    if (!response.value().is_success()) {
        return unexpected{map_error_response(response.value().status_code,
                                             response.value().get_body_string(),
                                             "List " + bucket + "/" + prefix)};
    }

    return parse_list_objects_response(response.value().get_body_string());
}

auto s3_gateway::get_object(const std::string& bucket,
                            const std::string& key,
                            std::ostream& sink,
                            const byte_progress_callback& on_progress) -> result<uint64_t> {
    auto response = impl_->execute(http_method::get, impl_->object_path(bucket, key), {}, "");
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (!resp.is_success()) {
        return unexpected{map_error_response(resp.status_code, resp.get_body_string(),
                                             "GET " + bucket + "/" + key)};
    }

    const uint64_t total = resp.body.size();
    const auto chunk_size = std::max<std::size_t>(impl_->config.download_chunk_size, 1);
    uint64_t written = 0;

    while (written < total) {
        auto chunk = static_cast<std::size_t>(std::min<uint64_t>(chunk_size, total - written));
        sink.write(reinterpret_cast<const char*>(resp.body.data() + written),
                   static_cast<std::streamsize>(chunk));
        if (!sink) {
            return unexpected{error{error_code::file_write_error,
                "Failed writing " + key + " after " + std::to_string(written) + " bytes"}};
        }
        written += chunk;
        if (on_progress) {
            on_progress(written, total);
        }
    }

    sink.flush();
    if (!sink) {
        return unexpected{error{error_code::file_write_error, "Failed flushing " + key}};
    }
    if (total == 0 && on_progress) {
        on_progress(0, 0);
    }
    return written;
}

auto s3_gateway::put_object(const std::string& bucket,
                            const std::string& key,
                            std::istream& source,
                            uint64_t size,
                            const byte_progress_callback& on_progress) -> result<uint64_t> {
    if (impl_->config.multipart.enabled && size >= impl_->config.multipart.threshold &&
        size > 0) {
        return impl_->put_multipart(bucket, key, source, size, on_progress);
    }
    return impl_->put_single(bucket, key, source, size, on_progress);
}

auto s3_gateway::delete_object(const std::string& bucket,
                               const std::string& key) -> result<void> {
    auto response = impl_->execute(http_method::del, impl_->object_path(bucket, key), {}, "");
    if (!response) {
        return unexpected{response.error()};
    }

    // Deleting an absent key is not an error in S3
    const auto status = response.value().status_code;
    if (response.value().is_success() || status == 404) {
        return result<void>{};
    }
    return unexpected{map_error_response(status, response.value().get_body_string(),
                                         "DELETE " + bucket + "/" + key)};
}

auto s3_gateway::head_object(const std::string& bucket,
                             const std::string& key) -> result<object_summary> {
    auto response = impl_->execute(http_method::head, impl_->object_path(bucket, key), {}, "");
    if (!response) {
        return unexpected{response.error()};
    }
    const auto& resp = response.value();
    if (resp.status_code == 404) {
        return unexpected{error{error_code::object_not_found,
            "Object not found: " + bucket + "/" + key}};
    }
    if (!resp.is_success()) {
        return unexpected{map_error_response(resp.status_code, resp.get_body_string(),
                                             "HEAD " + bucket + "/" + key)};
    }

    object_summary summary;
    summary.key = key;
    if (auto length = resp.get_header("Content-Length")) {
        summary.size = parse_uint64(*length).value_or(0);
    }
    summary.etag = resp.get_header("ETag").value_or("");
    summary.last_modified = resp.get_header("Last-Modified").value_or("");
    return summary;
}

auto s3_gateway::presign(const std::string& bucket,
                         const std::string& key,
                         presign_method method,
                         std::chrono::seconds expires) -> result<std::string> {
    if (expires.count() < 1 || expires > max_presign_expiry) {
        return unexpected{error{error_code::invalid_argument,
            "Presign expiry must be between 1 second and 7 days, got " +
                std::to_string(expires.count())}};
    }
    if (key.empty()) {
        return unexpected{error{error_code::invalid_object_key, "Cannot presign an empty key"}};
    }

    auto url = impl_->signer->presign_url(std::string(to_string(method)),
                                          impl_->endpoint.scheme(),
                                          impl_->object_path(bucket, key), expires,
                                          std::chrono::system_clock::now());
    GT_LOG_DEBUG(log_category::gateway,
                 "Presigned " + std::string(to_string(method)) + " " + url);
    return url;
}

// ============================================================================
// Response Parsing
// ============================================================================

auto s3_gateway::parse_list_objects_response(const std::string& xml)
    -> result<list_page_result> {
    if (xml.find("<ListBucketResult") == std::string::npos) {
        return unexpected{error{error_code::response_parse_error,
            "Response is not a ListBucketResult document"}};
    }

    list_page_result page;
    for (const auto& contents : extract_xml_elements(xml, "Contents")) {
        object_summary summary;

        auto key = extract_xml_element(contents, "Key");
        if (!key) {
            return unexpected{error{error_code::response_parse_error,
                "Listing entry without Key"}};
        }
        summary.key = xml_unescape(*key);

        auto size = extract_xml_element(contents, "Size");
        auto parsed_size = size ? parse_uint64(*size) : std::nullopt;
        if (!parsed_size) {
            return unexpected{error{error_code::response_parse_error,
                "Invalid Size for key " + summary.key}};
        }
        summary.size = *parsed_size;

        summary.etag = xml_unescape(extract_xml_element(contents, "ETag").value_or(""));
        summary.last_modified = extract_xml_element(contents, "LastModified").value_or("");
        page.objects.push_back(std::move(summary));
    }

    auto truncated = extract_xml_element(xml, "IsTruncated");
    if (truncated && *truncated == "true") {
        auto token = extract_xml_element(xml, "NextContinuationToken");
        if (!token || token->empty()) {
            return unexpected{error{error_code::response_parse_error,
                "Truncated listing without NextContinuationToken"}};
        }
        page.next_token = xml_unescape(*token);
    }

    return page;
}

auto s3_gateway::map_error_response(int status_code,
                                    const std::string& body,
                                    const std::string& context) -> error {
    auto code = extract_xml_element(body, "Code").value_or("");
    auto message = xml_unescape(extract_xml_element(body, "Message").value_or(""));

    std::string text = context + " failed: HTTP " + std::to_string(status_code);
    if (!code.empty()) {
        text += " " + code;
    }
    if (!message.empty()) {
        text += " (" + message + ")";
    }

    if (status_code == 403) {
        return error{error_code::access_denied, text};
    }
    if (status_code == 404) {
        if (code == "NoSuchBucket") {
            return error{error_code::bucket_not_found, text};
        }
        return error{error_code::object_not_found, text};
    }
    return error{error_code::request_failed, text};
}

}  // namespace garage::transfer
