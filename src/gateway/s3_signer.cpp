/**
 * @file s3_signer.cpp
 * @brief AWS Signature Version 4 implementation
 */

#include "garage/transfer/gateway/s3_signer.h"

#include <algorithm>
#include <cctype>
#include <sstream>

#include "garage/transfer/gateway/gateway_utils.h"

namespace garage::transfer {

using namespace gateway_utils;

namespace {

constexpr const char* signing_algorithm = "AWS4-HMAC-SHA256";

auto to_lower(std::string value) -> std::string {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return value;
}

auto trim(const std::string& value) -> std::string {
    auto start = value.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t");
    return value.substr(start, end - start + 1);
}

}  // namespace

auto parse_endpoint(const std::string& endpoint) -> result<endpoint_info> {
    endpoint_info info;
    std::string url = endpoint;

    // Check protocol
    if (url.rfind("https://", 0) == 0) {
        info.use_ssl = true;
        url = url.substr(8);
    } else if (url.rfind("http://", 0) == 0) {
        info.use_ssl = false;
        url = url.substr(7);
    }

    auto slash_pos = url.find('/');
    if (slash_pos != std::string::npos) {
        url = url.substr(0, slash_pos);
    }

    // Parse host and port
    auto colon_pos = url.find(':');
    if (colon_pos != std::string::npos) {
        info.host = url.substr(0, colon_pos);
        info.port = url.substr(colon_pos + 1);
    } else {
        info.host = url;
        info.port = info.use_ssl ? "443" : "80";
    }

    if (info.host.empty()) {
        return unexpected{error{error_code::configuration_error,
            "Endpoint has no host: '" + endpoint + "'"}};
    }
    if (info.port.empty() ||
        !std::all_of(info.port.begin(), info.port.end(),
                     [](unsigned char c) { return std::isdigit(c); })) {
        return unexpected{error{error_code::configuration_error,
            "Endpoint has an invalid port: '" + endpoint + "'"}};
    }

    return info;
}

s3_signer::s3_signer(static_credentials credentials, std::string region, std::string host)
    : credentials_(std::move(credentials)),
      region_(std::move(region)),
      host_(std::move(host)) {}

auto s3_signer::canonical_query_string(
    const std::map<std::string, std::string>& query) -> std::string {
    std::map<std::string, std::string> encoded;
    for (const auto& [k, v] : query) {
        encoded[url_encode(k)] = url_encode(v);
    }

    std::ostringstream oss;
    bool first = true;
    for (const auto& [k, v] : encoded) {
        if (!first) oss << "&";
        oss << k << "=" << v;
        first = false;
    }
    return oss.str();
}

auto s3_signer::credential_scope(const std::string& date_stamp) const -> std::string {
    return date_stamp + "/" + region_ + "/s3/aws4_request";
}

auto s3_signer::signature(const std::string& date_stamp,
                          const std::string& amz_date,
                          const std::string& canonical_request) const -> std::string {
    std::ostringstream string_to_sign;
    string_to_sign << signing_algorithm << "\n";
    string_to_sign << amz_date << "\n";
    string_to_sign << credential_scope(date_stamp) << "\n";
    string_to_sign << sha256_hex(canonical_request);

    auto k_date = hmac_sha256("AWS4" + credentials_.secret_access_key, date_stamp);
    auto k_region = hmac_sha256(k_date, region_);
    auto k_service = hmac_sha256(k_region, "s3");
    auto k_signing = hmac_sha256(k_service, "aws4_request");
    return bytes_to_hex(hmac_sha256(k_signing, string_to_sign.str()));
}

auto s3_signer::sign_request(
    const std::string& method,
    const std::string& canonical_uri,
    const std::map<std::string, std::string>& query,
    const std::string& payload_hash,
    const std::map<std::string, std::string>& signed_extra,
    std::chrono::system_clock::time_point now) const
    -> std::map<std::string, std::string> {
    std::string amz_date = format_amz_date(now);
    std::string date_stamp = format_date_stamp(now);

    std::map<std::string, std::string> headers = signed_extra;
    headers["Host"] = host_;
    headers["x-amz-date"] = amz_date;
    headers["x-amz-content-sha256"] = payload_hash;
    if (credentials_.session_token.has_value()) {
        headers["x-amz-security-token"] = credentials_.session_token.value();
    }

    // Create canonical headers (sorted by lowercase key)
    std::map<std::string, std::string> sorted_headers;
    for (const auto& [k, v] : headers) {
        sorted_headers[to_lower(k)] = trim(v);
    }

    std::ostringstream canonical_headers;
    std::ostringstream signed_headers_builder;
    bool first = true;
    for (const auto& [k, v] : sorted_headers) {
        canonical_headers << k << ":" << v << "\n";
        if (!first) signed_headers_builder << ";";
        signed_headers_builder << k;
        first = false;
    }
    std::string signed_headers = signed_headers_builder.str();

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << canonical_uri << "\n";
    canonical_request << canonical_query_string(query) << "\n";
    canonical_request << canonical_headers.str() << "\n";
    canonical_request << signed_headers << "\n";
    canonical_request << payload_hash;

    std::ostringstream auth_header;
    auth_header << signing_algorithm << " ";
    auth_header << "Credential=" << credentials_.access_key_id << "/"
                << credential_scope(date_stamp) << ", ";
    auth_header << "SignedHeaders=" << signed_headers << ", ";
    auth_header << "Signature=" << signature(date_stamp, amz_date, canonical_request.str());

    headers["Authorization"] = auth_header.str();
    return headers;
}

auto s3_signer::presign_url(
    const std::string& method,
    const std::string& scheme,
    const std::string& canonical_uri,
    std::chrono::seconds expires,
    std::chrono::system_clock::time_point now) const -> std::string {
    std::string amz_date = format_amz_date(now);
    std::string date_stamp = format_date_stamp(now);

    std::map<std::string, std::string> query;
    query["X-Amz-Algorithm"] = signing_algorithm;
    query["X-Amz-Credential"] = credentials_.access_key_id + "/" + credential_scope(date_stamp);
    query["X-Amz-Date"] = amz_date;
    query["X-Amz-Expires"] = std::to_string(expires.count());
    query["X-Amz-SignedHeaders"] = "host";
    if (credentials_.session_token.has_value()) {
        query["X-Amz-Security-Token"] = credentials_.session_token.value();
    }

    std::string query_string = canonical_query_string(query);

    std::ostringstream canonical_request;
    canonical_request << method << "\n";
    canonical_request << canonical_uri << "\n";
    canonical_request << query_string << "\n";
    canonical_request << "host:" << host_ << "\n";
    canonical_request << "\n";
    canonical_request << "host\n";
    canonical_request << "UNSIGNED-PAYLOAD";

    std::ostringstream url_builder;
    url_builder << scheme << "://" << host_ << canonical_uri;
    url_builder << "?" << query_string;
    url_builder << "&X-Amz-Signature="
                << signature(date_stamp, amz_date, canonical_request.str());
    return url_builder.str();
}

}  // namespace garage::transfer
