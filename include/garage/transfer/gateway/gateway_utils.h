/**
 * @file gateway_utils.h
 * @brief Encoding, hashing, time and XML helpers for the S3 gateway
 */

#ifndef GARAGE_TRANSFER_GATEWAY_GATEWAY_UTILS_H
#define GARAGE_TRANSFER_GATEWAY_GATEWAY_UTILS_H

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "gateway_config.h"

namespace garage::transfer::gateway_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

/**
 * @brief Convert bytes to lowercase hex
 */
[[nodiscard]] auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string;

/**
 * @brief Percent-encode per RFC 3986 with uppercase hex digits
 * @param value String to encode
 * @param encode_slash Whether '/' is encoded too
 */
[[nodiscard]] auto url_encode(const std::string& value, bool encode_slash = true)
    -> std::string;

// ============================================================================
// Cryptographic Utilities
// ============================================================================

[[nodiscard]] auto sha256(const std::string& data) -> std::vector<uint8_t>;

[[nodiscard]] auto sha256_hex(const std::string& data) -> std::string;

[[nodiscard]] auto hmac_sha256(const std::vector<uint8_t>& key,
                               const std::string& data) -> std::vector<uint8_t>;

[[nodiscard]] auto hmac_sha256(const std::string& key,
                               const std::string& data) -> std::vector<uint8_t>;

// ============================================================================
// Time Utilities
// ============================================================================

/**
 * @brief Format as ISO 8601 basic (YYYYMMDDTHHMMSSZ), UTC
 */
[[nodiscard]] auto format_amz_date(std::chrono::system_clock::time_point time)
    -> std::string;

/**
 * @brief Format as YYYYMMDD, UTC
 */
[[nodiscard]] auto format_date_stamp(std::chrono::system_clock::time_point time)
    -> std::string;

// ============================================================================
// XML Utilities
// ============================================================================

/**
 * @brief Text of the first <tag>...</tag> element, not unescaped
 */
[[nodiscard]] auto extract_xml_element(const std::string& xml, const std::string& tag)
    -> std::optional<std::string>;

/**
 * @brief Text of every <tag>...</tag> element in document order
 */
[[nodiscard]] auto extract_xml_elements(const std::string& xml, const std::string& tag)
    -> std::vector<std::string>;

/**
 * @brief Replace the five predefined XML entities and numeric references
 */
[[nodiscard]] auto xml_unescape(const std::string& text) -> std::string;

// ============================================================================
// Retry Policy Utilities
// ============================================================================

/**
 * @brief Delay before the given retry attempt (1-based)
 */
[[nodiscard]] auto calculate_retry_delay(const retry_policy& policy, std::size_t attempt)
    -> std::chrono::milliseconds;

/**
 * @brief Whether a response status is worth retrying under the policy
 */
[[nodiscard]] auto is_retryable_status(int status_code, const retry_policy& policy) -> bool;

}  // namespace garage::transfer::gateway_utils

#endif  // GARAGE_TRANSFER_GATEWAY_GATEWAY_UTILS_H
