/**
 * @file gateway_utils.cpp
 * @brief Encoding, hashing, time and XML helpers for the S3 gateway
 */

#include "garage/transfer/gateway/gateway_utils.h"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>
#include <stdexcept>

#include <openssl/evp.h>
#include <openssl/hmac.h>
#include <openssl/sha.h>

namespace garage::transfer::gateway_utils {

// ============================================================================
// Encoding Utilities
// ============================================================================

auto bytes_to_hex(const std::vector<uint8_t>& bytes) -> std::string {
    std::ostringstream oss;
    for (auto byte : bytes) {
        oss << std::hex << std::setfill('0') << std::setw(2)
            << static_cast<int>(byte);
    }
    return oss.str();
}

auto url_encode(const std::string& value, bool encode_slash) -> std::string {
    std::ostringstream escaped;
    escaped.fill('0');
    escaped << std::hex << std::uppercase;

    for (char c : value) {
        if (std::isalnum(static_cast<unsigned char>(c)) ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            escaped << c;
        } else if (c == '/' && !encode_slash) {
            escaped << c;
        } else {
            escaped << '%' << std::setw(2)
                    << static_cast<int>(static_cast<unsigned char>(c));
        }
    }

    return escaped.str();
}

// ============================================================================
// Cryptographic Utilities
// ============================================================================

auto sha256(const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> hash(SHA256_DIGEST_LENGTH);
    SHA256(reinterpret_cast<const unsigned char*>(data.data()),
           data.size(),
           hash.data());
    return hash;
}

auto sha256_hex(const std::string& data) -> std::string {
    return bytes_to_hex(sha256(data));
}

auto hmac_sha256(const std::vector<uint8_t>& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> result(EVP_MAX_MD_SIZE);
    unsigned int len = 0;

    HMAC(EVP_sha256(),
         key.data(),
         static_cast<int>(key.size()),
         reinterpret_cast<const unsigned char*>(data.data()),
         data.size(),
         result.data(),
         &len);

    result.resize(len);
    return result;
}

auto hmac_sha256(const std::string& key,
                 const std::string& data) -> std::vector<uint8_t> {
    std::vector<uint8_t> key_bytes(key.begin(), key.end());
    return hmac_sha256(key_bytes, data);
}

// ============================================================================
// Time Utilities
// ============================================================================

namespace {

auto to_utc_tm(std::chrono::system_clock::time_point time) -> std::tm {
    auto time_t = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &time_t);
#else
    gmtime_r(&time_t, &tm);
#endif
    return tm;
}

}  // namespace

auto format_amz_date(std::chrono::system_clock::time_point time) -> std::string {
    auto tm = to_utc_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%dT%H%M%SZ");
    return oss.str();
}

auto format_date_stamp(std::chrono::system_clock::time_point time) -> std::string {
    auto tm = to_utc_tm(time);
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y%m%d");
    return oss.str();
}

// ============================================================================
// XML Utilities
// ============================================================================

auto extract_xml_element(const std::string& xml,
                         const std::string& tag) -> std::optional<std::string> {
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    auto start_pos = xml.find(open_tag);
    if (start_pos == std::string::npos) {
        return std::nullopt;
    }
    start_pos += open_tag.length();

    auto end_pos = xml.find(close_tag, start_pos);
    if (end_pos == std::string::npos) {
        return std::nullopt;
    }

    return xml.substr(start_pos, end_pos - start_pos);
}

auto extract_xml_elements(const std::string& xml,
                          const std::string& tag) -> std::vector<std::string> {
    std::vector<std::string> elements;
    std::string open_tag = "<" + tag + ">";
    std::string close_tag = "</" + tag + ">";

    std::size_t pos = 0;
    while ((pos = xml.find(open_tag, pos)) != std::string::npos) {
        auto content_start = pos + open_tag.length();
        auto end_pos = xml.find(close_tag, content_start);
        if (end_pos == std::string::npos) {
            break;
        }
        elements.push_back(xml.substr(content_start, end_pos - content_start));
        pos = end_pos + close_tag.length();
    }

    return elements;
}

auto xml_unescape(const std::string& text) -> std::string {
    std::string result;
    result.reserve(text.size());

    std::size_t i = 0;
    while (i < text.size()) {
        if (text[i] != '&') {
            result += text[i++];
            continue;
        }

        auto semicolon = text.find(';', i);
        if (semicolon == std::string::npos) {
            result += text[i++];
            continue;
        }

        auto entity = text.substr(i + 1, semicolon - i - 1);
        if (entity == "amp") {
            result += '&';
        } else if (entity == "lt") {
            result += '<';
        } else if (entity == "gt") {
            result += '>';
        } else if (entity == "quot") {
            result += '"';
        } else if (entity == "apos") {
            result += '\'';
        } else if (entity.size() > 1 && entity[0] == '#') {
            unsigned long code = 0;
            try {
                code = (entity[1] == 'x' || entity[1] == 'X')
                           ? std::stoul(entity.substr(2), nullptr, 16)
                           : std::stoul(entity.substr(1), nullptr, 10);
            } catch (const std::exception&) {
                result += text.substr(i, semicolon - i + 1);
                i = semicolon + 1;
                continue;
            }
            // UTF-8 encode the code point
            if (code < 0x80) {
                result += static_cast<char>(code);
            } else if (code < 0x800) {
                result += static_cast<char>(0xC0 | (code >> 6));
                result += static_cast<char>(0x80 | (code & 0x3F));
            } else if (code < 0x10000) {
                result += static_cast<char>(0xE0 | (code >> 12));
                result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                result += static_cast<char>(0x80 | (code & 0x3F));
            } else {
                result += static_cast<char>(0xF0 | (code >> 18));
                result += static_cast<char>(0x80 | ((code >> 12) & 0x3F));
                result += static_cast<char>(0x80 | ((code >> 6) & 0x3F));
                result += static_cast<char>(0x80 | (code & 0x3F));
            }
        } else {
            result += text.substr(i, semicolon - i + 1);
        }
        i = semicolon + 1;
    }

    return result;
}

// ============================================================================
// Retry Policy Utilities
// ============================================================================

auto calculate_retry_delay(const retry_policy& policy,
                           std::size_t attempt) -> std::chrono::milliseconds {
    auto delay = static_cast<double>(policy.initial_delay.count());

    for (std::size_t i = 1; i < attempt; ++i) {
        delay *= policy.backoff_multiplier;
    }

    delay = std::min(delay, static_cast<double>(policy.max_delay.count()));

    if (policy.use_jitter) {
        thread_local std::mt19937 gen(std::random_device{}());
        std::uniform_real_distribution<> dis(0.5, 1.5);
        delay *= dis(gen);
    }

    return std::chrono::milliseconds(static_cast<int64_t>(delay));
}

auto is_retryable_status(int status_code,
                         const retry_policy& policy) -> bool {
    // Rate limiting
    if (policy.retry_on_rate_limit && (status_code == 429 || status_code == 503)) {
        return true;
    }

    // Server errors
    if (policy.retry_on_server_error && status_code >= 500 && status_code < 600) {
        return true;
    }

    return false;
}

}  // namespace garage::transfer::gateway_utils
