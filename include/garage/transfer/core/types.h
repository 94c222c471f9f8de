/**
 * @file types.h
 * @brief Core error and result types for garage_transfer
 */

#ifndef GARAGE_TRANSFER_CORE_TYPES_H
#define GARAGE_TRANSFER_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace garage::transfer {

/**
 * @brief Error codes for transfer operations
 *
 * Codes are grouped in ranges so callers can classify an error with the
 * is_*_error helpers below.
 */
enum class error_code {
    success = 0,

    // Configuration errors (-100 to -119)
    configuration_error = -100,
    missing_environment = -101,
    invalid_argument = -102,

    // Guard errors (-120 to -139)
    confirmation_required = -120,

    // Enumeration errors (-140 to -159)
    enumeration_error = -140,

    // Item transfer errors (-160 to -199)
    item_transfer_failed = -160,
    object_not_found = -161,
    bucket_not_found = -162,
    access_denied = -163,
    file_read_error = -164,
    file_write_error = -165,
    invalid_object_key = -166,

    // Backend errors (-200 to -219)
    backend_unavailable = -200,
    request_failed = -201,
    response_parse_error = -202,

    // Internal errors (-220 to -239)
    internal_error = -220,
    not_initialized = -221,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::configuration_error:
            return "configuration error";
        case error_code::missing_environment:
            return "missing environment variable";
        case error_code::invalid_argument:
            return "invalid argument";
        case error_code::confirmation_required:
            return "confirmation required";
        case error_code::enumeration_error:
            return "enumeration error";
        case error_code::item_transfer_failed:
            return "item transfer failed";
        case error_code::object_not_found:
            return "object not found";
        case error_code::bucket_not_found:
            return "bucket not found";
        case error_code::access_denied:
            return "access denied";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::invalid_object_key:
            return "invalid object key";
        case error_code::backend_unavailable:
            return "backend unavailable";
        case error_code::request_failed:
            return "request failed";
        case error_code::response_parse_error:
            return "response parse error";
        case error_code::internal_error:
            return "internal error";
        case error_code::not_initialized:
            return "not initialized";
        default:
            return "unknown error";
    }
}

[[nodiscard]] constexpr auto is_configuration_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -100 && value > -120;
}

[[nodiscard]] constexpr auto is_guard_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -120 && value > -140;
}

[[nodiscard]] constexpr auto is_enumeration_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -140 && value > -160;
}

[[nodiscard]] constexpr auto is_item_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -160 && value > -200;
}

[[nodiscard]] constexpr auto is_backend_error(error_code code) -> bool {
    auto value = static_cast<int>(code);
    return value <= -200 && value > -220;
}

/**
 * @brief Error type with code, message and optional affected item count
 *
 * affected_count is set by guards that refuse an operation after counting
 * what it would have touched.
 */
struct error {
    error_code code;
    std::string message;
    std::optional<uint64_t> affected_count;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}
    error(error_code c, std::string msg, uint64_t affected)
        : code(c), message(std::move(msg)), affected_count(affected) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Contains either a value of type T or an error, similar to
 * std::expected.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_TYPES_H
