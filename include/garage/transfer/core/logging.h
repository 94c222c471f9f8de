// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

#include "garage/transfer/config/feature_flags.h"

#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace garage::transfer {

/**
 * @brief Log categories for garage_transfer
 */
struct log_category {
    static constexpr std::string_view gateway = "garage.gateway";
    static constexpr std::string_view enumerator = "garage.enumerator";
    static constexpr std::string_view runner = "garage.runner";
    static constexpr std::string_view orchestrator = "garage.orchestrator";
    static constexpr std::string_view config = "garage.config";
    static constexpr std::string_view cli = "garage.cli";
};

/**
 * @brief Log levels
 */
enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Parse a level name such as "debug" or "WARN"
 */
inline auto parse_log_level(std::string_view name) -> std::optional<log_level> {
    std::string lower(name);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "trace") return log_level::trace;
    if (lower == "debug") return log_level::debug;
    if (lower == "info") return log_level::info;
    if (lower == "warn" || lower == "warning") return log_level::warn;
    if (lower == "error") return log_level::error;
    if (lower == "fatal") return log_level::fatal;
    return std::nullopt;
}

/**
 * @brief Configuration for sensitive information masking
 *
 * Credentials are masked by default: access key ids and request
 * signatures must never reach a log sink in clear text.
 */
struct masking_config {
    bool mask_credentials = true;
    bool mask_paths = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks credentials and local paths in log text
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config{})
        : config_(std::move(config)) {}

    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        std::string result = input;
        if (config_.mask_credentials) {
            result = mask_credentials(result);
        }
        if (config_.mask_paths) {
            result = mask_file_paths(result);
        }
        return result;
    }

    /**
     * @brief Keep the first visible_chars characters of a secret
     */
    [[nodiscard]] auto mask_secret(const std::string& secret) const -> std::string {
        if (!config_.mask_credentials || secret.empty()) {
            return secret;
        }
        if (secret.size() <= config_.visible_chars) {
            return std::string(secret.size(), config_.mask_char[0]);
        }
        return secret.substr(0, config_.visible_chars) +
               std::string(secret.size() - config_.visible_chars, config_.mask_char[0]);
    }

    /**
     * @brief Mask every directory component of a path, keep the file name
     */
    [[nodiscard]] auto mask_path(const std::string& path) const -> std::string {
        if (!config_.mask_paths || path.empty()) {
            return path;
        }

        auto last_sep = path.find_last_of("/\\");
        if (last_sep == std::string::npos) {
            return path;
        }

        std::string masked_dir(last_sep, config_.mask_char[0]);
        return masked_dir + "/" + path.substr(last_sep + 1);
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    [[nodiscard]] auto mask_credentials(const std::string& input) const -> std::string {
        static const std::regex secret_pattern(
            R"((X-Amz-Signature=|Signature=|Credential=|X-Amz-Credential=)([A-Za-z0-9+]+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), secret_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            const auto& match = *it;
            result += input.substr(last_pos, match.position() - last_pos);
            result += match[1].str();
            result += mask_secret(match[2].str());
            last_pos = match.position() + match.length();
        }
        result += input.substr(last_pos);

        return result;
    }

    [[nodiscard]] auto mask_file_paths(const std::string& input) const -> std::string {
        static const std::regex path_pattern(
            R"((?:\/[a-zA-Z0-9._-]+){2,}|(?:[a-zA-Z]:\\(?:[a-zA-Z0-9._-]+\\?)+))");

        std::string result;
        std::sregex_iterator it(input.begin(), input.end(), path_pattern);
        std::sregex_iterator end;

        size_t last_pos = 0;
        for (; it != end; ++it) {
            result += input.substr(last_pos, it->position() - last_pos);
            result += mask_path(it->str());
            last_pos = it->position() + it->length();
        }
        result += input.substr(last_pos);

        return result;
    }

    masking_config config_;
};

namespace detail {

inline auto escape_json_string(const std::string& input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured log context for transfer operations
 */
struct transfer_log_context {
    std::string operation;
    std::string bucket;
    std::string key;
    std::optional<std::string> local_path;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint64_t> total_bytes;
    std::optional<uint64_t> item_count;
    std::optional<uint64_t> duration_ms;
    std::optional<int> status_code;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json_string(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!operation.empty()) add_field("operation", operation);
        if (!bucket.empty()) add_field("bucket", bucket);
        if (!key.empty()) add_field("key", key);
        if (local_path) {
            add_field("local_path", masker ? masker->mask_path(*local_path) : *local_path);
        }
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (total_bytes) add_uint("total_bytes", *total_bytes);
        if (item_count) add_uint("item_count", *item_count);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (status_code) add_uint("status_code", static_cast<uint64_t>(*status_code));
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const
        -> std::string {
        std::ostringstream oss;
        oss << "{";

        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json_string(msg) << "\"";

        if (context) {
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{";
            oss << "\"file\":\"" << detail::escape_json_string(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::orchestrator)
 *     .with_message("Upload completed")
 *     .with_bucket("backups")
 *     .with_key("photos/a.jpg")
 *     .with_bytes_transferred(1048576)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_operation(std::string_view operation) -> log_entry_builder& {
        ensure_context();
        entry_.context->operation = std::string(operation);
        return *this;
    }

    auto with_bucket(std::string_view bucket) -> log_entry_builder& {
        ensure_context();
        entry_.context->bucket = std::string(bucket);
        return *this;
    }

    auto with_key(std::string_view key) -> log_entry_builder& {
        ensure_context();
        entry_.context->key = std::string(key);
        return *this;
    }

    auto with_bytes_transferred(uint64_t bytes) -> log_entry_builder& {
        ensure_context();
        entry_.context->bytes_transferred = bytes;
        return *this;
    }

    auto with_item_count(uint64_t count) -> log_entry_builder& {
        ensure_context();
        entry_.context->item_count = count;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context();
        entry_.context->error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function)
        -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    void ensure_context() {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class transfer_logger;

transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,
    json
};

/**
 * @brief Process-wide transfer logger
 *
 * Forwards to logger_system when it is linked, otherwise writes to stderr.
 * stdout is reserved for command output.
 */
class transfer_logger {
public:
    transfer_logger() = default;
    ~transfer_logger() = default;

    transfer_logger(const transfer_logger&) = delete;
    transfer_logger& operator=(const transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Receive every formatted line in addition to the sink
     *
     * The callback gets the rendered line (text or JSON, masked).
     */
    void set_callback(std::function<void(log_level, const std::string&)> callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        line_callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        std::string rendered;
        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            rendered = builder.build().to_json_with_masking(&current_masker);
        } else {
            std::ostringstream oss;
            oss << "[" << category << "] " << current_masker.mask(std::string(message));
            if (context) {
                oss << " " << context->to_json_with_masking(&current_masker);
            }
            rendered = oss.str();
        }

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (line_callback_) {
                line_callback_(level, rendered);
            }
        }

        emit(level, format, rendered, file, line, function);
    }

    void flush() {
#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit(log_level level,
              log_output_format format,
              const std::string& rendered,
              [[maybe_unused]] const char* file,
              [[maybe_unused]] int line,
              [[maybe_unused]] const char* function) {
#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), rendered, file, line, function);
            } else {
                logger_->log(to_logger_level(level), rendered);
            }
            return;
        }
#endif
        if (format == log_output_format::json) {
            output_to_stderr(rendered);
        } else {
            output_to_stderr(get_timestamp() + " [" +
                             std::string(log_level_to_string(level)) + "] " + rendered);
        }
    }

    static void output_to_stderr(const std::string& msg) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << msg << "\n";
    }

#if GARAGE_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::function<void(log_level, const std::string&)> line_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline transfer_logger& get_logger() {
    static transfer_logger instance;
    return instance;
}

#define GT_LOG(level, category, message) \
    garage::transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define GT_LOG_CTX(level, category, message, context) \
    garage::transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define GT_LOG_TRACE(category, message) \
    GT_LOG(garage::transfer::log_level::trace, category, message)

#define GT_LOG_DEBUG(category, message) \
    GT_LOG(garage::transfer::log_level::debug, category, message)

#define GT_LOG_INFO(category, message) \
    GT_LOG(garage::transfer::log_level::info, category, message)

#define GT_LOG_WARN(category, message) \
    GT_LOG(garage::transfer::log_level::warn, category, message)

#define GT_LOG_ERROR(category, message) \
    GT_LOG(garage::transfer::log_level::error, category, message)

#define GT_LOG_FATAL(category, message) \
    GT_LOG(garage::transfer::log_level::fatal, category, message)

#define GT_LOG_DEBUG_CTX(category, message, ctx) \
    GT_LOG_CTX(garage::transfer::log_level::debug, category, message, ctx)

#define GT_LOG_INFO_CTX(category, message, ctx) \
    GT_LOG_CTX(garage::transfer::log_level::info, category, message, ctx)

#define GT_LOG_WARN_CTX(category, message, ctx) \
    GT_LOG_CTX(garage::transfer::log_level::warn, category, message, ctx)

#define GT_LOG_ERROR_CTX(category, message, ctx) \
    GT_LOG_CTX(garage::transfer::log_level::error, category, message, ctx)

}  // namespace garage::transfer
