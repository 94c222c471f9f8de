/**
 * @file environment_config.h
 * @brief Environment-based configuration with .env support
 *
 * Reads S3_ENDPOINT, S3_ACCESS_KEY, S3_SECRET_KEY (required), S3_REGION,
 * GARAGE_LOG_LEVEL and GARAGE_LOG_FORMAT. A .env file, when present, is
 * loaded first; variables already set in the process environment win.
 */

#ifndef GARAGE_TRANSFER_CONFIG_ENVIRONMENT_CONFIG_H
#define GARAGE_TRANSFER_CONFIG_ENVIRONMENT_CONFIG_H

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include "garage/transfer/core/logging.h"
#include "garage/transfer/core/types.h"
#include "garage/transfer/gateway/gateway_config.h"

namespace garage::transfer {

/**
 * @brief Everything the CLI needs from the environment
 */
struct environment_settings {
    s3_gateway_config gateway;
    log_level level = log_level::info;
    log_output_format format = log_output_format::text;
};

/**
 * @brief Loader for environment_settings
 */
class environment_config {
public:
    /// Returns the value of a variable, or nullopt when unset
    using lookup_function = std::function<std::optional<std::string>(const std::string&)>;

    /**
     * @brief Load .env (if present) then read the process environment
     * @param dotenv_path Path of the .env file
     * @return Settings, missing_environment naming the first absent required
     *         variable, or configuration_error for an invalid value
     */
    [[nodiscard]] static auto load(const std::filesystem::path& dotenv_path = ".env")
        -> result<environment_settings>;

    /**
     * @brief Build settings from an arbitrary variable source
     */
    [[nodiscard]] static auto load_from(const lookup_function& lookup)
        -> result<environment_settings>;

    /**
     * @brief Parse .env content
     *
     * Accepts KEY=VALUE lines, '#' comments, blank lines, an optional
     * "export " prefix and single or double quoted values. Malformed lines
     * are skipped.
     */
    [[nodiscard]] static auto parse_dotenv(const std::string& content)
        -> std::map<std::string, std::string>;

    /**
     * @brief Export the variables of a .env file into the process
     * @return Number of variables set; existing variables are left untouched
     *         and a missing file sets nothing
     */
    [[nodiscard]] static auto apply_dotenv(const std::filesystem::path& path)
        -> result<std::size_t>;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CONFIG_ENVIRONMENT_CONFIG_H
