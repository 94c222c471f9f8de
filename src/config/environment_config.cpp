/**
 * @file environment_config.cpp
 * @brief Environment and .env loading
 */

#include "garage/transfer/config/environment_config.h"

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace garage::transfer {

namespace {

auto trim(const std::string& value) -> std::string {
    auto start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return {};
    }
    auto end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

auto unquote(const std::string& value) -> std::string {
    if (value.size() >= 2) {
        char first = value.front();
        if ((first == '"' || first == '\'') && value.back() == first) {
            return value.substr(1, value.size() - 2);
        }
    }

    // Unquoted values may carry a trailing comment
    auto comment = value.find(" #");
    if (comment != std::string::npos) {
        return trim(value.substr(0, comment));
    }
    return value;
}

auto process_lookup(const std::string& name) -> std::optional<std::string> {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

auto require(const environment_config::lookup_function& lookup, const std::string& name)
    -> result<std::string> {
    auto value = lookup(name);
    if (!value || value->empty()) {
        return unexpected{error{error_code::missing_environment,
            "Missing environment variable: " + name}};
    }
    return *value;
}

}  // namespace

auto environment_config::parse_dotenv(const std::string& content)
    -> std::map<std::string, std::string> {
    std::map<std::string, std::string> values;
    std::istringstream stream(content);
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#') {
            continue;
        }

        if (line.rfind("export ", 0) == 0) {
            line = trim(line.substr(7));
        }

        auto eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            continue;
        }

        auto key = trim(line.substr(0, eq_pos));
        if (key.empty()) {
            continue;
        }
        values[key] = unquote(trim(line.substr(eq_pos + 1)));
    }

    return values;
}

auto environment_config::apply_dotenv(const std::filesystem::path& path)
    -> result<std::size_t> {
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        return std::size_t{0};
    }

    std::ifstream file(path);
    if (!file) {
        return unexpected{error{error_code::configuration_error,
            "Cannot read " + path.string()}};
    }
    std::ostringstream content;
    content << file.rdbuf();

    std::size_t applied = 0;
    for (const auto& [name, value] : parse_dotenv(content.str())) {
        if (std::getenv(name.c_str()) != nullptr) {
            continue;
        }
#ifdef _WIN32
        int rc = _putenv_s(name.c_str(), value.c_str());
#else
        int rc = setenv(name.c_str(), value.c_str(), 0);
#endif
        if (rc != 0) {
            return unexpected{error{error_code::configuration_error,
                "Cannot set environment variable " + name}};
        }
        ++applied;
    }

    GT_LOG_DEBUG(log_category::config,
                 "Loaded " + std::to_string(applied) + " variables from " + path.string());
    return applied;
}

auto environment_config::load_from(const lookup_function& lookup)
    -> result<environment_settings> {
    auto endpoint = require(lookup, "S3_ENDPOINT");
    if (!endpoint) {
        return unexpected{endpoint.error()};
    }
    auto access_key = require(lookup, "S3_ACCESS_KEY");
    if (!access_key) {
        return unexpected{access_key.error()};
    }
    auto secret_key = require(lookup, "S3_SECRET_KEY");
    if (!secret_key) {
        return unexpected{secret_key.error()};
    }

    auto region = lookup("S3_REGION");

    environment_settings settings;
    settings.gateway = gateway_config_builder()
        .with_endpoint(endpoint.value())
        .with_region(region && !region->empty() ? *region : "garage")
        .with_credentials(access_key.value(), secret_key.value())
        .with_path_style(true)
        .build();

    if (auto level = lookup("GARAGE_LOG_LEVEL"); level && !level->empty()) {
        auto parsed = parse_log_level(*level);
        if (!parsed) {
            return unexpected{error{error_code::configuration_error,
                "Invalid GARAGE_LOG_LEVEL: " + *level}};
        }
        settings.level = *parsed;
    }

    if (auto format = lookup("GARAGE_LOG_FORMAT"); format && !format->empty()) {
        if (*format == "json") {
            settings.format = log_output_format::json;
        } else if (*format == "text") {
            settings.format = log_output_format::text;
        } else {
            return unexpected{error{error_code::configuration_error,
                "Invalid GARAGE_LOG_FORMAT: " + *format + " (expected text or json)"}};
        }
    }

    return settings;
}

auto environment_config::load(const std::filesystem::path& dotenv_path)
    -> result<environment_settings> {
    auto applied = apply_dotenv(dotenv_path);
    if (!applied) {
        return unexpected{applied.error()};
    }
    return load_from(process_lookup);
}

}  // namespace garage::transfer
