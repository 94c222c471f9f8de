/**
 * @file key_path_mapper.cpp
 * @brief Conversion between local filesystem paths and storage keys
 */

#include "garage/transfer/core/key_path_mapper.h"

#include <algorithm>
#include <vector>

namespace garage::transfer {

namespace {

auto split_segments(std::string_view value) -> std::vector<std::string_view> {
    std::vector<std::string_view> segments;
    std::size_t start = 0;
    while (start <= value.size()) {
        auto end = value.find('/', start);
        if (end == std::string_view::npos) {
            end = value.size();
        }
        auto segment = value.substr(start, end - start);
        if (!segment.empty() && segment != ".") {
            segments.push_back(segment);
        }
        start = end + 1;
    }
    return segments;
}

auto with_forward_slashes(std::string_view raw) -> std::string {
    std::string value(raw);
    std::replace(value.begin(), value.end(), '\\', '/');
    return value;
}

}  // namespace

auto normalize_key(std::string_view raw) -> std::string {
    auto value = with_forward_slashes(raw);

    std::string key;
    key.reserve(value.size());
    for (auto segment : split_segments(value)) {
        if (!key.empty()) {
            key += '/';
        }
        key.append(segment);
    }

    if (!key.empty() && value.back() == '/') {
        key += '/';
    }
    return key;
}

auto to_key(std::string_view base_prefix,
            const std::filesystem::path& relative_path) -> std::string {
    std::string joined(base_prefix);
    joined += '/';
    joined += relative_path.generic_string();

    auto key = normalize_key(joined);
    while (!key.empty() && key.back() == '/') {
        key.pop_back();
    }
    return key;
}

auto to_local_path(const std::filesystem::path& dest_root,
                   std::string_view key,
                   std::string_view key_prefix)
    -> result<std::filesystem::path> {
    std::string_view remainder = key;
    if (remainder.starts_with(key_prefix)) {
        remainder.remove_prefix(key_prefix.size());
    }

    auto normalized = with_forward_slashes(remainder);
    auto segments = split_segments(normalized);
    if (segments.empty()) {
        return dest_root;
    }

    std::filesystem::path out = dest_root;
    for (auto segment : segments) {
        if (segment == "..") {
            return unexpected{error{error_code::invalid_object_key,
                "Key escapes destination directory: " + std::string(key)}};
        }
        out /= std::filesystem::path(std::string(segment));
    }
    return out;
}

auto is_folder_marker(std::string_view key, std::string_view key_prefix) -> bool {
    auto normalized = with_forward_slashes(key);
    if (!normalized.empty() && normalized.back() == '/') {
        return true;
    }

    std::string_view remainder = normalized;
    if (remainder.starts_with(key_prefix)) {
        remainder.remove_prefix(key_prefix.size());
    }
    return split_segments(remainder).empty();
}

auto default_upload_key(const std::filesystem::path& source) -> std::string {
    auto trimmed = source;
    if (!trimmed.has_filename() && trimmed.has_parent_path()) {
        trimmed = trimmed.parent_path();
    }
    return with_forward_slashes(trimmed.filename().string());
}

}  // namespace garage::transfer
