/**
 * @file recursive_enumerator.cpp
 * @brief Local and remote recursive enumeration
 */

#include "garage/transfer/core/recursive_enumerator.h"

#include <algorithm>
#include <system_error>
#include <unordered_set>

#include "garage/transfer/core/key_path_mapper.h"
#include "garage/transfer/core/logging.h"
#include "garage/transfer/gateway/object_store_gateway.h"

namespace garage::transfer {

namespace {

auto enumeration_failure(const std::string& what, const std::filesystem::path& path,
                         const std::error_code& ec) -> unexpected {
    return unexpected{error{error_code::enumeration_error,
        what + " '" + path.string() + "': " + ec.message()}};
}

auto walk_directory(const std::filesystem::path& directory,
                    const std::filesystem::path& relative,
                    std::vector<local_entry>& out) -> result<void> {
    std::error_code ec;
    std::filesystem::directory_iterator it(directory, ec);
    if (ec) {
        return enumeration_failure("Cannot read directory", directory, ec);
    }

    std::vector<std::filesystem::directory_entry> entries;
    while (it != std::filesystem::directory_iterator{}) {
        entries.push_back(*it);
        it.increment(ec);
        if (ec) {
            return enumeration_failure("Cannot read directory", directory, ec);
        }
    }

    std::sort(entries.begin(), entries.end(),
              [](const auto& a, const auto& b) {
                  return a.path().filename() < b.path().filename();
              });

    for (const auto& entry : entries) {
        auto name = entry.path().filename();

        auto link_status = entry.symlink_status(ec);
        if (ec) {
            return enumeration_failure("Cannot stat", entry.path(), ec);
        }

        if (std::filesystem::is_directory(link_status)) {
            auto nested = walk_directory(entry.path(), relative / name, out);
            if (!nested) {
                return nested;
            }
            continue;
        }

        auto target_status = entry.status(ec);
        if (ec) {
            return enumeration_failure("Cannot stat", entry.path(), ec);
        }
        if (std::filesystem::is_regular_file(target_status)) {
            out.push_back(local_entry{entry.path(), to_key("", relative / name)});
        }
    }

    return result<void>{};
}

}  // namespace

auto enumerate_local(const std::filesystem::path& root)
    -> result<std::vector<local_entry>> {
    std::error_code ec;
    auto status = std::filesystem::status(root, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected{error{error_code::enumeration_error,
            "Local path does not exist: " + root.string()}};
    }
    if (!std::filesystem::is_directory(status)) {
        return unexpected{error{error_code::enumeration_error,
            "Local path is not a directory: " + root.string()}};
    }

    auto absolute_root = std::filesystem::absolute(root, ec);
    if (ec) {
        return enumeration_failure("Cannot resolve", root, ec);
    }

    std::vector<local_entry> entries;
    auto walked = walk_directory(absolute_root, {}, entries);
    if (!walked) {
        GT_LOG_ERROR(log_category::enumerator, walked.error().message);
        return unexpected{walked.error()};
    }

    GT_LOG_DEBUG(log_category::enumerator,
                 "Enumerated " + std::to_string(entries.size()) + " local files under " +
                     root.string());
    return entries;
}

auto enumerate_remote(object_store_gateway& gateway,
                      const std::string& bucket,
                      const std::string& prefix)
    -> result<std::vector<object_summary>> {
    std::vector<object_summary> objects;
    std::optional<std::string> token;
    std::unordered_set<std::string> seen_tokens;
    std::size_t pages = 0;

    do {
        auto page = gateway.list_page(bucket, prefix, token);
        if (!page) {
            GT_LOG_ERROR(log_category::enumerator,
                         "Listing " + bucket + "/" + prefix + " failed: " +
                             page.error().message);
            return unexpected{error{error_code::enumeration_error,
                "Listing '" + prefix + "' in bucket '" + bucket + "' failed: " +
                    page.error().message}};
        }

        ++pages;
        auto& value = page.value();
        objects.insert(objects.end(),
                       std::make_move_iterator(value.objects.begin()),
                       std::make_move_iterator(value.objects.end()));

        token = std::move(value.next_token);
        if (token && !seen_tokens.insert(*token).second) {
            return unexpected{error{error_code::enumeration_error,
                "Backend repeated continuation token while listing '" + prefix + "'"}};
        }
    } while (token.has_value());

    GT_LOG_DEBUG(log_category::enumerator,
                 "Enumerated " + std::to_string(objects.size()) + " objects in " +
                     std::to_string(pages) + " pages under " + bucket + "/" + prefix);
    return objects;
}

}  // namespace garage::transfer
