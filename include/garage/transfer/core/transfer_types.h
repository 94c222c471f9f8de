/**
 * @file transfer_types.h
 * @brief Work items, outcomes and run configuration for garage_transfer
 *
 * Every transfer command is reduced to a flat sequence of work items.
 * The task runner turns each item into exactly one transfer_outcome, and
 * the orchestrator folds the outcomes into a command_summary.
 */

#ifndef GARAGE_TRANSFER_CORE_TRANSFER_TYPES_H
#define GARAGE_TRANSFER_CORE_TRANSFER_TYPES_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "types.h"

namespace garage::transfer {

/**
 * @brief Object as reported by a backend listing
 *
 * size comes from the backend and is never recomputed locally.
 */
struct object_summary {
    std::string key;
    uint64_t size = 0;
    std::string etag;
    std::string last_modified;
};

/**
 * @brief One page of a paged listing
 */
struct list_page_result {
    std::vector<object_summary> objects;
    std::optional<std::string> next_token;  ///< Absent on the last page
};

/**
 * @brief Upload one local file to a key
 */
struct upload_item {
    std::filesystem::path local_path;
    std::string key;
};

/**
 * @brief Download one key to a local file
 */
struct download_item {
    std::string key;
    std::filesystem::path local_path;
};

/**
 * @brief Delete one key
 */
struct delete_item {
    std::string key;
};

using work_item = std::variant<upload_item, download_item, delete_item>;

/**
 * @brief Storage key addressed by a work item
 */
[[nodiscard]] inline auto item_key(const work_item& item) -> const std::string& {
    return std::visit([](const auto& i) -> const std::string& { return i.key; }, item);
}

/**
 * @brief Operation name of a work item ("upload", "download", "delete")
 */
[[nodiscard]] inline auto item_kind(const work_item& item) -> std::string_view {
    switch (item.index()) {
        case 0:
            return "upload";
        case 1:
            return "download";
        default:
            return "delete";
    }
}

/**
 * @brief Result of executing one work item
 */
struct transfer_outcome {
    work_item item;
    uint64_t bytes_transferred = 0;
    std::optional<error> failure;  ///< Set when the item failed

    [[nodiscard]] auto succeeded() const noexcept -> bool {
        return !failure.has_value();
    }
};

/**
 * @brief Per-invocation settings, immutable once built
 */
struct run_config {
    std::string bucket;
    std::size_t parallelism = 5;
    bool recursive = false;
    bool dry_run = false;
    bool confirmed = false;
};

/**
 * @brief Aggregated result of one orchestrated command
 */
struct command_summary {
    std::string operation;
    std::size_t total = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    uint64_t bytes_transferred = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<transfer_outcome> outcomes;
    bool dry_run = false;
    std::vector<std::string> planned_keys;  ///< Keys a dry run would touch

    /**
     * @brief True when no item failed; a dry run touches nothing and succeeds
     */
    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failed == 0 && (dry_run || succeeded == total);
    }

    /**
     * @brief Human readable summary, e.g. "9 of 10 succeeded"
     */
    [[nodiscard]] auto describe() const -> std::string {
        if (dry_run) {
            return std::to_string(planned_keys.size()) + " objects would be " +
                   (operation == "delete" ? std::string("deleted")
                                          : std::string("processed"));
        }
        return std::to_string(succeeded) + " of " + std::to_string(total) +
               " succeeded";
    }
};

/**
 * @brief Result of a list command
 */
struct object_listing {
    std::vector<object_summary> objects;
    uint64_t total_size = 0;
};

/**
 * @brief HTTP method a presigned URL grants
 */
enum class presign_method {
    get,
    put,
};

[[nodiscard]] constexpr auto to_string(presign_method method) noexcept
    -> std::string_view {
    switch (method) {
        case presign_method::get:
            return "GET";
        case presign_method::put:
            return "PUT";
        default:
            return "GET";
    }
}

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_TRANSFER_TYPES_H
