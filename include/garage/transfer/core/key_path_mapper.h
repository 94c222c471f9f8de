/**
 * @file key_path_mapper.h
 * @brief Conversion between local filesystem paths and storage keys
 *
 * Keys are always forward-slash delimited with no leading slash,
 * whatever the host separator. Local paths use host-native separators.
 */

#ifndef GARAGE_TRANSFER_CORE_KEY_PATH_MAPPER_H
#define GARAGE_TRANSFER_CORE_KEY_PATH_MAPPER_H

#include <filesystem>
#include <string>
#include <string_view>

#include "types.h"

namespace garage::transfer {

/**
 * @brief Normalize a key or key fragment
 *
 * Backslashes become '/', empty and "." segments are dropped, leading
 * and repeated slashes disappear. A trailing slash is kept so that a
 * "folder/" prefix stays a folder prefix.
 */
[[nodiscard]] auto normalize_key(std::string_view raw) -> std::string;

/**
 * @brief Join a base prefix and a relative path into a key
 * @param base_prefix Destination prefix, may be empty
 * @param relative_path Path relative to the enumerated root
 * @return Normalized key, e.g. to_key("p", "b/c.txt") == "p/b/c.txt"
 */
[[nodiscard]] auto to_key(std::string_view base_prefix,
                          const std::filesystem::path& relative_path) -> std::string;

/**
 * @brief Map an object key back onto a local destination
 * @param dest_root Local directory receiving the objects
 * @param key Object key as listed by the backend
 * @param key_prefix Prefix the listing was queried with
 * @return dest_root joined with the key remainder, or invalid_object_key
 *         when the remainder would leave dest_root
 *
 * A key equal to the prefix maps to dest_root itself; see is_folder_marker.
 */
[[nodiscard]] auto to_local_path(const std::filesystem::path& dest_root,
                                 std::string_view key,
                                 std::string_view key_prefix)
    -> result<std::filesystem::path>;

/**
 * @brief True for keys that name a folder rather than a file
 *
 * Covers "folder/" marker objects and a key equal to key_prefix, whose
 * remainder would map onto the destination directory itself.
 */
[[nodiscard]] auto is_folder_marker(std::string_view key, std::string_view key_prefix)
    -> bool;

/**
 * @brief Key used when upload has no explicit destination
 *
 * The base name of the source, with backslashes turned into '/'.
 */
[[nodiscard]] auto default_upload_key(const std::filesystem::path& source) -> std::string;

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_KEY_PATH_MAPPER_H
