/**
 * @file recursive_enumerator.h
 * @brief Flattening of local trees and remote prefixes into work lists
 *
 * Both walks are all-or-nothing: any failure discards what was gathered
 * so far and reports enumeration_error.
 */

#ifndef GARAGE_TRANSFER_CORE_RECURSIVE_ENUMERATOR_H
#define GARAGE_TRANSFER_CORE_RECURSIVE_ENUMERATOR_H

#include <filesystem>
#include <string>
#include <vector>

#include "transfer_types.h"
#include "types.h"

namespace garage::transfer {

class object_store_gateway;

/**
 * @brief A regular file found under a local root
 */
struct local_entry {
    std::filesystem::path absolute_path;
    std::string relative_key;  ///< Forward-slash path relative to the root
};

/**
 * @brief Depth-first walk of a local directory
 * @param root Directory to walk
 * @return Regular files in sorted depth-first order
 *
 * Directory entries are visited in name order so two runs over the same
 * tree give the same sequence. Symlinked directories are not followed.
 */
[[nodiscard]] auto enumerate_local(const std::filesystem::path& root)
    -> result<std::vector<local_entry>>;

/**
 * @brief List every object under a prefix, following continuation tokens
 * @param gateway Object store to list
 * @param bucket Bucket name
 * @param prefix Key prefix; an unmatched prefix gives an empty list
 * @return Objects of all pages, concatenated in page order
 */
[[nodiscard]] auto enumerate_remote(object_store_gateway& gateway,
                                    const std::string& bucket,
                                    const std::string& prefix)
    -> result<std::vector<object_summary>>;

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_RECURSIVE_ENUMERATOR_H
