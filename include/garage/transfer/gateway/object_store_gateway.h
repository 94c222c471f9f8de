/**
 * @file object_store_gateway.h
 * @brief Abstract object store interface consumed by the transfer core
 *
 * One gateway handle is built per process and passed explicitly to the
 * enumerator and the orchestrator. Implementations must be safe for
 * concurrent calls on distinct keys.
 */

#ifndef GARAGE_TRANSFER_GATEWAY_OBJECT_STORE_GATEWAY_H
#define GARAGE_TRANSFER_GATEWAY_OBJECT_STORE_GATEWAY_H

#include <chrono>
#include <cstdint>
#include <functional>
#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "garage/transfer/core/transfer_types.h"
#include "garage/transfer/core/types.h"

namespace garage::transfer {

/**
 * @brief Byte progress callback (transferred so far, total)
 */
using byte_progress_callback = std::function<void(uint64_t transferred, uint64_t total)>;

/**
 * @brief Abstract interface for S3-compatible object stores
 */
class object_store_gateway {
public:
    virtual ~object_store_gateway() = default;

    /**
     * @brief Fetch one page of a prefix listing
     * @param bucket Bucket name
     * @param prefix Key prefix, may be empty
     * @param continuation_token Token returned by the previous page
     * @return Page of summaries; next_token is absent on the last page
     */
    [[nodiscard]] virtual auto list_page(
        const std::string& bucket,
        const std::string& prefix,
        const std::optional<std::string>& continuation_token)
        -> result<list_page_result> = 0;

    /**
     * @brief Stream an object into a sink
     * @param on_progress Called as bytes reach the sink, may be empty
     * @return Number of bytes written to the sink
     */
    [[nodiscard]] virtual auto get_object(
        const std::string& bucket,
        const std::string& key,
        std::ostream& sink,
        const byte_progress_callback& on_progress) -> result<uint64_t> = 0;

    /**
     * @brief Store an object read from a source stream
     * @param size Number of bytes the source provides
     * @param on_progress Called as bytes are accepted by the backend
     * @return Number of bytes stored
     */
    [[nodiscard]] virtual auto put_object(
        const std::string& bucket,
        const std::string& key,
        std::istream& source,
        uint64_t size,
        const byte_progress_callback& on_progress) -> result<uint64_t> = 0;

    /**
     * @brief Delete an object
     */
    [[nodiscard]] virtual auto delete_object(
        const std::string& bucket,
        const std::string& key) -> result<void> = 0;

    /**
     * @brief Fetch object metadata
     * @return Summary, or object_not_found
     */
    [[nodiscard]] virtual auto head_object(
        const std::string& bucket,
        const std::string& key) -> result<object_summary> = 0;

    /**
     * @brief Build a presigned URL for GET or PUT
     */
    [[nodiscard]] virtual auto presign(
        const std::string& bucket,
        const std::string& key,
        presign_method method,
        std::chrono::seconds expires) -> result<std::string> = 0;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GATEWAY_OBJECT_STORE_GATEWAY_H
