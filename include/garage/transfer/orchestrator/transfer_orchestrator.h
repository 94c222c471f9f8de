/**
 * @file transfer_orchestrator.h
 * @brief Command pipelines: upload, download, delete, list, presign
 *
 * The orchestrator picks an enumeration strategy for each command, turns
 * the result into work items, runs them through the bounded task runner
 * and folds the outcomes into a command_summary. Destructive commands are
 * guarded by dry-run and explicit confirmation.
 */

#ifndef GARAGE_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
#define GARAGE_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H

#include <chrono>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>

#include "garage/transfer/core/progress_reporter.h"
#include "garage/transfer/core/transfer_types.h"
#include "garage/transfer/core/types.h"

namespace garage::transfer {

class object_store_gateway;

namespace adapters {
class transfer_thread_pool_interface;
}  // namespace adapters

/**
 * @brief Orchestrates transfer commands over one gateway
 *
 * @code
 * transfer_orchestrator orchestrator(gateway, reporter);
 * run_config config;
 * config.bucket = "photos";
 * config.parallelism = 8;
 * auto summary = orchestrator.upload(config, "./album", "2024/album");
 * @endcode
 */
class transfer_orchestrator {
public:
    /**
     * @param gateway Object store every command talks to
     * @param observer Progress observer, may be null
     * @param pool Worker pool for the task runner; a pool sized to the
     *             run's parallelism is created per command when null
     */
    explicit transfer_orchestrator(
        std::shared_ptr<object_store_gateway> gateway,
        std::shared_ptr<progress_observer> observer = nullptr,
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool = nullptr);

    ~transfer_orchestrator();

    transfer_orchestrator(const transfer_orchestrator&) = delete;
    auto operator=(const transfer_orchestrator&) -> transfer_orchestrator& = delete;

    /**
     * @brief Upload a file or a directory tree
     * @param config Bucket and parallelism
     * @param source Local file or directory
     * @param destination Key (file) or key prefix (directory); defaults to
     *        the base name of source
     * @return Summary, or enumeration_error when source is missing or unreadable
     */
    [[nodiscard]] auto upload(const run_config& config,
                              const std::filesystem::path& source,
                              const std::optional<std::string>& destination = std::nullopt)
        -> result<command_summary>;

    /**
     * @brief Download one object, or every object under a prefix
     * @param key Object key, or key prefix when config.recursive
     * @param destination Local file, or directory when config.recursive
     *
     * Data is written to "<destination>.part" and renamed over the
     * destination on success, so a failed item leaves an existing file
     * untouched. Folder marker keys are skipped in recursive mode.
     */
    [[nodiscard]] auto download(const run_config& config,
                                const std::string& key,
                                const std::filesystem::path& destination)
        -> result<command_summary>;

    /**
     * @brief Delete one object, or every object under a prefix
     *
     * Guards, checked in order:
     * - single key: needs config.confirmed, else confirmation_required (count 1)
     * - recursive dry run: reports planned_keys, deletes nothing
     * - recursive: needs config.confirmed, else confirmation_required carrying
     *   the number of objects that would be deleted
     */
    [[nodiscard]] auto remove(const run_config& config, const std::string& key)
        -> result<command_summary>;

    /**
     * @brief List every object under a prefix with the total size
     */
    [[nodiscard]] auto list(const run_config& config, const std::string& prefix)
        -> result<object_listing>;

    /**
     * @brief Presigned GET or PUT URL for a key
     * @param expires Between 1 second and 7 days
     */
    [[nodiscard]] auto presign(const run_config& config,
                               const std::string& key,
                               presign_method method,
                               std::chrono::seconds expires) -> result<std::string>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_ORCHESTRATOR_TRANSFER_ORCHESTRATOR_H
