/**
 * @file garage_transfer.h
 * @brief Main header for the garage_transfer library
 * @version 1.2.0
 *
 * Include this header to access the transfer engine.
 *
 * @code
 * #include <garage/transfer/garage_transfer.h>
 *
 * using namespace garage::transfer;
 *
 * auto settings = environment_config::load();
 * auto gateway = s3_gateway::create(settings.value().gateway);
 * transfer_orchestrator orchestrator(std::move(gateway.value()));
 *
 * run_config config;
 * config.bucket = "backups";
 * auto summary = orchestrator.upload(config, "./site", "www");
 * @endcode
 */

#ifndef GARAGE_TRANSFER_GARAGE_TRANSFER_H
#define GARAGE_TRANSFER_GARAGE_TRANSFER_H

#include <cstdint>
#include <string>

// Core types
#include "garage/transfer/core/types.h"
#include "garage/transfer/core/transfer_types.h"
#include "garage/transfer/core/logging.h"

// Engine
#include "garage/transfer/core/key_path_mapper.h"
#include "garage/transfer/core/recursive_enumerator.h"
#include "garage/transfer/core/bounded_task_runner.h"
#include "garage/transfer/core/progress_reporter.h"
#include "garage/transfer/orchestrator/transfer_orchestrator.h"

// Gateway
#include "garage/transfer/gateway/object_store_gateway.h"
#include "garage/transfer/gateway/s3_gateway.h"

// Configuration
#include "garage/transfer/config/environment_config.h"

// Adapters
#include "garage/transfer/adapters/thread_pool_adapter.h"

namespace garage::transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 1;
    static constexpr int minor = 2;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_GARAGE_TRANSFER_H
