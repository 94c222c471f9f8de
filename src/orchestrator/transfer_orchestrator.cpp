/**
 * @file transfer_orchestrator.cpp
 * @brief Transfer command pipelines
 */

#include "garage/transfer/orchestrator/transfer_orchestrator.h"

#include <fstream>
#include <iterator>
#include <system_error>
#include <utility>
#include <vector>

#include "garage/transfer/adapters/thread_pool_adapter.h"
#include "garage/transfer/core/bounded_task_runner.h"
#include "garage/transfer/core/key_path_mapper.h"
#include "garage/transfer/core/logging.h"
#include "garage/transfer/core/recursive_enumerator.h"
#include "garage/transfer/gateway/object_store_gateway.h"

namespace garage::transfer {

namespace {

constexpr std::chrono::seconds max_presign_expiry{7 * 24 * 3600};

auto validate(const run_config& config) -> result<void> {
    if (config.bucket.empty()) {
        return unexpected{error{error_code::invalid_argument, "Bucket name is empty"}};
    }
    if (config.parallelism == 0) {
        return unexpected{error{error_code::invalid_argument,
            "Parallelism must be at least 1"}};
    }
    return result<void>{};
}

/**
 * @brief Fold runner outcomes into a summary
 */
auto summarize(std::string operation,
               std::vector<transfer_outcome> outcomes,
               std::chrono::steady_clock::time_point started) -> command_summary {
    command_summary summary;
    summary.operation = std::move(operation);
    summary.total = outcomes.size();
    for (const auto& outcome : outcomes) {
        if (outcome.succeeded()) {
            ++summary.succeeded;
            summary.bytes_transferred += outcome.bytes_transferred;
        } else {
            ++summary.failed;
        }
    }
    summary.outcomes = std::move(outcomes);
    summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started);
    return summary;
}

void log_summary(const run_config& config, const command_summary& summary) {
    transfer_log_context ctx;
    ctx.operation = summary.operation;
    ctx.bucket = config.bucket;
    ctx.item_count = summary.total;
    ctx.bytes_transferred = summary.bytes_transferred;
    ctx.duration_ms = static_cast<uint64_t>(summary.elapsed.count());
    if (summary.failed > 0) {
        ctx.error_message = std::to_string(summary.failed) + " items failed";
        GT_LOG_WARN_CTX(log_category::orchestrator, summary.describe(), ctx);
    } else {
        GT_LOG_INFO_CTX(log_category::orchestrator, summary.describe(), ctx);
    }
}

}  // namespace

// ============================================================================
// Implementation
// ============================================================================

struct transfer_orchestrator::impl {
    std::shared_ptr<object_store_gateway> gateway;
    std::shared_ptr<progress_observer> observer;
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool;

    [[nodiscard]] auto byte_reporter(const std::string& operation, const std::string& key) const
        -> byte_progress_callback {
        auto* target = observer.get();
        if (target == nullptr) {
            return {};
        }
        return [target, operation, key](uint64_t transferred, uint64_t total) {
            progress_event event;
            event.kind = progress_event_kind::item_bytes;
            event.operation = operation;
            event.key = key;
            event.bytes_transferred = transferred;
            event.total_bytes = total;
            target->on_event(event);
        };
    }

    auto run(const run_config& config, std::vector<work_item> items, const item_operation& op)
        -> result<std::vector<transfer_outcome>> {
        bounded_task_runner runner(pool, observer);
        return runner.run(std::move(items), config.parallelism, op);
    }

    auto upload_one(const std::string& bucket, const upload_item& item) -> result<uint64_t> {
        std::error_code ec;
        auto size = std::filesystem::file_size(item.local_path, ec);
        if (ec) {
            return unexpected{error{error_code::file_read_error,
                "Cannot stat " + item.local_path.string() + ": " + ec.message()}};
        }

        std::ifstream source(item.local_path, std::ios::binary);
        if (!source) {
            return unexpected{error{error_code::file_read_error,
                "Cannot open " + item.local_path.string()}};
        }

        return gateway->put_object(bucket, item.key, source, size,
                                   byte_reporter("upload", item.key));
    }

    auto download_one(const std::string& bucket, const download_item& item) -> result<uint64_t> {
        std::error_code ec;
        auto parent = item.local_path.parent_path();
        if (!parent.empty()) {
            std::filesystem::create_directories(parent, ec);
            if (ec) {
                return unexpected{error{error_code::file_write_error,
                    "Cannot create " + parent.string() + ": " + ec.message()}};
            }
        }

        // Bytes land in a sibling file; the destination is only replaced on success
        auto partial = item.local_path;
        partial += ".part";

        result<uint64_t> fetched = unexpected{error{error_code::internal_error}};
        {
            std::ofstream sink(partial, std::ios::binary | std::ios::trunc);
            if (!sink) {
                return unexpected{error{error_code::file_write_error,
                    "Cannot open " + partial.string() + " for writing"}};
            }
            fetched = gateway->get_object(bucket, item.key, sink,
                                          byte_reporter("download", item.key));
            if (fetched) {
                sink.close();
                if (sink.fail()) {
                    fetched = unexpected{error{error_code::file_write_error,
                        "Failed closing " + partial.string()}};
                }
            }
        }

        if (fetched) {
            std::filesystem::rename(partial, item.local_path, ec);
            if (ec) {
                fetched = unexpected{error{error_code::file_write_error,
                    "Cannot move " + partial.string() + " to " + item.local_path.string() +
                        ": " + ec.message()}};
            }
        }

        if (!fetched) {
            std::filesystem::remove(partial, ec);
            if (ec) {
                GT_LOG_WARN(log_category::orchestrator,
                            "Could not remove partial file " + partial.string() + ": " +
                                ec.message());
            }
        }
        return fetched;
    }

    auto delete_one(const std::string& bucket, const delete_item& item, bool check_exists)
        -> result<uint64_t> {
        if (check_exists) {
            auto head = gateway->head_object(bucket, item.key);
            if (!head) {
                return unexpected{head.error()};
            }
        }
        auto deleted = gateway->delete_object(bucket, item.key);
        if (!deleted) {
            return unexpected{deleted.error()};
        }
        return uint64_t{0};
    }
};

// ============================================================================
// Construction
// ============================================================================

transfer_orchestrator::transfer_orchestrator(
    std::shared_ptr<object_store_gateway> gateway,
    std::shared_ptr<progress_observer> observer,
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool)
    : impl_(std::make_unique<impl>()) {
    impl_->gateway = std::move(gateway);
    impl_->observer = std::move(observer);
    impl_->pool = std::move(pool);
}

transfer_orchestrator::~transfer_orchestrator() = default;

// ============================================================================
// Commands
// ============================================================================

auto transfer_orchestrator::upload(const run_config& config,
                                   const std::filesystem::path& source,
                                   const std::optional<std::string>& destination)
    -> result<command_summary> {
    if (auto valid = validate(config); !valid) {
        return unexpected{valid.error()};
    }
    const auto started = std::chrono::steady_clock::now();

    std::error_code ec;
    auto status = std::filesystem::status(source, ec);
    if (ec || !std::filesystem::exists(status)) {
        return unexpected{error{error_code::enumeration_error,
            "Local path does not exist: " + source.string()}};
    }

    auto target = destination ? *destination : default_upload_key(source);
    std::vector<work_item> items;

    if (std::filesystem::is_directory(status)) {
        auto entries = enumerate_local(source);
        if (!entries) {
            return unexpected{entries.error()};
        }
        auto prefix = normalize_key(target);
        for (auto& entry : entries.value()) {
            items.emplace_back(upload_item{std::move(entry.absolute_path),
                                           to_key(prefix, entry.relative_key)});
        }
    } else {
        auto key = normalize_key(target);
        if (!key.empty() && key.back() == '/') {
            key = to_key(key, default_upload_key(source));
        }
        if (key.empty()) {
            return unexpected{error{error_code::invalid_object_key,
                "Cannot derive an object key for " + source.string()}};
        }
        items.emplace_back(upload_item{source, std::move(key)});
    }

    GT_LOG_DEBUG(log_category::orchestrator,
                 "Uploading " + std::to_string(items.size()) + " files to " + config.bucket);

    auto outcomes = impl_->run(config, std::move(items), [this, &config](const work_item& item) {
        return impl_->upload_one(config.bucket, std::get<upload_item>(item));
    });
    if (!outcomes) {
        return unexpected{outcomes.error()};
    }

    auto summary = summarize("upload", std::move(outcomes.value()), started);
    log_summary(config, summary);
    return summary;
}

auto transfer_orchestrator::download(const run_config& config,
                                     const std::string& key,
                                     const std::filesystem::path& destination)
    -> result<command_summary> {
    if (auto valid = validate(config); !valid) {
        return unexpected{valid.error()};
    }
    const auto started = std::chrono::steady_clock::now();

    std::vector<work_item> items;
    std::vector<transfer_outcome> rejected;

    if (!config.recursive) {
        items.emplace_back(download_item{key, destination});
    } else {
        auto objects = enumerate_remote(*impl_->gateway, config.bucket, key);
        if (!objects) {
            return unexpected{objects.error()};
        }
        for (const auto& object : objects.value()) {
            if (is_folder_marker(object.key, key)) {
                GT_LOG_DEBUG(log_category::orchestrator, "Skipping folder marker " + object.key);
                continue;
            }
            auto local = to_local_path(destination, object.key, key);
            if (!local) {
                GT_LOG_WARN(log_category::orchestrator, local.error().message);
                rejected.push_back(transfer_outcome{download_item{object.key, destination}, 0,
                                                    local.error()});
                continue;
            }
            items.emplace_back(download_item{object.key, std::move(local.value())});
        }
    }

    auto outcomes = impl_->run(config, std::move(items), [this, &config](const work_item& item) {
        return impl_->download_one(config.bucket, std::get<download_item>(item));
    });
    if (!outcomes) {
        return unexpected{outcomes.error()};
    }

    auto all = std::move(outcomes.value());
    all.insert(all.end(), std::make_move_iterator(rejected.begin()),
               std::make_move_iterator(rejected.end()));

    auto summary = summarize("download", std::move(all), started);
    log_summary(config, summary);
    return summary;
}

auto transfer_orchestrator::remove(const run_config& config, const std::string& key)
    -> result<command_summary> {
    if (auto valid = validate(config); !valid) {
        return unexpected{valid.error()};
    }
    const auto started = std::chrono::steady_clock::now();

    if (!config.recursive) {
        if (!config.confirmed) {
            return unexpected{error{error_code::confirmation_required,
                "Use --yes to confirm delete", 1}};
        }

        std::vector<work_item> items{delete_item{key}};
        auto outcomes = impl_->run(config, std::move(items), [this, &config](const work_item& item) {
            return impl_->delete_one(config.bucket, std::get<delete_item>(item), true);
        });
        if (!outcomes) {
            return unexpected{outcomes.error()};
        }
        auto summary = summarize("delete", std::move(outcomes.value()), started);
        log_summary(config, summary);
        return summary;
    }

    auto objects = enumerate_remote(*impl_->gateway, config.bucket, key);
    if (!objects) {
        return unexpected{objects.error()};
    }

    if (config.dry_run) {
        command_summary summary;
        summary.operation = "delete";
        summary.dry_run = true;
        summary.total = objects.value().size();
        for (const auto& object : objects.value()) {
            summary.planned_keys.push_back(object.key);
        }
        summary.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
        GT_LOG_INFO(log_category::orchestrator, summary.describe());
        return summary;
    }

    const auto count = objects.value().size();
    if (!config.confirmed) {
        return unexpected{error{error_code::confirmation_required,
            "Refusing to delete " + std::to_string(count) + " objects without --yes",
            count}};
    }

    std::vector<work_item> items;
    items.reserve(count);
    for (const auto& object : objects.value()) {
        items.emplace_back(delete_item{object.key});
    }

    auto outcomes = impl_->run(config, std::move(items), [this, &config](const work_item& item) {
        return impl_->delete_one(config.bucket, std::get<delete_item>(item), false);
    });
    if (!outcomes) {
        return unexpected{outcomes.error()};
    }

    auto summary = summarize("delete", std::move(outcomes.value()), started);
    log_summary(config, summary);
    return summary;
}

auto transfer_orchestrator::list(const run_config& config, const std::string& prefix)
    -> result<object_listing> {
    if (config.bucket.empty()) {
        return unexpected{error{error_code::invalid_argument, "Bucket name is empty"}};
    }

    auto objects = enumerate_remote(*impl_->gateway, config.bucket, prefix);
    if (!objects) {
        return unexpected{objects.error()};
    }

    object_listing listing;
    listing.objects = std::move(objects.value());
    for (const auto& object : listing.objects) {
        listing.total_size += object.size;
    }
    return listing;
}

auto transfer_orchestrator::presign(const run_config& config,
                                    const std::string& key,
                                    presign_method method,
                                    std::chrono::seconds expires) -> result<std::string> {
    if (config.bucket.empty()) {
        return unexpected{error{error_code::invalid_argument, "Bucket name is empty"}};
    }
    if (expires.count() < 1 || expires > max_presign_expiry) {
        return unexpected{error{error_code::invalid_argument,
            "Expiry must be between 1 and " + std::to_string(max_presign_expiry.count()) +
                " seconds"}};
    }
    return impl_->gateway->presign(config.bucket, key, method, expires);
}

}  // namespace garage::transfer
