/**
 * @file bounded_task_runner.cpp
 * @brief Bounded concurrent task runner implementation
 */

#include "garage/transfer/core/bounded_task_runner.h"

#include <algorithm>
#include <deque>
#include <exception>
#include <future>
#include <mutex>
#include <optional>
#include <utility>

#include "garage/transfer/adapters/thread_pool_adapter.h"
#include "garage/transfer/core/logging.h"

namespace garage::transfer {

namespace {

struct indexed_outcome {
    std::size_t index;
    transfer_outcome outcome;
};

struct pending_queue {
    std::mutex mutex;
    std::deque<std::size_t> indices;

    auto pop() -> std::optional<std::size_t> {
        std::lock_guard<std::mutex> lock(mutex);
        if (indices.empty()) {
            return std::nullopt;
        }
        auto index = indices.front();
        indices.pop_front();
        return index;
    }
};

auto invoke_operation(const item_operation& op, const work_item& item) -> result<uint64_t> {
    try {
        return op(item);
    } catch (const std::exception& e) {
        return unexpected{error{error_code::item_transfer_failed,
            std::string("Unhandled exception: ") + e.what()}};
    } catch (...) {
        return unexpected{error{error_code::item_transfer_failed,
            "Unhandled non-standard exception"}};
    }
}

void notify(progress_observer* observer, progress_event_kind kind,
            const work_item& item, uint64_t bytes, const std::string& message = {}) {
    if (observer == nullptr) {
        return;
    }
    progress_event event;
    event.kind = kind;
    event.operation = std::string(item_kind(item));
    event.key = item_key(item);
    event.bytes_transferred = bytes;
    event.total_bytes = bytes;
    event.error_message = message;
    try {
        observer->on_event(event);
    } catch (const std::exception& e) {
        GT_LOG_WARN(log_category::runner,
                    "Progress observer failed on " + event.key + ": " + e.what());
    }
}

}  // namespace

bounded_task_runner::bounded_task_runner(
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool,
    std::shared_ptr<progress_observer> observer)
    : pool_(std::move(pool)), observer_(std::move(observer)) {}

bounded_task_runner::~bounded_task_runner() = default;

auto bounded_task_runner::run(std::vector<work_item> items,
                              std::size_t limit,
                              const item_operation& op)
    -> result<std::vector<transfer_outcome>> {
    if (limit == 0) {
        return unexpected{error{error_code::invalid_argument,
            "Concurrency limit must be at least 1"}};
    }
    if (!op) {
        return unexpected{error{error_code::invalid_argument, "No item operation given"}};
    }
    if (items.empty()) {
        return std::vector<transfer_outcome>{};
    }

    auto pool = pool_;
    if (!pool) {
        try {
            pool = adapters::transfer_pool_factory::create(std::min(limit, items.size()),
                                                           "bounded_task_runner");
        } catch (const std::exception& e) {
            return unexpected{error{error_code::internal_error,
                std::string("Cannot start worker pool: ") + e.what()}};
        }
    }
    if (!pool) {
        return unexpected{error{error_code::not_initialized, "No worker pool available"}};
    }
    const auto worker_count =
        std::min({limit, items.size(), std::max<std::size_t>(pool->worker_count(), 1)});

    GT_LOG_DEBUG(log_category::runner,
                 "Running " + std::to_string(items.size()) + " items with " +
                     std::to_string(worker_count) + " workers");

    pending_queue queue;
    for (std::size_t i = 0; i < items.size(); ++i) {
        queue.indices.push_back(i);
    }

    std::vector<std::vector<indexed_outcome>> worker_outcomes(worker_count);
    auto* observer = observer_.get();

    // Loops share the queue, so items are drained by whichever loops were
    // accepted even if the pool refuses later submissions.
    std::vector<std::future<void>> workers;
    workers.reserve(worker_count);
    std::optional<std::string> submit_failure;
    for (std::size_t w = 0; w < worker_count; ++w) {
        auto& local = worker_outcomes[w];
        try {
            workers.push_back(pool->submit([&queue, &items, &local, &op, observer]() {
                while (auto index = queue.pop()) {
                    const auto& item = items[*index];
                    notify(observer, progress_event_kind::item_started, item, 0);

                    auto executed = invoke_operation(op, item);
                    transfer_outcome outcome{item, 0, std::nullopt};
                    if (executed) {
                        outcome.bytes_transferred = executed.value();
                        notify(observer, progress_event_kind::item_completed, item,
                               outcome.bytes_transferred);
                    } else {
                        outcome.failure = executed.error();
                        GT_LOG_WARN(log_category::runner,
                                    std::string(item_kind(item)) + " of " + item_key(item) +
                                        " failed: " + executed.error().message);
                        notify(observer, progress_event_kind::item_failed, item, 0,
                               executed.error().message);
                    }
                    local.push_back(indexed_outcome{*index, std::move(outcome)});
                }
            }));
        } catch (const std::exception& e) {
            submit_failure = e.what();
            break;
        }
    }

    if (submit_failure) {
        GT_LOG_WARN(log_category::runner,
                    "Pool accepted " + std::to_string(workers.size()) + " of " +
                        std::to_string(worker_count) + " workers: " + *submit_failure);
        if (workers.empty()) {
            return unexpected{error{error_code::internal_error,
                "Cannot start workers: " + *submit_failure}};
        }
    }

    std::optional<std::string> worker_failure;
    for (auto& worker : workers) {
        try {
            worker.get();
        } catch (const std::exception& e) {
            if (!worker_failure) {
                worker_failure = std::string("Worker terminated: ") + e.what();
            }
        } catch (...) {
            if (!worker_failure) {
                worker_failure = "Worker terminated by a non-standard exception";
            }
        }
    }
    if (worker_failure) {
        GT_LOG_ERROR(log_category::runner, *worker_failure);
    }

    std::vector<std::optional<transfer_outcome>> slots(items.size());
    for (auto& local : worker_outcomes) {
        for (auto& entry : local) {
            slots[entry.index] = std::move(entry.outcome);
        }
    }

    // Items a terminated loop never recorded still get exactly one outcome
    std::vector<transfer_outcome> outcomes;
    outcomes.reserve(items.size());
    for (std::size_t i = 0; i < items.size(); ++i) {
        if (slots[i]) {
            outcomes.push_back(std::move(*slots[i]));
        } else {
            outcomes.push_back(transfer_outcome{
                items[i], 0,
                error{error_code::internal_error,
                      worker_failure.value_or("Item was not executed")}});
        }
    }
    return outcomes;
}

}  // namespace garage::transfer
