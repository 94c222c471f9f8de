/**
 * @file bounded_task_runner.h
 * @brief Executes work items with at most N in flight
 *
 * The runner turns a list of work items into exactly one outcome per
 * item. Workers pull from one shared queue and never claim a new item
 * before the current one finished, so the number of concurrently running
 * operations never exceeds the limit passed to run().
 */

#ifndef GARAGE_TRANSFER_CORE_BOUNDED_TASK_RUNNER_H
#define GARAGE_TRANSFER_CORE_BOUNDED_TASK_RUNNER_H

#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include "progress_reporter.h"
#include "transfer_types.h"
#include "types.h"

namespace garage::transfer {

namespace adapters {
class transfer_thread_pool_interface;
}  // namespace adapters

/**
 * @brief Operation applied to each work item
 *
 * Returns the number of bytes moved for the item. An error result or a
 * thrown exception marks the item as failed.
 */
using item_operation = std::function<result<uint64_t>(const work_item&)>;

/**
 * @brief Bounded concurrent executor for work items
 *
 * @code
 * bounded_task_runner runner;
 * auto outcomes = runner.run(items, 4, [&](const work_item& item) {
 *     return execute(item);
 * });
 * @endcode
 */
class bounded_task_runner {
public:
    /**
     * @param pool Pool to run workers on; when null, each run creates a pool
     *             with exactly as many workers as it needs
     * @param observer Receives item started/completed/failed events, may be null
     */
    explicit bounded_task_runner(
        std::shared_ptr<adapters::transfer_thread_pool_interface> pool = nullptr,
        std::shared_ptr<progress_observer> observer = nullptr);

    ~bounded_task_runner();

    bounded_task_runner(const bounded_task_runner&) = delete;
    auto operator=(const bounded_task_runner&) -> bounded_task_runner& = delete;

    /**
     * @brief Run every item with at most limit in flight
     * @param items Items to execute
     * @param limit Maximum concurrent operations, must be at least 1
     * @param op Operation applied to each item
     * @return One outcome per item, in input order; invalid_argument when
     *         limit is 0, internal_error when the pool accepts no worker
     *
     * Failures of single items are recorded in their outcome and never stop
     * the remaining items. The number of workers is also capped by the
     * pool's worker_count(). Exceptions thrown by the observer are logged
     * and ignored.
     */
    [[nodiscard]] auto run(std::vector<work_item> items,
                           std::size_t limit,
                           const item_operation& op)
        -> result<std::vector<transfer_outcome>>;

private:
    std::shared_ptr<adapters::transfer_thread_pool_interface> pool_;
    std::shared_ptr<progress_observer> observer_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_BOUNDED_TASK_RUNNER_H
