// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.cpp
 * @brief Worker pools for the bounded task runner
 */

#include "garage/transfer/adapters/thread_pool_adapter.h"

#include <thread>

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/job.h>
#include <kcenon/thread/core/job_queue.h>
#include <kcenon/thread/core/thread_worker.h>
#endif

namespace garage::transfer::adapters {

namespace {

auto effective_workers(size_t requested) -> size_t {
    if (requested > 0) {
        return requested;
    }
    auto cores = std::thread::hardware_concurrency();
    return cores > 0 ? cores : 4;
}

}  // namespace

// ============================================================================
// thread_system
// ============================================================================

#if KCENON_WITH_THREAD_SYSTEM

namespace {

/**
 * @brief thread_system job running one worker loop and settling its promise
 */
class worker_loop_job : public kcenon::thread::job {
public:
    worker_loop_job(std::function<void()> loop, std::shared_ptr<std::promise<void>> done)
        : job("garage_worker_loop"), loop_(std::move(loop)), done_(std::move(done)) {}

    [[nodiscard]] auto do_work() -> common::VoidResult override {
        try {
            loop_();
            done_->set_value();
        } catch (...) {
            done_->set_exception(std::current_exception());
        }
        return common::ok();
    }

private:
    std::function<void()> loop_;
    std::shared_ptr<std::promise<void>> done_;
};

}  // namespace

thread_system_transfer_adapter::thread_system_transfer_adapter(
    std::shared_ptr<kcenon::thread::thread_pool> pool, size_t worker_count)
    : pool_(std::move(pool)), worker_count_(worker_count) {}

thread_system_transfer_adapter::~thread_system_transfer_adapter() = default;

std::shared_ptr<thread_system_transfer_adapter> thread_system_transfer_adapter::start(
    size_t worker_count, const std::string& pool_name) {
    const auto workers = effective_workers(worker_count);
    auto pool = std::make_shared<kcenon::thread::thread_pool>(pool_name);
    for (size_t i = 0; i < workers; ++i) {
        auto worker = std::make_unique<kcenon::thread::thread_worker>();
        worker->set_job_queue(pool->get_job_queue());
        pool->enqueue(std::move(worker));
    }
    pool->start();
    return std::make_shared<thread_system_transfer_adapter>(std::move(pool), workers);
}

std::future<void> thread_system_transfer_adapter::submit(std::function<void()> task) {
    auto done = std::make_shared<std::promise<void>>();
    auto future = done->get_future();
    pool_->enqueue(std::make_unique<worker_loop_job>(std::move(task), std::move(done)));
    return future;
}

size_t thread_system_transfer_adapter::worker_count() const {
    return worker_count_;
}

#endif  // KCENON_WITH_THREAD_SYSTEM

// ============================================================================
// network_system
// ============================================================================

#if KCENON_WITH_NETWORK_SYSTEM

network_pool_transfer_adapter::network_pool_transfer_adapter(
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool)
    : pool_(std::move(pool)) {}

network_pool_transfer_adapter::~network_pool_transfer_adapter() = default;

std::shared_ptr<network_pool_transfer_adapter> network_pool_transfer_adapter::start(
    size_t worker_count) {
    return std::make_shared<network_pool_transfer_adapter>(
        std::make_shared<kcenon::network::integration::basic_thread_pool>(
            effective_workers(worker_count)));
}

std::future<void> network_pool_transfer_adapter::submit(std::function<void()> task) {
    return pool_->submit(std::move(task));
}

size_t network_pool_transfer_adapter::worker_count() const {
    return pool_->worker_count();
}

#endif  // KCENON_WITH_NETWORK_SYSTEM

// ============================================================================
// std::async
// ============================================================================

async_transfer_pool::async_transfer_pool(size_t worker_count)
    : worker_count_(effective_workers(worker_count)) {}

std::future<void> async_transfer_pool::submit(std::function<void()> task) {
    return std::async(std::launch::async, std::move(task));
}

size_t async_transfer_pool::worker_count() const {
    return worker_count_;
}

// ============================================================================
// Factory
// ============================================================================

std::shared_ptr<transfer_thread_pool_interface> transfer_pool_factory::create(
    size_t worker_count, const std::string& pool_name) {
#if KCENON_WITH_THREAD_SYSTEM
    return thread_system_transfer_adapter::start(worker_count, pool_name);
#elif KCENON_WITH_NETWORK_SYSTEM
    (void)pool_name;
    return network_pool_transfer_adapter::start(worker_count);
#else
    (void)pool_name;
    return std::make_shared<async_transfer_pool>(worker_count);
#endif
}

}  // namespace garage::transfer::adapters
