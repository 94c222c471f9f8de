// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file thread_pool_adapter.h
 * @brief Worker pools for the bounded task runner
 *
 * The runner submits one long-lived worker loop per concurrency slot.
 * Three pool implementations are available:
 * - thread_system's thread_pool when KCENON_WITH_THREAD_SYSTEM
 * - network_system's basic_thread_pool when only KCENON_WITH_NETWORK_SYSTEM
 * - one std::async thread per loop otherwise
 */

#pragma once

#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <string>

#include "../config/feature_flags.h"

#if KCENON_WITH_NETWORK_SYSTEM
#include <kcenon/network/integration/thread_integration.h>
#endif

#if KCENON_WITH_THREAD_SYSTEM
#include <kcenon/thread/core/thread_pool.h>
#endif

namespace garage::transfer::adapters {

/**
 * @brief Pool the task runner submits its worker loops to
 */
class transfer_thread_pool_interface {
public:
    virtual ~transfer_thread_pool_interface() = default;

    /**
     * @brief Queue a worker loop
     * @return Future that becomes ready when the loop returns; an exception
     *         escaping the loop is rethrown from future::get()
     * @throws std::system_error when no thread can be obtained
     */
    virtual std::future<void> submit(std::function<void()> task) = 0;

    /**
     * @brief Loops the pool can run at the same time
     *
     * The runner never submits more loops than this, so a loop never
     * waits for a thread while items are still queued.
     */
    [[nodiscard]] virtual size_t worker_count() const = 0;
};

#if KCENON_WITH_THREAD_SYSTEM

/**
 * @brief Pool backed by thread_system::thread_pool
 */
class thread_system_transfer_adapter : public transfer_thread_pool_interface {
public:
    thread_system_transfer_adapter(std::shared_ptr<kcenon::thread::thread_pool> pool,
                                   size_t worker_count);
    ~thread_system_transfer_adapter() override;

    thread_system_transfer_adapter(const thread_system_transfer_adapter&) = delete;
    thread_system_transfer_adapter& operator=(const thread_system_transfer_adapter&) = delete;

    /**
     * @brief Start a pool with worker_count thread_workers
     */
    [[nodiscard]] static std::shared_ptr<thread_system_transfer_adapter> start(
        size_t worker_count, const std::string& pool_name);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;

private:
    std::shared_ptr<kcenon::thread::thread_pool> pool_;
    size_t worker_count_;
};

#endif  // KCENON_WITH_THREAD_SYSTEM

#if KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief Pool backed by a network_system thread_pool_interface
 */
class network_pool_transfer_adapter : public transfer_thread_pool_interface {
public:
    explicit network_pool_transfer_adapter(
        std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool);
    ~network_pool_transfer_adapter() override;

    network_pool_transfer_adapter(const network_pool_transfer_adapter&) = delete;
    network_pool_transfer_adapter& operator=(const network_pool_transfer_adapter&) = delete;

    /**
     * @brief Wrap a new basic_thread_pool with worker_count threads
     */
    [[nodiscard]] static std::shared_ptr<network_pool_transfer_adapter> start(
        size_t worker_count);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;

private:
    std::shared_ptr<kcenon::network::integration::thread_pool_interface> pool_;
};

#endif  // KCENON_WITH_NETWORK_SYSTEM

/**
 * @brief One std::async thread per submitted loop
 */
class async_transfer_pool : public transfer_thread_pool_interface {
public:
    /// @param worker_count Reported capacity; 0 means hardware concurrency
    explicit async_transfer_pool(size_t worker_count = 0);

    std::future<void> submit(std::function<void()> task) override;
    [[nodiscard]] size_t worker_count() const override;

private:
    size_t worker_count_;
};

/**
 * @brief Picks thread_system, then network_system, then std::async
 */
class transfer_pool_factory {
public:
    /**
     * @param worker_count Threads to start; 0 means hardware concurrency
     * @param pool_name Pool name shown in thread_system diagnostics
     */
    [[nodiscard]] static std::shared_ptr<transfer_thread_pool_interface> create(
        size_t worker_count, const std::string& pool_name = "garage_transfer_pool");
};

}  // namespace garage::transfer::adapters
