/**
 * @file progress_reporter.cpp
 * @brief Buffered progress delivery
 */

#include "garage/transfer/core/progress_reporter.h"

#include <algorithm>

#include "garage/transfer/core/logging.h"

namespace garage::transfer {

buffered_progress_reporter::buffered_progress_reporter(
    std::shared_ptr<progress_observer> inner, std::size_t capacity)
    : inner_(std::move(inner)), capacity_(std::max<std::size_t>(capacity, 1)) {
    dispatcher_ = std::thread([this]() { dispatch_loop(); });
}

buffered_progress_reporter::~buffered_progress_reporter() {
    stop();
}

void buffered_progress_reporter::on_event(const progress_event& event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            dropped_.fetch_add(1, std::memory_order_relaxed);
            return;
        }

        if (queue_.size() >= capacity_) {
            auto victim = std::find_if(queue_.begin(), queue_.end(), [](const auto& queued) {
                return queued.kind == progress_event_kind::item_bytes;
            });
            if (victim == queue_.end()) {
                victim = queue_.begin();
            }
            queue_.erase(victim);
            dropped_.fetch_add(1, std::memory_order_relaxed);
        }
        queue_.push_back(event);
    }
    not_empty_.notify_one();
}

void buffered_progress_reporter::flush() {
    std::unique_lock<std::mutex> lock(mutex_);
    drained_.wait(lock, [this]() { return queue_.empty() && !delivering_; });
}

void buffered_progress_reporter::stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) {
            return;
        }
        stopping_ = true;
    }
    not_empty_.notify_all();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
    auto dropped = dropped_.load(std::memory_order_relaxed);
    if (dropped > 0) {
        GT_LOG_DEBUG(log_category::runner,
                     "Progress reporter dropped " + std::to_string(dropped) + " events");
    }
}

void buffered_progress_reporter::dispatch_loop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        not_empty_.wait(lock, [this]() { return stopping_ || !queue_.empty(); });
        if (queue_.empty()) {
            // stopping_ with nothing left to deliver
            drained_.notify_all();
            return;
        }

        auto event = std::move(queue_.front());
        queue_.pop_front();
        delivering_ = true;
        lock.unlock();

        if (inner_) {
            inner_->on_event(event);
        }

        lock.lock();
        delivering_ = false;
        if (queue_.empty()) {
            drained_.notify_all();
        }
    }
}

}  // namespace garage::transfer
