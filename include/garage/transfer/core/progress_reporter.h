/**
 * @file progress_reporter.h
 * @brief Progress events and observers for transfer runs
 *
 * The transfer core pushes item-level and byte-level events into a
 * progress_observer. buffered_progress_reporter decouples the core from
 * slow observers: events are queued and delivered from a dedicated
 * thread, and the oldest byte events are dropped when the queue is full.
 */

#ifndef GARAGE_TRANSFER_CORE_PROGRESS_REPORTER_H
#define GARAGE_TRANSFER_CORE_PROGRESS_REPORTER_H

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>

namespace garage::transfer {

/**
 * @brief Kind of progress event
 */
enum class progress_event_kind {
    item_started,
    item_bytes,
    item_completed,
    item_failed,
};

[[nodiscard]] constexpr auto to_string(progress_event_kind kind) noexcept
    -> std::string_view {
    switch (kind) {
        case progress_event_kind::item_started:
            return "started";
        case progress_event_kind::item_bytes:
            return "bytes";
        case progress_event_kind::item_completed:
            return "completed";
        case progress_event_kind::item_failed:
            return "failed";
        default:
            return "unknown";
    }
}

/**
 * @brief One progress notification
 */
struct progress_event {
    progress_event_kind kind = progress_event_kind::item_started;
    std::string operation;  ///< "upload", "download" or "delete"
    std::string key;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    std::string error_message;  ///< Set for item_failed

    [[nodiscard]] auto percentage() const noexcept -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_transferred) /
               static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Receiver of progress events
 *
 * on_event may be called from several worker threads at once unless the
 * observer is wrapped in a buffered_progress_reporter.
 */
class progress_observer {
public:
    virtual ~progress_observer() = default;

    virtual void on_event(const progress_event& event) = 0;
};

/**
 * @brief Non-blocking decorator delivering events from its own thread
 *
 * on_event never waits for the wrapped observer. When capacity events are
 * already queued, the oldest item_bytes event is evicted; if none is
 * queued, the oldest event of any kind is evicted.
 */
class buffered_progress_reporter : public progress_observer {
public:
    /**
     * @param inner Observer receiving the events, called from one thread only
     * @param capacity Maximum queued events (at least 1)
     */
    explicit buffered_progress_reporter(std::shared_ptr<progress_observer> inner,
                                        std::size_t capacity = 1024);
    ~buffered_progress_reporter() override;

    buffered_progress_reporter(const buffered_progress_reporter&) = delete;
    auto operator=(const buffered_progress_reporter&) -> buffered_progress_reporter& = delete;

    void on_event(const progress_event& event) override;

    /**
     * @brief Block until every queued event has been delivered
     */
    void flush();

    /**
     * @brief Deliver what is queued, then stop the delivery thread
     */
    void stop();

    [[nodiscard]] auto dropped_count() const noexcept -> uint64_t {
        return dropped_.load(std::memory_order_relaxed);
    }

private:
    void dispatch_loop();

    std::shared_ptr<progress_observer> inner_;
    std::size_t capacity_;
    std::deque<progress_event> queue_;
    std::mutex mutex_;
    std::condition_variable not_empty_;
    std::condition_variable drained_;
    bool delivering_ = false;
    bool stopping_ = false;
    std::atomic<uint64_t> dropped_{0};
    std::thread dispatcher_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_CORE_PROGRESS_REPORTER_H
