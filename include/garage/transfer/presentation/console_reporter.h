/**
 * @file console_reporter.h
 * @brief Terminal rendering of progress events and sizes
 */

#ifndef GARAGE_TRANSFER_PRESENTATION_CONSOLE_REPORTER_H
#define GARAGE_TRANSFER_PRESENTATION_CONSOLE_REPORTER_H

#include <cstdint>
#include <mutex>
#include <ostream>
#include <string>

#include "garage/transfer/core/progress_reporter.h"

namespace garage::transfer {

/**
 * @brief Human readable size, e.g. "1.50 KB"
 *
 * Zero prints as "0 B"; other values use two decimals and the largest
 * unit of B, KB, MB, GB, TB (powers of 1024) not exceeding the value.
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief One progress bar line: "key | [=====     ] | 50% | 512 B/1.00 KB"
 * @param width Number of cells inside the brackets
 */
[[nodiscard]] auto render_progress_line(const std::string& key,
                                        uint64_t transferred,
                                        uint64_t total,
                                        std::size_t width = 40) -> std::string;

/**
 * @brief progress_observer writing to a terminal stream
 *
 * Byte events redraw the current bar in place. Completions print
 * "Uploaded key", "Downloaded key" or "Deleted key" on their own line;
 * failures print "Failed key: reason".
 */
class console_progress_reporter : public progress_observer {
public:
    /**
     * @param out Destination stream, usually std::cout
     * @param show_bars Draw progress bars for byte events
     */
    explicit console_progress_reporter(std::ostream& out, bool show_bars = true);

    void on_event(const progress_event& event) override;

private:
    void close_bar();

    std::ostream& out_;
    bool show_bars_;
    bool bar_open_ = false;
    std::mutex mutex_;
};

}  // namespace garage::transfer

#endif  // GARAGE_TRANSFER_PRESENTATION_CONSOLE_REPORTER_H
