/**
 * @file console_reporter.cpp
 * @brief Terminal progress rendering
 */

#include "garage/transfer/presentation/console_reporter.h"

#include <algorithm>
#include <array>
#include <iomanip>
#include <sstream>

namespace garage::transfer {

auto format_bytes(uint64_t bytes) -> std::string {
    if (bytes == 0) {
        return "0 B";
    }

    static constexpr std::array<const char*, 5> units = {"B", "KB", "MB", "GB", "TB"};
    std::size_t unit = 0;
    auto value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(2) << value << " " << units[unit];
    return oss.str();
}

auto render_progress_line(const std::string& key,
                          uint64_t transferred,
                          uint64_t total,
                          std::size_t width) -> std::string {
    double fraction = 1.0;
    if (total > 0) {
        fraction = std::min(1.0, static_cast<double>(transferred) /
                                     static_cast<double>(total));
    }
    auto filled = static_cast<std::size_t>(fraction * static_cast<double>(width));

    std::ostringstream oss;
    oss << key << " | [" << std::string(filled, '=') << std::string(width - filled, ' ')
        << "] | " << static_cast<int>(fraction * 100.0) << "% | "
        << format_bytes(transferred) << "/" << format_bytes(total);
    return oss.str();
}

console_progress_reporter::console_progress_reporter(std::ostream& out, bool show_bars)
    : out_(out), show_bars_(show_bars) {}

void console_progress_reporter::close_bar() {
    if (bar_open_) {
        out_ << "\n";
        bar_open_ = false;
    }
}

void console_progress_reporter::on_event(const progress_event& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    switch (event.kind) {
        case progress_event_kind::item_started:
            break;

        case progress_event_kind::item_bytes:
            if (show_bars_) {
                out_ << "\r" << render_progress_line(event.key, event.bytes_transferred,
                                                     event.total_bytes);
                out_.flush();
                bar_open_ = true;
            }
            break;

        case progress_event_kind::item_completed:
            close_bar();
            if (event.operation == "upload") {
                out_ << "Uploaded " << event.key << "\n";
            } else if (event.operation == "download") {
                out_ << "Downloaded " << event.key << "\n";
            } else {
                out_ << "Deleted " << event.key << "\n";
            }
            break;

        case progress_event_kind::item_failed:
            close_bar();
            out_ << "Failed " << event.key << ": " << event.error_message << "\n";
            break;
    }
}

}  // namespace garage::transfer
