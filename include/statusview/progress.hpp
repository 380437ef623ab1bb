#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>

namespace statusview {

using Clock = std::chrono::system_clock;
using NowFunc = std::function<Clock::time_point()>;

struct Progress {
    std::int64_t current{0};
    std::int64_t total{0};
    std::int64_t start{0};      // epoch seconds, 0 when unset
    bool hide_counts{false};    // don't show x/y
    std::string units;          // empty means bytes

    // rendering context, bound by the display before formatting
    int terminal_fd{-1};
    int win_size{0};
    NowFunc now_func;

    [[nodiscard]] int width() const;
    [[nodiscard]] Clock::time_point now() const;
};

// Renders the bar, counters and time-left estimate for one progress record.
// Returns an empty string when there is nothing to show.
[[nodiscard]] std::string formatProgress(const Progress& progress);

} // namespace statusview
