#include "statusview/progress.hpp"
#include "statusview/detail/units.hpp"

#include <algorithm>
#include <limits>

#include <fmt/format.h>
#include <sys/ioctl.h>

namespace statusview {

namespace {

constexpr int bar_slots = 50;
constexpr int bar_min_width = 110;
constexpr int time_left_min_width = 50;
constexpr int default_width = 200;

int percentageOf(std::int64_t current, std::int64_t total) {
    if (current <= 0) {
        return 0;
    }
    if (current >= total) {
        return bar_slots;
    }
    if (current > std::numeric_limits<std::int64_t>::max() / 100) {
        return static_cast<int>(static_cast<double>(current) / static_cast<double>(total) * 100.0) / 2;
    }
    return static_cast<int>(current * 100 / total) / 2;
}

std::int64_t saturatingSub(std::int64_t a, std::int64_t b) {
    constexpr auto max = std::numeric_limits<std::int64_t>::max();
    constexpr auto min = std::numeric_limits<std::int64_t>::min();
    if (b > 0 && a < min + b) {
        return min;
    }
    if (b < 0 && a > max + b) {
        return max;
    }
    return a - b;
}

std::string timeLeft(const Progress& progress) {
    using std::chrono::nanoseconds;
    constexpr std::int64_t nanos_per_second = 1000000000;
    constexpr auto max_ns = std::numeric_limits<std::int64_t>::max();
    constexpr auto max_start = max_ns / nanos_per_second;

    // a start beyond the nanosecond range lies after any representable now
    const std::int64_t now_ns =
        std::chrono::duration_cast<nanoseconds>(progress.now().time_since_epoch()).count();
    const std::int64_t elapsed = progress.start > max_start
        ? -max_ns
        : std::max(-max_ns, saturatingSub(now_ns, progress.start * nanos_per_second));
    const std::int64_t per_entry = elapsed / progress.current;
    const std::int64_t remaining = progress.total - progress.current;

    std::int64_t left = 0;
    if (per_entry != 0 && remaining > max_ns / (per_entry < 0 ? -per_entry : per_entry)) {
        left = per_entry < 0 ? -max_ns : max_ns;
    } else {
        left = remaining * per_entry;
    }

    return detail::formatDuration(
        std::chrono::duration_cast<std::chrono::seconds>(nanoseconds{left}));
}

} // namespace

int Progress::width() const {
    if (win_size != 0) {
        return win_size;
    }
    winsize ws{};
    if (terminal_fd >= 0 && ::ioctl(terminal_fd, TIOCGWINSZ, &ws) == 0) {
        return ws.ws_col;
    }
    return default_width;
}

Clock::time_point Progress::now() const {
    if (now_func) {
        return now_func();
    }
    return Clock::now();
}

std::string formatProgress(const Progress& progress) {
    if (progress.current <= 0 && progress.total <= 0) {
        return {};
    }
    if (progress.total <= 0) {
        if (progress.units.empty()) {
            return fmt::format("{:>8}", detail::humanSize(static_cast<double>(progress.current)));
        }
        return fmt::format("{} {}", progress.current, progress.units);
    }

    const int width = progress.width();
    const int percentage = percentageOf(progress.current, progress.total);

    std::string bar;
    if (width > bar_min_width) {
        bar = fmt::format("[{}>{}] ",
                          std::string(static_cast<std::size_t>(percentage), '='),
                          std::string(static_cast<std::size_t>(bar_slots - percentage), ' '));
    }

    std::string numbers;
    const bool wonky = progress.current > progress.total;
    if (progress.hide_counts) {
        // nothing
    } else if (progress.units.empty()) {
        const auto current = detail::humanSize(static_cast<double>(progress.current));
        if (wonky) {
            numbers = fmt::format("{:>8}", current);
        } else {
            numbers = fmt::format("{:>8}/{}", current,
                                  detail::humanSize(static_cast<double>(progress.total)));
        }
    } else if (wonky) {
        numbers = fmt::format("{} {}", progress.current, progress.units);
    } else {
        numbers = fmt::format("{}/{} {}", progress.current, progress.total, progress.units);
    }

    std::string left;
    if (progress.current > 0 && progress.start > 0 && percentage < bar_slots
        && width > time_left_min_width) {
        left = " " + timeLeft(progress);
    }

    return bar + numbers + left;
}

} // namespace statusview
