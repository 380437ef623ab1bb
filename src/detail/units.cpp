#include "statusview/detail/units.hpp"

#include <array>
#include <cstdlib>
#include <ctime>

#include <fmt/chrono.h>
#include <fmt/format.h>

namespace statusview::detail {

namespace {

// Civil UTC time computed without std::tm, for instants localtime_r cannot
// represent (years beyond the range of int).
std::string formatUtc(std::int64_t seconds, std::int64_t nanoseconds) {
    constexpr std::int64_t seconds_per_day = 86400;

    std::int64_t days = seconds / seconds_per_day;
    std::int64_t second_of_day = seconds % seconds_per_day;
    if (second_of_day < 0) {
        second_of_day += seconds_per_day;
        --days;
    }

    // days since 1970-01-01 to year/month/day, proleptic Gregorian
    const std::int64_t z = days + 719468;
    const std::int64_t era = (z >= 0 ? z : z - 146096) / 146097;
    const std::int64_t day_of_era = z - era * 146097;
    const std::int64_t year_of_era =
        (day_of_era - day_of_era / 1460 + day_of_era / 36524 - day_of_era / 146096) / 365;
    const std::int64_t day_of_year = day_of_era - (365 * year_of_era + year_of_era / 4 - year_of_era / 100);
    const std::int64_t shifted_month = (5 * day_of_year + 2) / 153;
    const std::int64_t day = day_of_year - (153 * shifted_month + 2) / 5 + 1;
    const std::int64_t month = shifted_month < 10 ? shifted_month + 3 : shifted_month - 9;
    const std::int64_t year = year_of_era + era * 400 + (month <= 2 ? 1 : 0);

    return fmt::format("{:04}-{:02}-{:02}T{:02}:{:02}:{:02}.{:09}Z",
                       year, month, day,
                       second_of_day / 3600, second_of_day % 3600 / 60, second_of_day % 60,
                       nanoseconds);
}

} // namespace

std::string humanSize(double size) {
    constexpr double base = 1000.0;
    static constexpr std::array<const char*, 9> units{
        "B", "kB", "MB", "GB", "TB", "PB", "EB", "ZB", "YB"};

    std::size_t unit = 0;
    while (size >= base && unit + 1 < units.size()) {
        size /= base;
        ++unit;
    }
    return fmt::format("{:.4g}{}", size, units[unit]);
}

std::string formatDuration(std::chrono::seconds duration) {
    std::int64_t total = duration.count();
    if (total == 0) {
        return "0s";
    }

    std::string text;
    if (total < 0) {
        text.push_back('-');
        total = -total;
    }

    const std::int64_t hours = total / 3600;
    const std::int64_t minutes = (total % 3600) / 60;
    const std::int64_t seconds = total % 60;
    if (hours > 0) {
        text += fmt::format("{}h{}m{}s", hours, minutes, seconds);
    } else if (minutes > 0) {
        text += fmt::format("{}m{}s", minutes, seconds);
    } else {
        text += fmt::format("{}s", seconds);
    }
    return text;
}

std::string formatTimestamp(std::int64_t seconds, std::int64_t nanoseconds) {
    constexpr std::int64_t nanos_per_second = 1000000000;

    seconds += nanoseconds / nanos_per_second;
    nanoseconds %= nanos_per_second;
    if (nanoseconds < 0) {
        nanoseconds += nanos_per_second;
        --seconds;
    }

    const auto t = static_cast<std::time_t>(seconds);
    std::tm local{};
    if (localtime_r(&t, &local) == nullptr) {
        return formatUtc(seconds, nanoseconds);
    }

    std::string zone;
    const long offset_minutes = local.tm_gmtoff / 60;
    if (offset_minutes == 0) {
        zone = "Z";
    } else {
        zone = fmt::format("{}{:02}:{:02}",
                           offset_minutes < 0 ? '-' : '+',
                           std::labs(offset_minutes) / 60,
                           std::labs(offset_minutes) % 60);
    }

    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:09}{}", local, nanoseconds, zone);
}

} // namespace statusview::detail
