#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace statusview::detail {

// Decimal (base 1000) size with four significant digits, e.g. "1.235MB".
std::string humanSize(double size);

// Duration as hours/minutes/seconds, e.g. "1h2m3s", "45s", "0s".
std::string formatDuration(std::chrono::seconds duration);

// Local time, nanoseconds always padded to nine digits:
// 2006-01-02T15:04:05.000000000Z07:00
std::string formatTimestamp(std::int64_t seconds, std::int64_t nanoseconds);

} // namespace statusview::detail
