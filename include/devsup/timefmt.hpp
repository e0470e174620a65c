#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace devsup {

using SystemTime = std::chrono::system_clock::time_point;

// 2024-01-01T10:00:00Z, 2024-01-01T10:00:00.250+02:00, ...
std::optional<SystemTime> parse_rfc3339(std::string_view s);
// "YYYY-MM-DD HH:MM:SS" (or with 'T'), read as UTC.
std::optional<SystemTime> parse_datetime(std::string_view s);

std::string format_rfc3339(SystemTime t);       // UTC, millisecond precision
std::string format_utc(SystemTime t, const char *fmt);
std::string format_local_clock(SystemTime t);   // HH:MM:SS.mmm, local time

} // namespace devsup
