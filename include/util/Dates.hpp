// Calendar-day helpers in local time
#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace bwmon::util {

using Date = std::chrono::year_month_day;

// "YYYY-MM-DD"
[[nodiscard]] std::string format_date(const Date& d);
[[nodiscard]] std::optional<Date> parse_date(std::string_view text);

// Epoch seconds of 00:00:00 local time on d.
[[nodiscard]] int64_t local_midnight(const Date& d);

// Local calendar date / hour of an epoch timestamp.
[[nodiscard]] Date local_date(int64_t epoch_secs);
[[nodiscard]] int local_hour(int64_t epoch_secs);

[[nodiscard]] Date add_days(const Date& d, int days);

[[nodiscard]] int64_t to_epoch_secs(std::chrono::system_clock::time_point tp);

} // namespace bwmon::util
