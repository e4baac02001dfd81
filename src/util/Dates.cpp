#include "util/Dates.hpp"

#include <charconv>
#include <cstdio>
#include <ctime>

namespace bwmon::util {

std::string format_date(const Date& d) {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02u-%02u", static_cast<int>(d.year()),
                static_cast<unsigned>(d.month()), static_cast<unsigned>(d.day()));
  return buf;
}

std::optional<Date> parse_date(std::string_view text) {
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') return std::nullopt;
  int y = 0; unsigned m = 0, d = 0;
  auto num = [&](size_t pos, size_t len, auto& out) {
    auto [p, ec] = std::from_chars(text.data() + pos, text.data() + pos + len, out);
    return ec == std::errc{} && p == text.data() + pos + len;
  };
  if (!num(0, 4, y) || !num(5, 2, m) || !num(8, 2, d)) return std::nullopt;
  Date date{std::chrono::year{y}, std::chrono::month{m}, std::chrono::day{d}};
  if (!date.ok()) return std::nullopt;
  return date;
}

int64_t local_midnight(const Date& d) {
  std::tm tm{};
  tm.tm_year = static_cast<int>(d.year()) - 1900;
  tm.tm_mon = static_cast<int>(static_cast<unsigned>(d.month())) - 1;
  tm.tm_mday = static_cast<int>(static_cast<unsigned>(d.day()));
  tm.tm_isdst = -1; // let the C library resolve DST for that date
  return static_cast<int64_t>(std::mktime(&tm));
}

Date local_date(int64_t epoch_secs) {
  std::time_t t = static_cast<std::time_t>(epoch_secs);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return Date{std::chrono::year{tm.tm_year + 1900},
              std::chrono::month{static_cast<unsigned>(tm.tm_mon + 1)},
              std::chrono::day{static_cast<unsigned>(tm.tm_mday)}};
}

int local_hour(int64_t epoch_secs) {
  std::time_t t = static_cast<std::time_t>(epoch_secs);
  std::tm tm{};
  ::localtime_r(&t, &tm);
  return tm.tm_hour;
}

Date add_days(const Date& d, int days) {
  return Date{std::chrono::sys_days{d} + std::chrono::days{days}};
}

int64_t to_epoch_secs(std::chrono::system_clock::time_point tp) {
  return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

} // namespace bwmon::util
