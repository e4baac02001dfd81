#include "util/Log.hpp"

#include <atomic>
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>
#include <mutex>
#include <string>

namespace bwmon::util {

static std::atomic<int> g_level{static_cast<int>(LogLevel::Info)};
// One line per call even with three loops logging concurrently
static std::mutex g_write_mu;

void set_log_level(LogLevel level) { g_level.store(static_cast<int>(level)); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load()); }

std::optional<LogLevel> parse_log_level(std::string_view text) {
  std::string s(text);
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (s == "debug") return LogLevel::Debug;
  if (s == "info") return LogLevel::Info;
  if (s == "warn" || s == "warning") return LogLevel::Warn;
  if (s == "error") return LogLevel::Error;
  return std::nullopt;
}

static void vlog(LogLevel level, const char* tag, const char* component, const char* fmt, va_list ap) {
  if (static_cast<int>(level) < g_level.load()) return;
  char msg[1024];
  std::vsnprintf(msg, sizeof(msg), fmt, ap);

  std::time_t now = std::time(nullptr);
  std::tm tm{};
  ::localtime_r(&now, &tm);
  char ts[32];
  std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);

  std::lock_guard<std::mutex> lk(g_write_mu);
  std::fprintf(stderr, "%s %s bwmon: %s: %s\n", ts, tag, component, msg);
}

void log_debug(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Debug, "DEBUG", component, fmt, ap); va_end(ap);
}

void log_info(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Info, "INFO ", component, fmt, ap); va_end(ap);
}

void log_warn(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Warn, "WARN ", component, fmt, ap); va_end(ap);
}

void log_error(const char* component, const char* fmt, ...) {
  va_list ap; va_start(ap, fmt); vlog(LogLevel::Error, "ERROR", component, fmt, ap); va_end(ap);
}

} // namespace bwmon::util
