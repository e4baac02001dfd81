// Leveled stderr logging: "bwmon: <component>: message"
#pragma once
#include <optional>
#include <string_view>

namespace bwmon::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

void set_log_level(LogLevel level);
[[nodiscard]] LogLevel log_level();

// Accepts debug|info|warn|warning|error (case-insensitive).
[[nodiscard]] std::optional<LogLevel> parse_log_level(std::string_view text);

void log_debug(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_info(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_warn(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));
void log_error(const char* component, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace bwmon::util
