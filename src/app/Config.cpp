#include "app/Config.hpp"
#include "util/KeyFileReader.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>

namespace bwmon::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("BWMON_", 0) == 0) {
    alt = std::string("bwmon_") + n.substr(6);
  } else if (n.rfind("bwmon_", 0) == 0) {
    alt = std::string("BWMON_") + n.substr(6);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) {
    util::log_warn("Config", "ignoring non-numeric %s=%s", name, v);
    return defv;
  }
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/bwmon/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/bwmon/config.toml";
  return {};
}

std::string default_db_path() {
  if (const char* xdg = std::getenv("XDG_DATA_HOME"); xdg && *xdg)
    return std::string(xdg) + "/bwmon/usage.db";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.local/share/bwmon/usage.db";
  return "usage.db";
}

Config load_config(const std::string& path) {
  Config cfg;
  util::KeyFileReader kf;
  auto file = path.empty() ? config_file_path() : path;
  bool have_file = !file.empty() && std::filesystem::exists(file) && kf.load(file);
  if (!have_file && !path.empty()) util::log_warn("Config", "cannot read %s; using defaults", path.c_str());

  // File values (absent keys keep the compiled defaults), then environment
  int interval_ms = getenv_int("BWMON_SAMPLE_INTERVAL_MS",
      kf.get_int("sampler", "interval_ms", static_cast<int>(cfg.sampler.interval.count())));
  int join_ms = getenv_int("BWMON_JOIN_TIMEOUT_MS",
      kf.get_int("sampler", "join_timeout_ms", static_cast<int>(cfg.sampler.join_timeout.count())));
  int flush_ms = getenv_int("BWMON_FLUSH_INTERVAL_MS",
      kf.get_int("persistence", "flush_interval_ms", static_cast<int>(cfg.persistence.flush_interval.count())));
  int max_retained = getenv_int("BWMON_MAX_RETAINED",
      kf.get_int("persistence", "max_retained", static_cast<int>(cfg.persistence.max_retained)));
  int check_s = getenv_int("BWMON_CHECK_INTERVAL_S",
      kf.get_int("summary", "check_interval_s", static_cast<int>(cfg.summary.check_interval.count())));
  int retention = getenv_int("BWMON_RETENTION_DAYS",
      kf.get_int("summary", "retention_days", cfg.summary.retention_days));
  int hour = getenv_int("BWMON_CLEANUP_HOUR", kf.get_int("summary", "cleanup_hour", cfg.summary.cleanup_hour));

  int64_t threshold = kf.get_int64("recommend", "threshold_bytes", static_cast<int64_t>(cfg.threshold_bytes));
  if (const char* v = getenv_compat("BWMON_THRESHOLD_BYTES")) {
    try { threshold = std::stoll(v); } catch (const std::exception&) {
      util::log_warn("Config", "ignoring non-numeric BWMON_THRESHOLD_BYTES=%s", v);
    }
  }

  interval_ms = std::clamp(interval_ms, 100, 60000);
  join_ms = std::clamp(join_ms, 100, 60000);
  flush_ms = std::clamp(flush_ms, 100, 600000);
  max_retained = std::max(max_retained, 1);
  check_s = std::clamp(check_s, 1, 86400);
  retention = std::clamp(retention, 1, 3650);
  hour = std::clamp(hour, 0, 23);
  if (threshold <= 0) threshold = static_cast<int64_t>(kDefaultBandwidthThreshold);

  cfg.sampler.interval = std::chrono::milliseconds(interval_ms);
  cfg.sampler.join_timeout = std::chrono::milliseconds(join_ms);
  cfg.persistence.flush_interval = std::chrono::milliseconds(flush_ms);
  cfg.persistence.max_retained = static_cast<size_t>(max_retained);
  cfg.persistence.join_timeout = cfg.sampler.join_timeout;
  cfg.summary.check_interval = std::chrono::seconds(check_s);
  cfg.summary.retention_days = retention;
  cfg.summary.cleanup_hour = hour;
  cfg.summary.join_timeout = cfg.sampler.join_timeout;
  cfg.threshold_bytes = static_cast<uint64_t>(threshold);

  cfg.db_path = kf.get_string("storage", "path", default_db_path());
  if (const char* v = getenv_compat("BWMON_DB_PATH")) cfg.db_path = v;

  auto level_text = kf.get_string("log", "level", "info");
  if (const char* v = getenv_compat("BWMON_LOG_LEVEL")) level_text = v;
  if (auto lvl = util::parse_log_level(level_text)) cfg.log_level = *lvl;
  else util::log_warn("Config", "unknown log level '%s'", level_text.c_str());

  return cfg;
}

} // namespace bwmon::app
