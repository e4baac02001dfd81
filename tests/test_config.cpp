#include "minitest.hpp"
#include "app/Config.hpp"

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

const char* kEnvVars[] = {
  "BWMON_SAMPLE_INTERVAL_MS", "BWMON_JOIN_TIMEOUT_MS", "BWMON_FLUSH_INTERVAL_MS", "BWMON_MAX_RETAINED",
  "BWMON_CHECK_INTERVAL_S", "BWMON_RETENTION_DAYS", "BWMON_CLEANUP_HOUR", "BWMON_THRESHOLD_BYTES",
  "BWMON_DB_PATH", "BWMON_LOG_LEVEL", "bwmon_CLEANUP_HOUR"};

struct CleanEnv {
  CleanEnv() { clear(); }
  ~CleanEnv() { clear(); }
  static void clear() { for (const char* v : kEnvVars) ::unsetenv(v); }
};

std::string write_config(const char* name, const std::string& body) {
  auto path = std::filesystem::temp_directory_path() /
              ("bwmon_test_cfg_" + std::to_string(::getpid()) + "_" + name + ".toml");
  std::ofstream(path) << body;
  return path.string();
}

} // namespace

TEST(config_defaults_without_file) {
  CleanEnv env;
  auto cfg = bwmon::app::load_config("/tmp/bwmon_test_cfg_does_not_exist.toml");
  ASSERT_EQ(cfg.sampler.interval, 1000ms);
  ASSERT_EQ(cfg.sampler.join_timeout, 5000ms);
  ASSERT_EQ(cfg.persistence.flush_interval, 5000ms);
  ASSERT_EQ(cfg.persistence.max_retained, 1000u);
  ASSERT_EQ(cfg.summary.check_interval, 3600s);
  ASSERT_EQ(cfg.summary.retention_days, 90);
  ASSERT_EQ(cfg.summary.cleanup_hour, 2);
  ASSERT_EQ(cfg.threshold_bytes, 5u * 1024 * 1024);
  ASSERT_TRUE(cfg.log_level == bwmon::util::LogLevel::Info);
  ASSERT_TRUE(cfg.db_path.size() >= 8 && cfg.db_path.compare(cfg.db_path.size() - 8, 8, "usage.db") == 0);
}

TEST(config_file_values) {
  CleanEnv env;
  auto path = write_config("file",
    "[sampler]\ninterval_ms = 2500\n"
    "[persistence]\nflush_interval_ms = 10000\nmax_retained = 50\n"
    "[summary]\nretention_days = 30\ncleanup_hour = 4\n"
    "[recommend]\nthreshold_bytes = 1048576\n"
    "[storage]\npath = \"/var/tmp/bw.db\"\n"
    "[log]\nlevel = \"debug\"\n");
  auto cfg = bwmon::app::load_config(path);
  ASSERT_EQ(cfg.sampler.interval, 2500ms);
  ASSERT_EQ(cfg.persistence.flush_interval, 10000ms);
  ASSERT_EQ(cfg.persistence.max_retained, 50u);
  ASSERT_EQ(cfg.summary.retention_days, 30);
  ASSERT_EQ(cfg.summary.cleanup_hour, 4);
  ASSERT_EQ(cfg.threshold_bytes, 1048576u);
  ASSERT_EQ(cfg.db_path, "/var/tmp/bw.db");
  ASSERT_TRUE(cfg.log_level == bwmon::util::LogLevel::Debug);
  std::filesystem::remove(path);
}

TEST(config_environment_overrides_file) {
  CleanEnv env;
  auto path = write_config("env", "[summary]\nretention_days = 30\n[storage]\npath = /a.db\n");
  ::setenv("BWMON_RETENTION_DAYS", "14", 1);
  ::setenv("BWMON_DB_PATH", "/b.db", 1);
  ::setenv("bwmon_CLEANUP_HOUR", "5", 1);
  ::setenv("BWMON_LOG_LEVEL", "warning", 1);
  auto cfg = bwmon::app::load_config(path);
  ASSERT_EQ(cfg.summary.retention_days, 14);
  ASSERT_EQ(cfg.db_path, "/b.db");
  ASSERT_EQ(cfg.summary.cleanup_hour, 5);
  ASSERT_TRUE(cfg.log_level == bwmon::util::LogLevel::Warn);
  std::filesystem::remove(path);
}

TEST(config_clamps_out_of_range_values) {
  CleanEnv env;
  auto path = write_config("clamp",
    "[sampler]\ninterval_ms = 5\n[summary]\nretention_days = 0\ncleanup_hour = 31\n"
    "[recommend]\nthreshold_bytes = -3\n[log]\nlevel = chatty\n");
  auto cfg = bwmon::app::load_config(path);
  ASSERT_EQ(cfg.sampler.interval, 100ms);
  ASSERT_EQ(cfg.summary.retention_days, 1);
  ASSERT_EQ(cfg.summary.cleanup_hour, 23);
  ASSERT_EQ(cfg.threshold_bytes, 5u * 1024 * 1024);
  ASSERT_TRUE(cfg.log_level == bwmon::util::LogLevel::Info);
  std::filesystem::remove(path);
}

TEST(config_getenv_int_ignores_garbage) {
  CleanEnv env;
  ::setenv("BWMON_MAX_RETAINED", "many", 1);
  ASSERT_EQ(bwmon::app::getenv_int("BWMON_MAX_RETAINED", 12), 12);
  ::setenv("BWMON_MAX_RETAINED", "64", 1);
  ASSERT_EQ(bwmon::app::getenv_int("BWMON_MAX_RETAINED", 12), 64);
}

TEST(config_paths_follow_xdg) {
  const char* old_cfg = std::getenv("XDG_CONFIG_HOME");
  const char* old_data = std::getenv("XDG_DATA_HOME");
  std::string saved_cfg = old_cfg ? old_cfg : "";
  std::string saved_data = old_data ? old_data : "";
  ::setenv("XDG_CONFIG_HOME", "/xdg/config", 1);
  ::setenv("XDG_DATA_HOME", "/xdg/data", 1);
  ASSERT_EQ(bwmon::app::config_file_path(), "/xdg/config/bwmon/config.toml");
  ASSERT_EQ(bwmon::app::default_db_path(), "/xdg/data/bwmon/usage.db");
  if (old_cfg) ::setenv("XDG_CONFIG_HOME", saved_cfg.c_str(), 1); else ::unsetenv("XDG_CONFIG_HOME");
  if (old_data) ::setenv("XDG_DATA_HOME", saved_data.c_str(), 1); else ::unsetenv("XDG_DATA_HOME");
}

TEST(config_log_level_names) {
  using bwmon::util::LogLevel;
  ASSERT_TRUE(bwmon::util::parse_log_level("DEBUG") == LogLevel::Debug);
  ASSERT_TRUE(bwmon::util::parse_log_level("Warning") == LogLevel::Warn);
  ASSERT_FALSE(bwmon::util::parse_log_level("loud").has_value());
  auto saved = bwmon::util::log_level();
  bwmon::util::set_log_level(LogLevel::Debug);
  ASSERT_TRUE(bwmon::util::log_level() == LogLevel::Debug);
  bwmon::util::set_log_level(saved);
}
