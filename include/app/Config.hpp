#pragma once

#include <cstdint>
#include <string>
#include "app/NetworkSampler.hpp"
#include "app/PersistenceQueue.hpp"
#include "app/RecommendationEngine.hpp"
#include "app/SummaryManager.hpp"
#include "util/Log.hpp"

namespace bwmon::app {

struct Config {
  SamplerOptions sampler{};
  PersistenceOptions persistence{};
  SummaryOptions summary{};
  uint64_t threshold_bytes{kDefaultBandwidthThreshold};
  std::string db_path;
  util::LogLevel log_level{util::LogLevel::Info};
};

// $XDG_CONFIG_HOME/bwmon/config.toml, else ~/.config/bwmon/config.toml
std::string config_file_path();

// $XDG_DATA_HOME/bwmon/usage.db, else ~/.local/share/bwmon/usage.db
std::string default_db_path();

// Defaults <- config file (if present) <- BWMON_* environment. An empty path
// selects config_file_path().
Config load_config(const std::string& path = {});

// Environment variable helpers; BWMON_X and bwmon_X are both accepted.
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

} // namespace bwmon::app
