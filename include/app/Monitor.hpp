#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app/Config.hpp"
#include "app/NetworkSampler.hpp"
#include "app/PersistenceQueue.hpp"
#include "app/RecommendationEngine.hpp"
#include "app/SummaryManager.hpp"
#include "collectors/IProcessInfoProvider.hpp"
#include "collectors/NetworkIOEstimator.hpp"
#include "storage/IStorage.hpp"

namespace bwmon::app {

// Wires sampler -> persistence queue -> storage, plus the daily summary loop
// and the recommendation rules, behind one start()/stop().
class Monitor {
public:
  // Production wiring: procfs provider, connection-proxy estimator and the
  // SQLite store at cfg.db_path. Throws storage::StorageError if the
  // database cannot be opened.
  explicit Monitor(const Config& cfg);

  Monitor(const Config& cfg,
          std::shared_ptr<collectors::IProcessInfoProvider> provider,
          std::unique_ptr<collectors::NetworkIOEstimator> estimator,
          std::shared_ptr<storage::IStorage> storage,
          WallClock clock = {});
  ~Monitor();
  Monitor(const Monitor&) = delete;
  Monitor& operator=(const Monitor&) = delete;

  void start();
  // Sampler first so the queue's final flush sees the last snapshot.
  void stop();
  [[nodiscard]] bool running() const { return running_; }

  [[nodiscard]] model::Snapshot latest_snapshot() const { return sampler_.latest_snapshot(); }
  [[nodiscard]] model::BandwidthTotals total_bandwidth() const { return sampler_.total_bandwidth(); }
  [[nodiscard]] std::vector<model::RankedProcess> top_n_processes(size_t n) const { return sampler_.top_processes(n); }
  [[nodiscard]] std::vector<std::string> get_recommendations() const;
  [[nodiscard]] std::optional<std::string> permissions_warning() const { return sampler_.permissions_warning(); }

  std::vector<model::DailySummaryRow> get_daily_summary(const util::Date& date);
  std::vector<util::Date> get_available_dates();

  NetworkSampler& sampler() { return sampler_; }
  SummaryManager& summary() { return summary_; }

private:
  std::shared_ptr<storage::IStorage> storage_;
  NetworkSampler sampler_;
  std::shared_ptr<PersistenceQueue> queue_;
  SummaryManager summary_;
  RecommendationEngine engine_;
  bool running_{false};
};

} // namespace bwmon::app
