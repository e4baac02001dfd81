#include "app/Monitor.hpp"
#include "collectors/ProcfsInfoProvider.hpp"
#include "storage/SqliteStorage.hpp"
#include "util/Log.hpp"

namespace bwmon::app {

namespace {

std::shared_ptr<collectors::IProcessInfoProvider> default_provider() {
  return std::make_shared<collectors::ProcfsInfoProvider>();
}

} // namespace

Monitor::Monitor(const Config& cfg)
  : Monitor(cfg, default_provider(), std::make_unique<collectors::ConnectionProxyEstimator>(),
            std::make_shared<storage::SqliteStorage>(cfg.db_path)) {}

Monitor::Monitor(const Config& cfg,
                 std::shared_ptr<collectors::IProcessInfoProvider> provider,
                 std::unique_ptr<collectors::NetworkIOEstimator> estimator,
                 std::shared_ptr<storage::IStorage> storage,
                 WallClock clock)
  : storage_(std::move(storage)),
    sampler_(std::move(provider), std::move(estimator), cfg.sampler),
    queue_(std::make_shared<PersistenceQueue>(storage_, cfg.persistence)),
    summary_(storage_, cfg.summary, std::move(clock)),
    engine_(cfg.threshold_bytes) {
  // Weak: a sampler loop detached on timeout may outlive this Monitor
  sampler_.subscribe([queue = std::weak_ptr<PersistenceQueue>(queue_)](const model::Snapshot& snap) {
    if (auto q = queue.lock()) q->enqueue_snapshot(snap);
  });
}

Monitor::~Monitor() { stop(); }

void Monitor::start() {
  if (running_) return;
  queue_->start();
  summary_.start();
  sampler_.start();
  running_ = true;
  util::log_info("Monitor", "started");
}

void Monitor::stop() {
  if (!running_) return;
  sampler_.stop();
  queue_->stop();
  summary_.stop();
  running_ = false;
  util::log_info("Monitor", "stopped");
}

std::vector<std::string> Monitor::get_recommendations() const {
  auto snap = sampler_.latest_snapshot();
  return engine_.evaluate(snap, model::total_bandwidth(snap));
}

std::vector<model::DailySummaryRow> Monitor::get_daily_summary(const util::Date& date) {
  return storage_->get_daily_summary(date);
}

std::vector<util::Date> Monitor::get_available_dates() {
  return storage_->get_available_dates();
}

} // namespace bwmon::app
