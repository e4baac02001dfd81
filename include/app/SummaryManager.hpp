#pragma once
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include "app/LoopThread.hpp"
#include "storage/IStorage.hpp"
#include "util/Dates.hpp"

namespace bwmon::app {

struct SummaryOptions {
  std::chrono::seconds check_interval{3600};
  int retention_days{90};
  int cleanup_hour{2};                  // local hour of the daily retention sweep
  std::chrono::seconds error_backoff{300};
  std::chrono::milliseconds join_timeout{5000};
};

using WallClock = std::function<std::chrono::system_clock::time_point()>;

// Rolls yesterday's raw samples into daily summaries once per day and purges
// samples older than the retention window.
class SummaryManager {
public:
  // An empty clock reads the system clock.
  explicit SummaryManager(std::shared_ptr<storage::IStorage> storage, SummaryOptions opts = {},
                          WallClock clock = {});
  ~SummaryManager();
  SummaryManager(const SummaryManager&) = delete;
  SummaryManager& operator=(const SummaryManager&) = delete;

  // The loop aggregates and sweeps once right away, then checks every
  // check_interval.
  void start();
  void stop();
  [[nodiscard]] bool running() const { return loop_.running(); }

  // Aggregates yesterday unless already done today. True if it aggregated.
  bool check_and_aggregate();

  // Retention sweep if the cleanup hour has been reached and it has not run
  // today. True if it ran.
  bool run_scheduled_cleanup();

  // Re-runnable; throws StorageError.
  void aggregate_date(const util::Date& date);

  // Each day in [start, end]; failures are logged and skipped. Returns the
  // number of days aggregated.
  size_t aggregate_date_range(const util::Date& start, const util::Date& end);

  // Immediate sweep with an explicit window; throws StorageError.
  uint64_t force_cleanup(int retention_days);

  [[nodiscard]] std::optional<util::Date> last_aggregation_date() const;

private:
  struct State {
    std::shared_ptr<storage::IStorage> storage;
    SummaryOptions opts;
    WallClock clock;
    mutable std::mutex mu; // accessor reads from other threads
    std::optional<util::Date> last_aggregation_date;
    std::optional<util::Date> last_cleanup_date;

    [[nodiscard]] int64_t now() const { return util::to_epoch_secs(clock()); }
    bool check_and_aggregate();
    bool cleanup(const util::Date& today);
    bool run_scheduled_cleanup();
  };

  std::shared_ptr<State> state_;
  LoopThread loop_{"SummaryManager"};
};

} // namespace bwmon::app
