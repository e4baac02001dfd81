#include "app/SummaryManager.hpp"
#include "util/Log.hpp"

namespace bwmon::app {

SummaryManager::SummaryManager(std::shared_ptr<storage::IStorage> storage, SummaryOptions opts,
                               WallClock clock)
    : state_(std::make_shared<State>()) {
  state_->storage = std::move(storage);
  state_->opts = opts;
  state_->clock = clock ? std::move(clock) : []{ return std::chrono::system_clock::now(); };
}

SummaryManager::~SummaryManager() { stop(); }

void SummaryManager::start() {
  if (loop_.running()) {
    util::log_warn("SummaryManager", "already running");
    return;
  }
  util::log_info("SummaryManager", "started (retention %d days, sweep at %02d:00)",
                 state_->opts.retention_days, state_->opts.cleanup_hour);
  loop_.start([state = state_](std::stop_token st) {
    state->check_and_aggregate();
    state->cleanup(util::local_date(state->now()));
    while (sleep_for(st, state->opts.check_interval)) {
      try {
        state->check_and_aggregate();
        state->run_scheduled_cleanup();
      } catch (const std::exception& e) {
        util::log_error("SummaryManager", "check failed: %s", e.what());
        sleep_for(st, state->opts.error_backoff);
      }
    }
  });
}

void SummaryManager::stop() {
  if (!loop_.running()) return;
  loop_.stop(state_->opts.join_timeout);
  util::log_info("SummaryManager", "stopped");
}

bool SummaryManager::State::check_and_aggregate() {
  const auto today = util::local_date(now());
  {
    std::lock_guard<std::mutex> lk(mu);
    if (last_aggregation_date && *last_aggregation_date == today) return false;
  }
  const auto yesterday = util::add_days(today, -1);
  const auto day = util::format_date(yesterday);
  try {
    storage->aggregate_daily(yesterday);
  } catch (const std::exception& e) {
    util::log_error("SummaryManager", "aggregating %s failed: %s", day.c_str(), e.what());
    return false;
  }
  std::lock_guard<std::mutex> lk(mu);
  last_aggregation_date = today;
  return true;
}

bool SummaryManager::State::cleanup(const util::Date& today) {
  try {
    auto deleted = storage->cleanup_old_data_at(opts.retention_days, now());
    util::log_info("SummaryManager", "retention sweep removed %llu samples",
                   static_cast<unsigned long long>(deleted));
  } catch (const std::exception& e) {
    util::log_error("SummaryManager", "retention sweep failed: %s", e.what());
    return false;
  }
  std::lock_guard<std::mutex> lk(mu);
  last_cleanup_date = today;
  return true;
}

bool SummaryManager::State::run_scheduled_cleanup() {
  const int64_t t = now();
  if (util::local_hour(t) < opts.cleanup_hour) return false;
  const auto today = util::local_date(t);
  {
    std::lock_guard<std::mutex> lk(mu);
    if (last_cleanup_date && *last_cleanup_date == today) return false;
  }
  return cleanup(today);
}

bool SummaryManager::check_and_aggregate() { return state_->check_and_aggregate(); }

bool SummaryManager::run_scheduled_cleanup() { return state_->run_scheduled_cleanup(); }

void SummaryManager::aggregate_date(const util::Date& date) {
  auto day = util::format_date(date);
  try {
    state_->storage->aggregate_daily(date);
  } catch (const std::exception& e) {
    util::log_error("SummaryManager", "aggregating %s failed: %s", day.c_str(), e.what());
    throw;
  }
}

size_t SummaryManager::aggregate_date_range(const util::Date& start, const util::Date& end) {
  size_t done = 0;
  for (auto d = start; std::chrono::sys_days{d} <= std::chrono::sys_days{end}; d = util::add_days(d, 1)) {
    try {
      aggregate_date(d);
      ++done;
    } catch (const std::exception&) {
      // already logged by aggregate_date; keep going with the next day
    }
  }
  return done;
}

uint64_t SummaryManager::force_cleanup(int retention_days) {
  util::log_info("SummaryManager", "forced cleanup with %d days retention", retention_days);
  return state_->storage->cleanup_old_data_at(retention_days, state_->now());
}

std::optional<util::Date> SummaryManager::last_aggregation_date() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->last_aggregation_date;
}

} // namespace bwmon::app
