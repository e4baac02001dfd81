#pragma once
#include <chrono>
#include <cstdint>
#include <stdexcept>
#include <vector>
#include "model/Sample.hpp"
#include "util/Dates.hpp"

namespace bwmon::storage {

class StorageError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Durable store for raw samples and daily per-app summaries. All operations
// throw StorageError on I/O or engine failure.
class IStorage {
public:
  virtual ~IStorage() = default;

  virtual void insert_sample(const model::Sample& s) = 0;
  // All-or-nothing.
  virtual void insert_samples_batch(const std::vector<model::Sample>& samples) = 0;

  // Inclusive bounds, ascending timestamp.
  [[nodiscard]] virtual std::vector<model::Sample> get_samples_for_range(int64_t start_ts, int64_t end_ts) = 0;

  // Replaces the summary rows of date with totals over [local midnight, +24h).
  virtual void aggregate_daily(const util::Date& date) = 0;

  // Ordered by total_bytes descending.
  [[nodiscard]] virtual std::vector<model::DailySummaryRow> get_daily_summary(const util::Date& date) = 0;

  // Deletes samples with timestamp < now_ts - retention_days * 86400.
  virtual uint64_t cleanup_old_data_at(int retention_days, int64_t now_ts) = 0;

  uint64_t cleanup_old_data(int retention_days) {
    return cleanup_old_data_at(retention_days, util::to_epoch_secs(std::chrono::system_clock::now()));
  }

  // Dates that have summary rows, most recent first.
  [[nodiscard]] virtual std::vector<util::Date> get_available_dates() = 0;

  [[nodiscard]] virtual uint64_t sample_count() = 0;
};

} // namespace bwmon::storage
