#pragma once
#include <atomic>
#include <cstdint>
#include <string>
#include <vector>
#include "model/Snapshot.hpp"

namespace bwmon::app {

inline constexpr uint64_t kDefaultBandwidthThreshold = 5ull * 1024 * 1024; // bytes/s

struct AppUsage {
  std::string app_name;
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
  uint64_t total{};
  std::vector<int32_t> pids;
};

// Rule-based advice for cutting bandwidth use. Rules run in a fixed order
// and their advisories are concatenated in that order:
//   1. single app above 50% of the total
//   2. cloud sync services together above 20%
//   3. each system process above 15%
//   4. total above the configured threshold
//   5. three or more apps each within [10%, 50%]
// Byte counts are taken as per-second rates (one default sampling interval).
class RecommendationEngine {
public:
  explicit RecommendationEngine(uint64_t threshold_bytes = kDefaultBandwidthThreshold);

  [[nodiscard]] std::vector<std::string> evaluate(const model::Snapshot& snapshot,
                                                  const model::BandwidthTotals& totals) const;

  void set_threshold(uint64_t threshold_bytes);
  [[nodiscard]] uint64_t threshold() const { return threshold_.load(); }

  // Per-app totals in first-seen order (snapshot pid order).
  [[nodiscard]] static std::vector<AppUsage> aggregate_by_app(const model::Snapshot& snapshot);

private:
  std::atomic<uint64_t> threshold_;
};

} // namespace bwmon::app
