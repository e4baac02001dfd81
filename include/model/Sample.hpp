#pragma once
#include <cstdint>
#include <optional>
#include <string>

namespace bwmon::model {

// One process's traffic over one sampling interval. Byte fields are deltas.
struct Sample {
  int64_t timestamp{};      // epoch seconds
  int32_t pid{};
  std::string process_name;
  std::optional<std::string> app_name; // falls back to process_name when absent
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};

  [[nodiscard]] const std::string& effective_app_name() const {
    return app_name ? *app_name : process_name;
  }

  bool operator==(const Sample&) const = default;
};

struct DailySummaryRow {
  std::string app_name;
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
  uint64_t total_bytes{};
};

} // namespace bwmon::model
