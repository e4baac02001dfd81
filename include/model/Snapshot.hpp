#pragma once
#include <cstdint>
#include <map>
#include <string>
#include <vector>

namespace bwmon::model {

struct ProcessUsage {
  std::string process_name;
  std::string app_name;
  uint64_t bytes_sent{};  // delta since previous tick
  uint64_t bytes_recv{};
  uint32_t connection_count{};

  [[nodiscard]] uint64_t total() const { return bytes_sent + bytes_recv; }
};

// One sampling tick. Only processes with traffic or open connections appear.
struct Snapshot {
  uint64_t seq{};
  int64_t timestamp{}; // epoch seconds at tick start
  std::map<int32_t, ProcessUsage> processes; // by pid

  [[nodiscard]] bool empty() const { return processes.empty(); }
};

struct BandwidthTotals {
  uint64_t bytes_sent{};
  uint64_t bytes_recv{};
  uint64_t total{};
};

struct RankedProcess {
  int32_t pid{};
  ProcessUsage usage;
};

[[nodiscard]] BandwidthTotals total_bandwidth(const Snapshot& s);

// Up to n entries ordered by sent+recv descending (pid ascending on ties).
[[nodiscard]] std::vector<RankedProcess> top_processes(const Snapshot& s, size_t n);

} // namespace bwmon::model
