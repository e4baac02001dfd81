#include "model/Snapshot.hpp"
#include <algorithm>

namespace bwmon::model {

BandwidthTotals total_bandwidth(const Snapshot& s) {
  BandwidthTotals t;
  for (const auto& [pid, u] : s.processes) {
    t.bytes_sent += u.bytes_sent;
    t.bytes_recv += u.bytes_recv;
  }
  t.total = t.bytes_sent + t.bytes_recv;
  return t;
}

std::vector<RankedProcess> top_processes(const Snapshot& s, size_t n) {
  std::vector<RankedProcess> out;
  out.reserve(s.processes.size());
  for (const auto& [pid, u] : s.processes) out.push_back(RankedProcess{pid, u});
  // map iteration already yields pid order, so a stable sort keeps pid ascending on ties
  std::stable_sort(out.begin(), out.end(), [](const RankedProcess& a, const RankedProcess& b) {
    return a.usage.total() > b.usage.total();
  });
  if (out.size() > n) out.resize(n);
  return out;
}

} // namespace bwmon::model
