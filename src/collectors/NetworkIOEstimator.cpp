#include "collectors/NetworkIOEstimator.hpp"

namespace bwmon::collectors {

ConnectionProxyEstimator::ConnectionProxyEstimator(uint64_t bytes_per_connection)
    : bytes_per_connection_(bytes_per_connection) {}

std::optional<IoCounters> ConnectionProxyEstimator::cumulative(int32_t pid, uint32_t connection_count) {
  auto& est = estimates_[pid];
  uint64_t step = static_cast<uint64_t>(connection_count) * bytes_per_connection_;
  est.bytes_sent += step;
  est.bytes_recv += step;
  return est;
}

void ConnectionProxyEstimator::retain(const std::unordered_set<int32_t>& live) {
  for (auto it = estimates_.begin(); it != estimates_.end(); ) {
    if (!live.count(it->first)) it = estimates_.erase(it); else ++it;
  }
}

ProviderCounterEstimator::ProviderCounterEstimator(std::shared_ptr<IProcessInfoProvider> provider,
                                                   std::unique_ptr<NetworkIOEstimator> fallback)
    : provider_(std::move(provider)), fallback_(std::move(fallback)) {}

std::optional<IoCounters> ProviderCounterEstimator::cumulative(int32_t pid, uint32_t connection_count) {
  if (auto io = provider_->get_cumulative_io(pid)) return io;
  if (fallback_) return fallback_->cumulative(pid, connection_count);
  return std::nullopt;
}

void ProviderCounterEstimator::retain(const std::unordered_set<int32_t>& live) {
  if (fallback_) fallback_->retain(live);
}

} // namespace bwmon::collectors
