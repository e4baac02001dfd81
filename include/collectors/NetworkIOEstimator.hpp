#pragma once
#include "collectors/IProcessInfoProvider.hpp"
#include <memory>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace bwmon::collectors {

// Source of cumulative per-process network byte counters. Implementations may
// be approximations; the sampler only relies on counters being
// non-decreasing per pid while the process keeps its connections.
class NetworkIOEstimator {
public:
  virtual ~NetworkIOEstimator() = default;

  // std::nullopt: no counters for this pid this tick (the sampler skips it).
  [[nodiscard]] virtual std::optional<IoCounters> cumulative(int32_t pid, uint32_t connection_count) = 0;

  // Forget state for pids that were not observed this tick.
  virtual void retain(const std::unordered_set<int32_t>& live) { (void)live; }

  [[nodiscard]] virtual const char* name() const = 0;
};

// Best-effort proxy: each tick a process is credited bytes_per_connection
// per open connection in each direction. It says nothing about real traffic;
// it only ranks processes by how many sockets they hold over time.
class ConnectionProxyEstimator : public NetworkIOEstimator {
public:
  explicit ConnectionProxyEstimator(uint64_t bytes_per_connection = 1024);

  std::optional<IoCounters> cumulative(int32_t pid, uint32_t connection_count) override;
  void retain(const std::unordered_set<int32_t>& live) override;
  const char* name() const override { return "connection-proxy"; }

private:
  uint64_t bytes_per_connection_;
  std::unordered_map<int32_t, IoCounters> estimates_;
};

// Uses the provider's real per-process counters when it has them and defers
// to the fallback estimator for pids it cannot account.
class ProviderCounterEstimator : public NetworkIOEstimator {
public:
  ProviderCounterEstimator(std::shared_ptr<IProcessInfoProvider> provider,
                           std::unique_ptr<NetworkIOEstimator> fallback);

  std::optional<IoCounters> cumulative(int32_t pid, uint32_t connection_count) override;
  void retain(const std::unordered_set<int32_t>& live) override;
  const char* name() const override { return "provider-counters"; }

private:
  std::shared_ptr<IProcessInfoProvider> provider_;
  std::unique_ptr<NetworkIOEstimator> fallback_;
};

} // namespace bwmon::collectors
