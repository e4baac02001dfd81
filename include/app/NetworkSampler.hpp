#pragma once
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "app/LoopThread.hpp"
#include "app/ProcessInfoResolver.hpp"
#include "app/SnapshotChannel.hpp"
#include "collectors/IProcessInfoProvider.hpp"
#include "collectors/NetworkIOEstimator.hpp"
#include "model/Snapshot.hpp"

namespace bwmon::app {

struct SamplerOptions {
  std::chrono::milliseconds interval{1000};
  std::chrono::milliseconds join_timeout{5000};
};

using SnapshotCallback = std::function<void(const model::Snapshot&)>;

// Periodic per-process network sampler. Each tick enumerates processes with
// open inet sockets, diffs their cumulative counters against the previous
// tick and publishes a Snapshot of per-interval deltas.
class NetworkSampler {
public:
  NetworkSampler(std::shared_ptr<collectors::IProcessInfoProvider> provider,
                 std::unique_ptr<collectors::NetworkIOEstimator> estimator,
                 SamplerOptions opts = {});
  ~NetworkSampler();
  NetworkSampler(const NetworkSampler&) = delete;
  NetworkSampler& operator=(const NetworkSampler&) = delete;

  void start();
  void stop();
  [[nodiscard]] bool running() const { return loop_.running(); }

  // Called on the sampler thread after every tick, in registration order.
  // Keep callbacks cheap; exceptions are logged and swallowed. Callbacks run
  // while the tick lock is held, so they must not call tick(). After stop()
  // returns no further callbacks start, even from a detached loop; capture
  // shared or weak ownership of anything a callback touches.
  void subscribe(SnapshotCallback cb);

  // Channel fed after the subscribers; read it from the consumer's own thread.
  std::shared_ptr<SnapshotChannel> open_channel(size_t capacity = 8);

  // Capture and publish one snapshot on the calling thread. Ticks never overlap.
  model::Snapshot tick();

  [[nodiscard]] model::Snapshot latest_snapshot() const;
  [[nodiscard]] model::BandwidthTotals total_bandwidth() const;
  [[nodiscard]] std::vector<model::RankedProcess> top_processes(size_t n) const;

  // Set once, the first time a tick comes back empty.
  [[nodiscard]] std::optional<std::string> permissions_warning() const;

  ProcessInfoResolver& resolver();

private:
  struct State;
  std::shared_ptr<State> state_;
  // Cleared by stop(); the loop of the current run holds a copy
  std::shared_ptr<std::atomic<bool>> live_;
  SamplerOptions opts_;
  LoopThread loop_{"NetworkSampler"};
};

} // namespace bwmon::app
