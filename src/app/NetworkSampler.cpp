#include "app/NetworkSampler.hpp"
#include "util/Dates.hpp"
#include "util/Log.hpp"

#include <atomic>
#include <mutex>
#include <unordered_map>
#include <unordered_set>

using namespace std::chrono;

namespace bwmon::app {

namespace {
constexpr const char* kPermissionsWarning =
  "Limited network data available. For full per-process statistics, "
  "run as root or grant CAP_SYS_PTRACE and CAP_DAC_READ_SEARCH.";
}

struct NetworkSampler::State {
  State(std::shared_ptr<collectors::IProcessInfoProvider> p,
        std::unique_ptr<collectors::NetworkIOEstimator> e)
      : provider(std::move(p)), estimator(std::move(e)), resolver(provider) {}

  model::Snapshot capture(int64_t timestamp);
  // `live` is the running loop's flag; a loop that stop() gave up on
  // still finishes its tick but publishes nothing.
  model::Snapshot tick(const std::atomic<bool>* live = nullptr);
  void notify(const model::Snapshot& snap, const std::atomic<bool>* live);

  std::shared_ptr<collectors::IProcessInfoProvider> provider;
  std::unique_ptr<collectors::NetworkIOEstimator> estimator;
  ProcessInfoResolver resolver;

  // Held for a whole tick; only touched inside it
  std::mutex tick_mu;
  std::unordered_map<int32_t, collectors::IoCounters> previous;
  uint64_t seq{0};

  mutable std::mutex snapshot_mu;
  model::Snapshot latest;
  std::optional<std::string> permissions_warning;

  std::mutex listeners_mu;
  std::vector<SnapshotCallback> subscribers;
  std::vector<std::shared_ptr<SnapshotChannel>> channels;
};

model::Snapshot NetworkSampler::State::capture(int64_t timestamp) {
  model::Snapshot snap;
  snap.timestamp = timestamp;
  std::unordered_map<int32_t, collectors::IoCounters> current;
  std::unordered_set<int32_t> live;

  for (const auto& conn : provider->enumerate_active_connections()) {
    if (conn.connection_count == 0) continue;
    try {
      auto io = estimator->cumulative(conn.pid, conn.connection_count);
      if (!io) continue;
      live.insert(conn.pid);
      current[conn.pid] = *io;

      uint64_t d_sent = 0, d_recv = 0;
      auto prev = previous.find(conn.pid);
      if (prev != previous.end()) {
        d_sent = io->bytes_sent > prev->second.bytes_sent ? io->bytes_sent - prev->second.bytes_sent : 0;
        d_recv = io->bytes_recv > prev->second.bytes_recv ? io->bytes_recv - prev->second.bytes_recv : 0;
      } else {
        // Not seen last tick: the pid may belong to a new process now
        resolver.invalidate(conn.pid);
      }

      if (d_sent > 0 || d_recv > 0 || conn.connection_count > 0) {
        auto info = resolver.resolve(conn.pid);
        snap.processes[conn.pid] = model::ProcessUsage{
          info.process_name, info.app_name, d_sent, d_recv, conn.connection_count};
      }
    } catch (const std::exception& e) {
      util::log_debug("NetworkSampler", "skipping pid %d: %s", conn.pid, e.what());
    }
  }

  estimator->retain(live);
  previous = std::move(current);
  return snap;
}

model::Snapshot NetworkSampler::State::tick(const std::atomic<bool>* live) {
  std::lock_guard<std::mutex> tick_lk(tick_mu);
  auto snap = capture(util::to_epoch_secs(system_clock::now()));
  if (live && !live->load()) return snap;
  snap.seq = ++seq;
  {
    std::lock_guard<std::mutex> lk(snapshot_mu);
    latest = snap;
    if (snap.empty() && !permissions_warning) {
      permissions_warning = kPermissionsWarning;
      util::log_warn("NetworkSampler", "%s", kPermissionsWarning);
    }
  }
  notify(snap, live);
  return snap;
}

void NetworkSampler::State::notify(const model::Snapshot& snap, const std::atomic<bool>* live) {
  std::vector<SnapshotCallback> subs;
  std::vector<std::shared_ptr<SnapshotChannel>> chans;
  {
    std::lock_guard<std::mutex> lk(listeners_mu);
    subs = subscribers;
    // Drop channels whose consumer closed them
    std::erase_if(channels, [](const auto& c){ return c->closed(); });
    chans = channels;
  }
  for (auto& cb : subs) {
    if (live && !live->load()) return;
    try {
      cb(snap);
    } catch (const std::exception& e) {
      util::log_error("NetworkSampler", "subscriber failed: %s", e.what());
    } catch (...) {
      util::log_error("NetworkSampler", "subscriber failed: unknown exception");
    }
  }
  for (auto& ch : chans) ch->push(snap);
}

NetworkSampler::NetworkSampler(std::shared_ptr<collectors::IProcessInfoProvider> provider,
                               std::unique_ptr<collectors::NetworkIOEstimator> estimator,
                               SamplerOptions opts)
    : state_(std::make_shared<State>(std::move(provider), std::move(estimator))), opts_(opts) {}

NetworkSampler::~NetworkSampler() { stop(); }

void NetworkSampler::start() {
  if (loop_.running()) {
    util::log_warn("NetworkSampler", "already running");
    return;
  }
  util::log_info("NetworkSampler", "started (interval %lldms, estimator %s, provider %s)",
                 static_cast<long long>(opts_.interval.count()), state_->estimator->name(),
                 state_->provider->name());
  live_ = std::make_shared<std::atomic<bool>>(true);
  loop_.start([state = state_, live = live_, interval = opts_.interval](std::stop_token st) {
    while (!st.stop_requested()) {
      auto started = steady_clock::now();
      try {
        state->tick(live.get());
      } catch (const std::exception& e) {
        util::log_error("NetworkSampler", "tick failed: %s", e.what());
        sleep_for(st, interval);
        continue;
      }
      auto elapsed = steady_clock::now() - started;
      if (elapsed < interval) sleep_for(st, interval - elapsed);
    }
  });
}

void NetworkSampler::stop() {
  if (!loop_.running()) return;
  live_->store(false);
  loop_.stop(opts_.join_timeout);
  util::log_info("NetworkSampler", "stopped");
}

void NetworkSampler::subscribe(SnapshotCallback cb) {
  std::lock_guard<std::mutex> lk(state_->listeners_mu);
  state_->subscribers.push_back(std::move(cb));
}

std::shared_ptr<SnapshotChannel> NetworkSampler::open_channel(size_t capacity) {
  auto ch = std::make_shared<SnapshotChannel>(capacity);
  std::lock_guard<std::mutex> lk(state_->listeners_mu);
  state_->channels.push_back(ch);
  return ch;
}

model::Snapshot NetworkSampler::tick() { return state_->tick(); }

model::Snapshot NetworkSampler::latest_snapshot() const {
  std::lock_guard<std::mutex> lk(state_->snapshot_mu);
  return state_->latest;
}

model::BandwidthTotals NetworkSampler::total_bandwidth() const {
  return model::total_bandwidth(latest_snapshot());
}

std::vector<model::RankedProcess> NetworkSampler::top_processes(size_t n) const {
  return model::top_processes(latest_snapshot(), n);
}

std::optional<std::string> NetworkSampler::permissions_warning() const {
  std::lock_guard<std::mutex> lk(state_->snapshot_mu);
  return state_->permissions_warning;
}

ProcessInfoResolver& NetworkSampler::resolver() { return state_->resolver; }

} // namespace bwmon::app
