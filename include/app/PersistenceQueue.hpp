#pragma once
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <vector>
#include "app/LoopThread.hpp"
#include "model/Sample.hpp"
#include "model/Snapshot.hpp"
#include "storage/IStorage.hpp"

namespace bwmon::app {

struct PersistenceOptions {
  std::chrono::milliseconds flush_interval{5000};
  // Upper bound on buffered samples kept across failed flushes
  size_t max_retained{1000};
  std::chrono::milliseconds join_timeout{5000};
};

// Buffers samples in memory and writes them to storage in batches on a timer,
// so the sampler never waits on disk.
class PersistenceQueue {
public:
  explicit PersistenceQueue(std::shared_ptr<storage::IStorage> storage, PersistenceOptions opts = {});
  ~PersistenceQueue();
  PersistenceQueue(const PersistenceQueue&) = delete;
  PersistenceQueue& operator=(const PersistenceQueue&) = delete;

  void start();
  // Stops the timer, then flushes whatever is still buffered before returning.
  void stop();

  void enqueue(model::Sample s);
  // Queues entries with traffic. timestamp defaults to the snapshot's own,
  // or now if the snapshot has none.
  void enqueue_snapshot(const model::Snapshot& snap, std::optional<int64_t> timestamp = std::nullopt);

  // Synchronous flush. Returns the number of samples written (0 on failure).
  size_t flush();

  [[nodiscard]] size_t pending() const;
  [[nodiscard]] uint64_t persisted() const;
  [[nodiscard]] uint64_t dropped() const;

private:
  struct State {
    std::shared_ptr<storage::IStorage> storage;
    size_t max_retained{};
    mutable std::mutex mu;   // guards buffer
    std::vector<model::Sample> buffer;
    std::mutex flush_mu;     // one flush at a time
    std::atomic<uint64_t> persisted{0};
    std::atomic<uint64_t> dropped{0};

    size_t flush();
  };

  std::shared_ptr<State> state_;
  PersistenceOptions opts_;
  LoopThread loop_{"PersistenceQueue"};
};

} // namespace bwmon::app
