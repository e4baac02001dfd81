#pragma once
#include <chrono>
#include <condition_variable>
#include <deque>
#include <mutex>
#include <optional>
#include "model/Snapshot.hpp"

namespace bwmon::app {

// Bounded snapshot queue between the sampler thread and one consumer thread.
// push() never blocks: when full the oldest snapshot is dropped.
class SnapshotChannel {
public:
  explicit SnapshotChannel(size_t capacity);
  SnapshotChannel(const SnapshotChannel&) = delete;
  SnapshotChannel& operator=(const SnapshotChannel&) = delete;

  // Returns false once the channel is closed.
  bool push(const model::Snapshot& s);

  // Waits up to timeout. std::nullopt on timeout or when closed and drained.
  std::optional<model::Snapshot> pop(std::chrono::milliseconds timeout);

  void close();
  [[nodiscard]] bool closed() const;
  [[nodiscard]] size_t size() const;
  [[nodiscard]] uint64_t dropped() const;

private:
  const size_t capacity_;
  mutable std::mutex mu_;
  std::condition_variable cv_;
  std::deque<model::Snapshot> queue_;
  bool closed_{false};
  uint64_t dropped_{0};
};

} // namespace bwmon::app
