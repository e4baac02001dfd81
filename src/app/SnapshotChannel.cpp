#include "app/SnapshotChannel.hpp"

namespace bwmon::app {

SnapshotChannel::SnapshotChannel(size_t capacity) : capacity_(capacity == 0 ? 1 : capacity) {}

bool SnapshotChannel::push(const model::Snapshot& s) {
  {
    std::lock_guard<std::mutex> lk(mu_);
    if (closed_) return false;
    if (queue_.size() >= capacity_) { queue_.pop_front(); ++dropped_; }
    queue_.push_back(s);
  }
  cv_.notify_one();
  return true;
}

std::optional<model::Snapshot> SnapshotChannel::pop(std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lk(mu_);
  if (!cv_.wait_for(lk, timeout, [&]{ return !queue_.empty() || closed_; })) return std::nullopt;
  if (queue_.empty()) return std::nullopt;
  auto s = std::move(queue_.front());
  queue_.pop_front();
  return s;
}

void SnapshotChannel::close() {
  {
    std::lock_guard<std::mutex> lk(mu_);
    closed_ = true;
  }
  cv_.notify_all();
}

bool SnapshotChannel::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

size_t SnapshotChannel::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return queue_.size();
}

uint64_t SnapshotChannel::dropped() const {
  std::lock_guard<std::mutex> lk(mu_);
  return dropped_;
}

} // namespace bwmon::app
