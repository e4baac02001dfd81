#include "app/PersistenceQueue.hpp"
#include "util/Dates.hpp"
#include "util/Log.hpp"

#include <iterator>

namespace bwmon::app {

PersistenceQueue::PersistenceQueue(std::shared_ptr<storage::IStorage> storage, PersistenceOptions opts)
    : state_(std::make_shared<State>()), opts_(opts) {
  state_->storage = std::move(storage);
  state_->max_retained = opts.max_retained;
}

PersistenceQueue::~PersistenceQueue() { stop(); }

void PersistenceQueue::start() {
  if (loop_.running()) {
    util::log_warn("PersistenceQueue", "already running");
    return;
  }
  util::log_info("PersistenceQueue", "started (flush every %lldms)",
                 static_cast<long long>(opts_.flush_interval.count()));
  loop_.start([state = state_, interval = opts_.flush_interval](std::stop_token st) {
    while (sleep_for(st, interval)) {
      try {
        state->flush();
      } catch (const std::exception& e) {
        util::log_error("PersistenceQueue", "flush loop: %s", e.what());
      }
    }
  });
}

void PersistenceQueue::stop() {
  bool was_running = loop_.running();
  loop_.stop(opts_.join_timeout);
  state_->flush();
  if (size_t left = pending(); left > 0)
    util::log_error("PersistenceQueue", "%zu samples not persisted at shutdown", left);
  if (was_running) util::log_info("PersistenceQueue", "stopped");
}

void PersistenceQueue::enqueue(model::Sample s) {
  std::lock_guard<std::mutex> lk(state_->mu);
  state_->buffer.push_back(std::move(s));
}

void PersistenceQueue::enqueue_snapshot(const model::Snapshot& snap, std::optional<int64_t> timestamp) {
  int64_t ts = timestamp ? *timestamp
             : snap.timestamp != 0 ? snap.timestamp
             : util::to_epoch_secs(std::chrono::system_clock::now());
  std::vector<model::Sample> batch;
  batch.reserve(snap.processes.size());
  for (const auto& [pid, u] : snap.processes) {
    if (u.bytes_sent == 0 && u.bytes_recv == 0) continue;
    model::Sample s;
    s.timestamp = ts;
    s.pid = pid;
    s.process_name = u.process_name.empty() ? "Unknown" : u.process_name;
    if (!u.app_name.empty()) s.app_name = u.app_name;
    s.bytes_sent = u.bytes_sent;
    s.bytes_recv = u.bytes_recv;
    batch.push_back(std::move(s));
  }
  if (batch.empty()) return;
  std::lock_guard<std::mutex> lk(state_->mu);
  state_->buffer.insert(state_->buffer.end(), std::make_move_iterator(batch.begin()),
                        std::make_move_iterator(batch.end()));
}

size_t PersistenceQueue::flush() { return state_->flush(); }

size_t PersistenceQueue::State::flush() {
  std::lock_guard<std::mutex> flush_lk(flush_mu);
  std::vector<model::Sample> batch;
  {
    std::lock_guard<std::mutex> lk(mu);
    batch.swap(buffer);
  }
  if (batch.empty()) return 0;

  try {
    storage->insert_samples_batch(batch);
  } catch (const std::exception& e) {
    util::log_error("PersistenceQueue", "persisting %zu samples failed: %s", batch.size(), e.what());
    std::lock_guard<std::mutex> lk(mu);
    // The failed batch predates anything enqueued since the swap
    batch.insert(batch.end(), std::make_move_iterator(buffer.begin()), std::make_move_iterator(buffer.end()));
    buffer.swap(batch);
    if (buffer.size() > max_retained) {
      size_t excess = buffer.size() - max_retained;
      buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(excess));
      dropped += excess;
      util::log_warn("PersistenceQueue", "dropped %zu oldest samples (retaining %zu)", excess, max_retained);
    }
    return 0;
  }
  persisted += batch.size();
  util::log_debug("PersistenceQueue", "persisted %zu samples", batch.size());
  return batch.size();
}

size_t PersistenceQueue::pending() const {
  std::lock_guard<std::mutex> lk(state_->mu);
  return state_->buffer.size();
}

uint64_t PersistenceQueue::persisted() const { return state_->persisted.load(); }

uint64_t PersistenceQueue::dropped() const { return state_->dropped.load(); }

} // namespace bwmon::app
