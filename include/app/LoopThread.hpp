#pragma once
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <stop_token>
#include <thread>

namespace bwmon::app {

// Sleep that returns early when stop is requested. Returns false if stopped.
bool sleep_for(std::stop_token st, std::chrono::steady_clock::duration d);

// Owns one periodic loop thread. The body must return soon after its
// stop_token fires; anything the body touches must be owned by the body
// itself (captured shared_ptr), since stop() detaches a thread that misses
// the join deadline.
class LoopThread {
public:
  explicit LoopThread(const char* name);
  ~LoopThread();
  LoopThread(const LoopThread&) = delete;
  LoopThread& operator=(const LoopThread&) = delete;

  // No-op if already running.
  void start(std::function<void(std::stop_token)> body);

  // Idempotent. Returns false if the thread had to be detached after timeout.
  bool stop(std::chrono::milliseconds timeout);

  [[nodiscard]] bool running() const { return thread_.joinable(); }

private:
  struct Done {
    std::mutex mu;
    std::condition_variable cv;
    bool finished{false};
  };

  const char* name_;
  std::shared_ptr<Done> done_;
  std::jthread thread_;
};

} // namespace bwmon::app
