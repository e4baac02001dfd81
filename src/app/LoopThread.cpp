#include "app/LoopThread.hpp"
#include "util/Log.hpp"

namespace bwmon::app {

bool sleep_for(std::stop_token st, std::chrono::steady_clock::duration d) {
  if (d <= std::chrono::steady_clock::duration::zero()) return !st.stop_requested();
  std::mutex mu;
  std::condition_variable_any cv;
  std::unique_lock<std::mutex> lk(mu);
  cv.wait_for(lk, st, d, []{ return false; });
  return !st.stop_requested();
}

LoopThread::LoopThread(const char* name) : name_(name) {}

LoopThread::~LoopThread() { stop(std::chrono::milliseconds(5000)); }

void LoopThread::start(std::function<void(std::stop_token)> body) {
  if (thread_.joinable()) return;
  done_ = std::make_shared<Done>();
  thread_ = std::jthread([done = done_, body = std::move(body), name = name_](std::stop_token st) {
    try {
      body(st);
    } catch (const std::exception& e) {
      util::log_error(name, "loop terminated by exception: %s", e.what());
    }
    {
      std::lock_guard<std::mutex> lk(done->mu);
      done->finished = true;
    }
    done->cv.notify_all();
  });
}

bool LoopThread::stop(std::chrono::milliseconds timeout) {
  if (!thread_.joinable()) return true;
  thread_.request_stop();
  bool finished = false;
  {
    std::unique_lock<std::mutex> lk(done_->mu);
    finished = done_->cv.wait_for(lk, timeout, [&]{ return done_->finished; });
  }
  if (!finished) {
    util::log_warn(name_, "loop did not stop within %lldms; detaching",
                   static_cast<long long>(timeout.count()));
    thread_.detach();
    return false;
  }
  thread_.join();
  return true;
}

} // namespace bwmon::app
