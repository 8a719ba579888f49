#include "sigtrader/concurrent/event_loop_thread.hpp"

#include <exception>
#include <iostream>
#include <utility>

namespace sigtrader {

namespace {

// Upper bound on how long stop() waits for an idle worker to notice.
constexpr auto kIdleWaitTimeout = std::chrono::milliseconds(10);

}  // namespace

EventLoopThread::EventLoopThread(std::string name) : name_(std::move(name)) {}

EventLoopThread::~EventLoopThread() { stop(); }

void EventLoopThread::start() {
  if (thread_.joinable()) {
    return;
  }
  running_.store(true);
  thread_ = std::thread([this] { run(); });
}

void EventLoopThread::stop() {
  if (!thread_.joinable()) {
    return;
  }
  running_.store(false);
  thread_.join();
}

void EventLoopThread::push(Event event) {
  {
    std::lock_guard lock(idle_mutex_);
    ++in_flight_;
  }
  queue_.push(std::move(event));
}

bool EventLoopThread::waitIdle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(idle_mutex_);
  return idle_cv_.wait_for(lock, timeout, [this] { return in_flight_ == 0; });
}

void EventLoopThread::run() {
  while (running_.load()) {
    if (auto event = queue_.pop_for(kIdleWaitTimeout)) {
      dispatch(*event);
    }
  }

  // Drain what was accepted before stop(): an accepted event is never lost
  // on shutdown.
  while (auto event = queue_.try_pop()) {
    dispatch(*event);
  }
}

void EventLoopThread::dispatch(const Event& event) {
  try {
    bus_.publish(event);
  } catch (const std::exception& e) {
    std::cerr << "[EventLoop:" << name_ << "] handler error: " << e.what()
              << "\n";
  }
  markHandled();
}

void EventLoopThread::markHandled() {
  {
    std::lock_guard lock(idle_mutex_);
    --in_flight_;
  }
  idle_cv_.notify_all();
}

}  // namespace sigtrader
