#pragma once

#include "sigtrader/concurrent/thread_safe_queue.hpp"
#include "sigtrader/eventbus/event_bus.hpp"
#include "sigtrader/events/event.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <string>
#include <thread>

namespace sigtrader {

// -----------------------------------------------------------------------------
// EventLoopThread
// -----------------------------------------------------------------------------
//
// @brief  One worker thread draining a ThreadSafeQueue<Event> into an
//         EventBus, so every subscriber of the bus runs on that thread.
//
// @details
// Used for the ingestion loop and for each signal lane. Everything pushed
// into one loop is handled strictly in push order, one event at a time.
//
// A subscriber that throws a std::exception is logged with the loop name and
// the loop moves on to the next event.
//
// waitIdle() blocks until every event pushed so far has been fully handled;
// the engine uses it for orderly shutdown and tests use it to synchronize.
//
// Thread model: start()/stop() from the owning thread. push() from any
// thread. Subscribers run only on the loop thread.
// -----------------------------------------------------------------------------
class EventLoopThread {
 public:
  explicit EventLoopThread(std::string name = "loop");
  ~EventLoopThread();

  EventLoopThread(const EventLoopThread&) = delete;
  EventLoopThread& operator=(const EventLoopThread&) = delete;
  EventLoopThread(EventLoopThread&&) = delete;
  EventLoopThread& operator=(EventLoopThread&&) = delete;

  // Idempotent.
  void start();

  // Handles every event already queued, then joins. Idempotent.
  void stop();

  void push(Event event);

  // -------------------------------------------------------------------------
  // waitIdle(timeout)
  // -------------------------------------------------------------------------
  // @return true once no pushed event is queued or in progress; false if
  //         `timeout` elapsed first.
  // Thread-safety: Any thread except the loop thread itself.
  // -------------------------------------------------------------------------
  bool waitIdle(std::chrono::milliseconds timeout);

  bool running() const { return running_.load(); }

  const std::string& name() const { return name_; }

  EventBus& eventBus() { return bus_; }
  const EventBus& eventBus() const { return bus_; }

 private:
  void run();
  void dispatch(const Event& event);
  void markHandled();

  std::string name_;
  ThreadSafeQueue<Event> queue_;
  EventBus bus_;
  std::atomic<bool> running_{false};

  // Events pushed but not yet fully handled.
  std::mutex idle_mutex_;
  std::condition_variable idle_cv_;
  std::size_t in_flight_{0};

  std::thread thread_;
};

}  // namespace sigtrader
