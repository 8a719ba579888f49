#pragma once

#include "sigtrader/concurrent/event_loop_thread.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/eventbus/event_bus.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <memory>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// SignalLanes
// -----------------------------------------------------------------------------
//
// @brief  Fixed pool of EventLoopThreads; signal id S always maps to lane
//         S mod N.
//
// @details
// Every mutation of one signal (its creation, its commands, the monitor's
// actions on its tickets) is pushed through submit() with that signal's id,
// so it lands on the same lane and is applied in arrival order. A Delete
// that arrives while the lane is still placing that signal's orders simply
// waits in the lane's queue. Signals on different lanes progress in
// parallel.
//
// Thread model: start()/stop() from the owning thread; submit() from any
// thread. subscribe<T>() must be called before start().
//
// Ownership: Owns the lanes via std::unique_ptr.
// -----------------------------------------------------------------------------
class SignalLanes {
 public:
  explicit SignalLanes(std::size_t lane_count);

  SignalLanes(const SignalLanes&) = delete;
  SignalLanes& operator=(const SignalLanes&) = delete;
  SignalLanes(SignalLanes&&) = delete;
  SignalLanes& operator=(SignalLanes&&) = delete;

  void start();
  void stop();

  void submit(domain::SignalId id, Event event);

  // Subscribes `callback` on every lane's bus. Returns one handle per lane.
  template <typename EventType>
  std::vector<ScopedSubscription> subscribe(
      const std::function<void(const EventType&)>& callback);

  bool waitIdle(std::chrono::milliseconds timeout);

  std::size_t size() const { return lanes_.size(); }
  std::size_t laneIndexFor(domain::SignalId id) const {
    return static_cast<std::size_t>(id % lanes_.size());
  }

 private:
  std::vector<std::unique_ptr<EventLoopThread>> lanes_;
};

template <typename EventType>
std::vector<ScopedSubscription> SignalLanes::subscribe(
    const std::function<void(const EventType&)>& callback) {
  std::vector<ScopedSubscription> handles;
  handles.reserve(lanes_.size());
  for (auto& lane : lanes_) {
    EventBus& bus = lane->eventBus();
    handles.emplace_back(bus, bus.subscribe<EventType>(callback));
  }
  return handles;
}

}  // namespace sigtrader
