#include "sigtrader/concurrent/signal_lanes.hpp"

#include <algorithm>
#include <string>
#include <utility>

namespace sigtrader {

SignalLanes::SignalLanes(std::size_t lane_count) {
  const std::size_t n = std::max<std::size_t>(1, lane_count);
  lanes_.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    lanes_.push_back(
        std::make_unique<EventLoopThread>("lane-" + std::to_string(i)));
  }
}

void SignalLanes::start() {
  for (auto& lane : lanes_) {
    lane->start();
  }
}

void SignalLanes::stop() {
  for (auto& lane : lanes_) {
    lane->stop();
  }
}

void SignalLanes::submit(domain::SignalId id, Event event) {
  lanes_[laneIndexFor(id)]->push(std::move(event));
}

bool SignalLanes::waitIdle(std::chrono::milliseconds timeout) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  for (auto& lane : lanes_) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() < 0 || !lane->waitIdle(remaining)) {
      return false;
    }
  }
  return true;
}

}  // namespace sigtrader
