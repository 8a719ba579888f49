#pragma once

#include "sigtrader/time/i_time_provider.hpp"

#include <atomic>
#include <cstdint>

namespace sigtrader {

// -----------------------------------------------------------------------------
// SimulationTimeProvider
// -----------------------------------------------------------------------------
// Manually driven clock for tests and replays. Time only changes through
// advance_time()/advance_by().
//
// Thread-safety: atomic; any thread may read or advance.
// -----------------------------------------------------------------------------
class SimulationTimeProvider final : public ITimeProvider {
 public:
  explicit SimulationTimeProvider(std::int64_t start_ms = 0)
      : current_time_ms_(start_ms) {}

  std::int64_t now_ms() const override;

  void advance_time(std::int64_t new_time_ms);
  void advance_by(std::int64_t delta_ms);

 private:
  std::atomic<std::int64_t> current_time_ms_;
};

}  // namespace sigtrader
