#pragma once

#include <cstdint>

namespace sigtrader {

// -----------------------------------------------------------------------------
// ITimeProvider
// -----------------------------------------------------------------------------
// Single source of "now" for the engine: history timestamps, pending-order
// expiry, the trading window and console command ids all read it, so tests
// drive time deterministically with SimulationTimeProvider.
//
// Thread-safety: Implementations must be safe to call from any thread.
// -----------------------------------------------------------------------------
class ITimeProvider {
 public:
  virtual ~ITimeProvider() = default;

  // Milliseconds since the Unix epoch.
  virtual std::int64_t now_ms() const = 0;
};

}  // namespace sigtrader
