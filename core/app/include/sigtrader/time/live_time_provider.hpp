#pragma once

#include "sigtrader/time/i_time_provider.hpp"

namespace sigtrader {

// Wall clock (std::chrono::system_clock).
class LiveTimeProvider final : public ITimeProvider {
 public:
  std::int64_t now_ms() const override;
};

}  // namespace sigtrader
