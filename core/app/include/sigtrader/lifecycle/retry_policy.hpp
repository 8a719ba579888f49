#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/domain/errors.hpp"

#include <chrono>
#include <functional>
#include <iostream>
#include <string>
#include <utility>

namespace sigtrader {

// -----------------------------------------------------------------------------
// RetryPolicy
// -----------------------------------------------------------------------------
//
// @brief  Runs one venue operation with a per-call timeout and bounded
//         exponential backoff.
//
// @details
// run(op, fn) calls fn(call_timeout). A VenueError of kind Timeout or
// Unavailable is retried after
//
//     initial_backoff * multiplier^(attempt - 1), capped at max_backoff
//
// until max_attempts calls have been made. Rejected / NotFound errors are
// permanent and end the loop immediately. Either way the caller receives
// VenueCallFailed(op, attempts); a timed-out call is never reported as a
// success.
//
// The sleeper is injectable so tests run the schedule without waiting.
//
// Thread-safety: const after construction; run() blocks the calling lane.
// -----------------------------------------------------------------------------
class RetryPolicy {
 public:
  using Sleeper = std::function<void(std::chrono::milliseconds)>;

  RetryPolicy(RetryConfig config, std::chrono::milliseconds call_timeout,
              Sleeper sleeper = {});

  template <typename Fn>
  auto run(const std::string& op, Fn&& fn) const
      -> decltype(fn(std::chrono::milliseconds{}));

  // Delay before attempt `attempt + 1`, for attempt >= 1.
  std::chrono::milliseconds backoffFor(int attempt) const;

  std::chrono::milliseconds callTimeout() const { return call_timeout_; }
  int maxAttempts() const { return config_.max_attempts; }

 private:
  RetryConfig config_;
  std::chrono::milliseconds call_timeout_;
  Sleeper sleeper_;
};

template <typename Fn>
auto RetryPolicy::run(const std::string& op, Fn&& fn) const
    -> decltype(fn(std::chrono::milliseconds{})) {
  for (int attempt = 1;; ++attempt) {
    try {
      return fn(call_timeout_);
    } catch (const domain::VenueError& e) {
      if (!domain::isTransient(e.kind()) || attempt >= config_.max_attempts) {
        throw domain::VenueCallFailed(op, attempt, e.kind(), e.what());
      }
      const auto delay = backoffFor(attempt);
      std::cerr << "[RetryPolicy] " << op << " attempt " << attempt << " "
                << domain::toString(e.kind()) << ": " << e.what()
                << ", retrying in " << delay.count() << "ms\n";
      sleeper_(delay);
    }
  }
}

}  // namespace sigtrader
