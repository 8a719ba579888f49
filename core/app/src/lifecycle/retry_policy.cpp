#include "sigtrader/lifecycle/retry_policy.hpp"

#include <algorithm>
#include <cmath>
#include <thread>

namespace sigtrader {

RetryPolicy::RetryPolicy(RetryConfig config,
                         std::chrono::milliseconds call_timeout,
                         Sleeper sleeper)
    : config_(std::move(config)),
      call_timeout_(call_timeout),
      sleeper_(std::move(sleeper)) {
  if (!sleeper_) {
    sleeper_ = [](std::chrono::milliseconds d) { std::this_thread::sleep_for(d); };
  }
}

std::chrono::milliseconds RetryPolicy::backoffFor(int attempt) const {
  const double factor = std::pow(config_.multiplier, std::max(0, attempt - 1));
  const double ms = static_cast<double>(config_.initial_backoff.count()) * factor;
  const double capped =
      std::min(ms, static_cast<double>(config_.max_backoff.count()));
  return std::chrono::milliseconds(static_cast<long long>(capped));
}

}  // namespace sigtrader
