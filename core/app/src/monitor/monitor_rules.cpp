#include "sigtrader/monitor/monitor_rules.hpp"

#include "sigtrader/time/time_utils.hpp"

namespace sigtrader {

double profitMetric(ProfitMetric metric, const domain::Ticket& ticket,
                    const domain::VenueTicket& live) {
  if (metric == ProfitMetric::FloatingProfit) {
    return live.profit;
  }
  return (live.current_price - ticket.open_price) *
         domain::directionSign(ticket.direction);
}

bool reachedTakeProfit(const domain::Signal& signal, std::size_t index,
                       double price) {
  if (index >= signal.take_profits.size() || price <= 0.0) {
    return false;
  }
  const double tp = signal.take_profits[index];
  return signal.direction == domain::Direction::Buy ? price >= tp : price <= tp;
}

std::optional<double> trailingCandidate(const TrailingConfig& config,
                                        const domain::Signal& signal,
                                        const domain::Ticket& ticket,
                                        const domain::VenueTicket& live) {
  if (!config.enabled || config.step <= 0.0 || live.current_price <= 0.0) {
    return std::nullopt;
  }

  bool triggered = false;
  if (config.metric == ProfitMetric::TakeProfitLevels) {
    triggered = reachedTakeProfit(signal, 0, live.current_price);
  } else {
    triggered = profitMetric(config.metric, ticket, live) >= config.threshold;
  }
  if (!triggered) {
    return std::nullopt;
  }

  const double candidate =
      live.current_price - domain::directionSign(ticket.direction) * config.step;
  if (candidate <= 0.0) {
    return std::nullopt;
  }
  if (ticket.stop_loss &&
      !domain::improvesStop(ticket.direction, candidate, *ticket.stop_loss)) {
    return std::nullopt;
  }
  return candidate;
}

std::vector<std::size_t> crossedProfitSteps(const ProfitSavingConfig& config,
                                            const domain::Signal& signal,
                                            const domain::Ticket& ticket,
                                            const domain::VenueTicket& live) {
  std::vector<std::size_t> crossed;
  if (!config.enabled) {
    return crossed;
  }
  for (std::size_t i = 0; i < config.steps.size(); ++i) {
    if (ticket.profitStepConsumed(i)) {
      continue;
    }
    const bool hit =
        config.metric == ProfitMetric::TakeProfitLevels
            ? reachedTakeProfit(signal, i, live.current_price)
            : profitMetric(config.metric, ticket, live) >=
                  config.steps[i].threshold;
    if (hit) {
      crossed.push_back(i);
    }
  }
  return crossed;
}

bool orderExpired(const domain::Ticket& ticket, int expiry_minutes,
                  std::int64_t now_ms) {
  if (expiry_minutes <= 0 || !ticket.isPendingOrder()) {
    return false;
  }
  return now_ms - ticket.placed_at_ms >=
         static_cast<std::int64_t>(expiry_minutes) * kMillisPerMinute;
}

}  // namespace sigtrader
