#pragma once

#include "sigtrader/config/engine_config.hpp"
#include "sigtrader/domain/signal.hpp"
#include "sigtrader/domain/ticket.hpp"
#include "sigtrader/domain/venue_types.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace sigtrader {

// Pure decision functions of the position monitor. They read one stored
// ticket next to the venue's view of it and never call anything.

// Profit of `live` under `metric`: price units in the position's favour for
// PriceDistance, the venue's floating profit otherwise.
double profitMetric(ProfitMetric metric, const domain::Ticket& ticket,
                    const domain::VenueTicket& live);

// True once `price` has reached take-profit `index` of `signal`.
bool reachedTakeProfit(const domain::Signal& signal, std::size_t index,
                       double price);

// -----------------------------------------------------------------------------
// trailingCandidate
// -----------------------------------------------------------------------------
// @return the new stop-loss, price -/+ step, when trailing is enabled, the
//         trigger is met, and the candidate strictly improves the ticket's
//         current stop. Otherwise std::nullopt.
// @details With metric TakeProfitLevels the trigger is reaching the first
//          take-profit.
// -----------------------------------------------------------------------------
std::optional<double> trailingCandidate(const TrailingConfig& config,
                                        const domain::Signal& signal,
                                        const domain::Ticket& ticket,
                                        const domain::VenueTicket& live);

// Indices of profit-saving steps crossed right now and not yet consumed on
// `ticket`, in ascending order.
std::vector<std::size_t> crossedProfitSteps(const ProfitSavingConfig& config,
                                            const domain::Signal& signal,
                                            const domain::Ticket& ticket,
                                            const domain::VenueTicket& live);

// True when a still unfilled order has been resting for at least
// `expiry_minutes`. 0 disables expiry.
bool orderExpired(const domain::Ticket& ticket, int expiry_minutes,
                  std::int64_t now_ms);

}  // namespace sigtrader
