#pragma once

#include "sigtrader/domain/errors.hpp"
#include "sigtrader/domain/venue_types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <vector>

namespace sigtrader {

// -----------------------------------------------------------------------------
// IExecutionVenue
// -----------------------------------------------------------------------------
//
// @brief  Broker / exchange boundary used by the lifecycle state machine and
//         the position monitor.
//
// @details
// Every call carries the longest time the caller is willing to wait. An
// implementation that cannot answer within `timeout` throws
// domain::VenueError(Timeout); other failures throw VenueError with the
// matching kind. Nothing else may escape.
//
// The venue state is eventually consistent with the engine: tickets can be
// filled, reduced or closed at the venue (stop-loss, take-profit, manual
// intervention) and the engine learns about it from listOpenTickets().
//
// Thread-safety: implementations must accept calls from several lanes and
// the monitor thread at once.
// -----------------------------------------------------------------------------
class IExecutionVenue {
 public:
  virtual ~IExecutionVenue() = default;

  // Places one order. Market orders come back as a Position ticket, others
  // as an Order ticket. Repeating a client_tag that is still open returns
  // the existing ticket.
  virtual domain::VenueTicket placeOrder(const domain::OrderParams& params,
                                         std::chrono::milliseconds timeout) = 0;

  // Replaces SL and/or TP; std::nullopt leaves the current value.
  virtual void modify(domain::TicketId ticket,
                      const std::optional<double>& stop_loss,
                      const std::optional<double>& take_profit,
                      std::chrono::milliseconds timeout) = 0;

  // Closes `volume` of a position; volume >= position volume closes it.
  // Returns the profit realized by the closed volume, in account currency.
  virtual double closePartial(domain::TicketId ticket, double volume,
                              std::chrono::milliseconds timeout) = 0;

  // Cancels a pending (unfilled) order.
  virtual void cancelOrder(domain::TicketId ticket,
                           std::chrono::milliseconds timeout) = 0;

  virtual std::vector<domain::VenueTicket> listOpenTickets(
      std::chrono::milliseconds timeout) = 0;

  virtual domain::AccountState accountState(
      std::chrono::milliseconds timeout) = 0;

  virtual domain::InstrumentInfo instrumentInfo(
      const std::string& symbol, std::chrono::milliseconds timeout) = 0;
};

}  // namespace sigtrader
