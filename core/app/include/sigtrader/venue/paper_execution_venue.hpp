#pragma once

#include "sigtrader/time/i_time_provider.hpp"
#include "sigtrader/venue/i_execution_venue.hpp"

#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace sigtrader {

enum class VenueOp {
  PlaceOrder,
  Modify,
  ClosePartial,
  CancelOrder,
  ListOpenTickets,
  AccountState,
  InstrumentInfo,
};

// -----------------------------------------------------------------------------
// PaperExecutionVenue
// -----------------------------------------------------------------------------
//
// @brief  Deterministic in-process venue for paper trading, replays and
//         tests.
//
// @details
// Keeps orders, positions and one account in memory. Prices only move
// through setQuote(); each quote update
//   - fills pending orders whose trigger was crossed
//     (Buy Limit: ask <= price, Buy Stop: ask >= price, mirrored for Sell),
//   - closes positions whose SL or TP was crossed, realizing profit,
//   - refreshes current_price / profit of every position.
//
// Test hooks: failNext() makes the next N calls of one operation throw a
// VenueError of the given kind; fillOrder()/closeAtVenue()/reduceAtVenue()
// simulate changes made outside the engine; callCount() counts attempts.
//
// Thread-safety: all methods are serialized on one mutex.
// -----------------------------------------------------------------------------
class PaperExecutionVenue final : public IExecutionVenue {
 public:
  PaperExecutionVenue(const ITimeProvider& clock, double balance);

  PaperExecutionVenue(const PaperExecutionVenue&) = delete;
  PaperExecutionVenue& operator=(const PaperExecutionVenue&) = delete;

  // --- IExecutionVenue -------------------------------------------------------
  domain::VenueTicket placeOrder(const domain::OrderParams& params,
                                 std::chrono::milliseconds timeout) override;
  void modify(domain::TicketId ticket, const std::optional<double>& stop_loss,
              const std::optional<double>& take_profit,
              std::chrono::milliseconds timeout) override;
  double closePartial(domain::TicketId ticket, double volume,
                      std::chrono::milliseconds timeout) override;
  void cancelOrder(domain::TicketId ticket,
                   std::chrono::milliseconds timeout) override;
  std::vector<domain::VenueTicket> listOpenTickets(
      std::chrono::milliseconds timeout) override;
  domain::AccountState accountState(std::chrono::milliseconds timeout) override;
  domain::InstrumentInfo instrumentInfo(
      const std::string& symbol, std::chrono::milliseconds timeout) override;

  // --- simulation controls ---------------------------------------------------
  void setInstrument(const domain::InstrumentInfo& info);
  void setQuote(const std::string& symbol, double bid, double ask);

  void failNext(VenueOp op, int count,
                domain::VenueErrorKind kind = domain::VenueErrorKind::Unavailable);

  void fillOrder(domain::TicketId ticket);
  void closeAtVenue(domain::TicketId ticket);
  void reduceAtVenue(domain::TicketId ticket, double new_volume);

  std::size_t callCount(VenueOp op) const;
  std::vector<domain::VenueTicket> tickets() const;
  std::size_t closedCount() const;

 private:
  struct Failure {
    int remaining{0};
    domain::VenueErrorKind kind{domain::VenueErrorKind::Unavailable};
  };

  // All private helpers expect mutex_ to be held.
  void enter(VenueOp op);
  const domain::InstrumentInfo& instrumentLocked(const std::string& symbol) const;
  domain::VenueTicket& ticketLocked(domain::TicketId id);
  void refreshLocked(domain::VenueTicket& t);
  double closeLocked(domain::TicketId id, double volume);
  void updateMarginLocked();

  const ITimeProvider& clock_;
  mutable std::mutex mutex_;
  domain::AccountState account_;
  std::map<std::string, domain::InstrumentInfo> instruments_;
  std::map<domain::TicketId, domain::VenueTicket> open_;
  std::map<domain::TicketId, domain::OrderType> pending_types_;
  std::map<VenueOp, Failure> failures_;
  std::map<VenueOp, std::size_t> calls_;
  std::size_t closed_count_{0};
  domain::TicketId next_ticket_{1000};
};

}  // namespace sigtrader
